// Section 1: Main Header
#include "scheduler.h"

// Section 2: Includes
#include <utility>

// Section 3: Constructors and Destructors
ThreadScheduler::ThreadScheduler() : mThread(&ThreadScheduler::run, this) {}

ThreadScheduler::~ThreadScheduler()
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mQuit = true;
        mEntries.clear();
    }
    mCondition.notify_all();
    mThread.join();
}

// Section 4: Public Methods
Scheduler::TaskId ThreadScheduler::scheduleOnce(std::chrono::milliseconds delay, Task task)
{
    return add(delay, std::chrono::milliseconds(0), std::move(task));
}

Scheduler::TaskId ThreadScheduler::scheduleAtFixedRate(std::chrono::milliseconds interval, Task task)
{
    if (interval.count() <= 0)
        return INVALID_TASK;
    return add(interval, interval, std::move(task));
}

bool ThreadScheduler::cancel(TaskId id)
{
    std::lock_guard<std::mutex> lock(mMutex);
    const bool erased = mEntries.erase(id) > 0;
    mCondition.notify_all();
    return erased;
}

// Section 5: Private Methods
Scheduler::TaskId ThreadScheduler::add(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task)
{
    std::lock_guard<std::mutex> lock(mMutex);
    if (mQuit)
        return INVALID_TASK;

    const TaskId id = mNextId++;
    mEntries.emplace(id, Entry{std::chrono::steady_clock::now() + delay, interval, std::move(task)});
    mCondition.notify_all();
    return id;
}

void ThreadScheduler::run()
{
    std::unique_lock<std::mutex> lock(mMutex);
    while (!mQuit)
    {
        if (mEntries.empty()) {
            mCondition.wait(lock);
            continue;
        }

        auto next = mEntries.begin();
        for (auto it = mEntries.begin(); it != mEntries.end(); ++it)
            if (it->second.deadline < next->second.deadline)
                next = it;

        const auto now = std::chrono::steady_clock::now();
        if (next->second.deadline > now) {
            mCondition.wait_until(lock, next->second.deadline);
            continue;
        }

        Task task = next->second.task;
        if (next->second.interval.count() > 0) {
            auto &entry = next->second;
            entry.deadline += entry.interval;
            // ticks missed while the callback or the host was stalled are dropped
            while (entry.deadline <= now)
                entry.deadline += entry.interval;
        } else {
            mEntries.erase(next);
        }

        lock.unlock();
        task();
        lock.lock();
    }
}

// Section 6: TaskGuard
TaskGuard::TaskGuard() : mState(std::make_shared<State>()) {}

Scheduler::Task TaskGuard::wrap(std::function<void()> fn) const
{
    std::weak_ptr<State> weak = mState;
    return [weak, fn = std::move(fn)]() {
        const auto state = weak.lock();
        if (!state)
            return;
        std::lock_guard<std::recursive_mutex> lock(state->mutex);
        if (state->alive)
            fn();
    };
}

void TaskGuard::revoke()
{
    std::lock_guard<std::recursive_mutex> lock(mState->mutex);
    mState->alive = false;
}
