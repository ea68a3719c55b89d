// *****************************************************************************
// Scheduler
// *****************************************************************************

#ifndef _SCHEDULER_H_
#define _SCHEDULER_H_

// Section 1: Includes
// C++ Standard Library
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

// Section 2: Class Definitions
/**
 * Cancellable one-shot and fixed-rate timers. Callbacks must be short, they
 * run on the scheduler's own thread.
 */
class Scheduler
{
public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;

    static constexpr TaskId INVALID_TASK = 0;

    virtual ~Scheduler() = default;

    virtual TaskId scheduleOnce(std::chrono::milliseconds delay, Task task) = 0;

    /**
     * Runs task every interval. Deadlines are anchored on the first one, a late
     * tick does not push the following ones back.
     */
    virtual TaskId scheduleAtFixedRate(std::chrono::milliseconds interval, Task task) = 0;

    /**
     * @return true if the task was still pending
     */
    virtual bool cancel(TaskId id) = 0;
};

/**
 * Scheduler backed by one timer thread and steady_clock
 */
class ThreadScheduler : public Scheduler
{
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler &) = delete;
    ThreadScheduler &operator=(const ThreadScheduler &) = delete;

    TaskId scheduleOnce(std::chrono::milliseconds delay, Task task) override;
    TaskId scheduleAtFixedRate(std::chrono::milliseconds interval, Task task) override;
    bool cancel(TaskId id) override;

private:
    struct Entry {
        std::chrono::steady_clock::time_point deadline;
        std::chrono::milliseconds interval{0};  ///< zero for one-shot
        Task task;
    };

    TaskId add(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task);
    void run();

    std::mutex mMutex;
    std::condition_variable mCondition;
    std::map<TaskId, Entry> mEntries;
    TaskId mNextId = 1;
    bool mQuit = false;
    std::thread mThread;
};

/**
 * Wraps callbacks handed to a Scheduler so they stop running once their owner
 * revokes them. revoke() waits for a callback that is already running.
 */
class TaskGuard
{
public:
    TaskGuard();

    [[nodiscard]] Scheduler::Task wrap(std::function<void()> fn) const;
    void revoke();

private:
    struct State {
        std::recursive_mutex mutex;
        bool alive = true;
    };

    std::shared_ptr<State> mState;
};

#endif // _SCHEDULER_H_
