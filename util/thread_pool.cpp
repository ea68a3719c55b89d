// Section 1: Main Header
#include "thread_pool.h"

// Section 2: Includes
// (none)

// Section 3: Constructors and Destructors
ThreadPool::ThreadPool(size_t threads)
{
    if (threads == 0)
        threads = 1;

    for (size_t i = 0; i < threads; ++i) {
        mWorkers.emplace_back([this]() {
            for (;;) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mQueueMutex);
                    mCondition.wait(lock, [this]() { return mStop || !mTasks.empty(); });

                    if (mStop && mTasks.empty())
                        return;

                    task = std::move(mTasks.front());
                    mTasks.pop();
                }
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::unique_lock<std::mutex> lock(mQueueMutex);
        mStop = true;
    }
    mCondition.notify_all();
    for (std::thread &worker : mWorkers)
        worker.join();
}
