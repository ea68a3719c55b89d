// *****************************************************************************
// Thread Pool
// *****************************************************************************

#ifndef _THREAD_POOL_H_
#define _THREAD_POOL_H_

// Section 1: Includes
// C++ Standard Library
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

// Section 2: Class Definition
/**
 * Fixed set of workers draining a FIFO of tasks. Used by the indexer to hash
 * files in parallel.
 */
class ThreadPool
{
public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /**
     * Queues a callable
     * @return future for the callable's result, or an invalid future if the pool is stopping
     */
    template <class F>
    auto submit(F &&func) -> std::future<std::invoke_result_t<F>>;

    [[nodiscard]] size_t size() const { return mWorkers.size(); }

private:
    std::vector<std::thread> mWorkers;
    std::queue<std::function<void()>> mTasks;
    std::mutex mQueueMutex;
    std::condition_variable mCondition;
    bool mStop = false;
};

template <class F>
auto ThreadPool::submit(F &&func) -> std::future<std::invoke_result_t<F>>
{
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(func));
    std::future<return_type> result = task->get_future();
    {
        std::unique_lock<std::mutex> lock(mQueueMutex);
        if (mStop)
            return {};
        mTasks.emplace([task]() { (*task)(); });
    }
    mCondition.notify_one();
    return result;
}

#endif // _THREAD_POOL_H_
