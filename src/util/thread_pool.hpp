#ifndef PIIGUARD_UTIL_THREAD_POOL_HPP
#define PIIGUARD_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <memory>
#include <stdexcept>
#include <algorithm>
#include <type_traits>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used for batch fan-out and HTTP connection handling.
 *
 * Usage Example:
 *  @code
 *    piiguard::util::ThreadPool pool(4);
 *    auto squares = piiguard::util::runIndexed(pool, 10, [](size_t i) { return i * i; });
 *    // squares[i] == i*i, in input order regardless of completion order
 *  @endcode
 */

namespace piiguard {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool.
 *
 * - Constructor spawns the worker threads.
 * - enqueue(...) schedules a task and returns a future for its result.
 * - Destructor drains the queue, then joins every worker.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queueMutex_);
                        condVar_.wait(lock, [this] {
                            return !taskQueue_.empty() || stop_;
                        });

                        if (stop_ && taskQueue_.empty()) {
                            return;
                        }
                        task = std::move(taskQueue_.front());
                        taskQueue_.pop();
                    }
                    task();
                }
            });
        }
    }

    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t threadCount() const { return workers_.size(); }

    /**
     * @brief Enqueue a task for asynchronous execution.
     * @return A future holding the task's result, or the exception it threw.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

private:
    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Pending tasks
    std::mutex queueMutex_;                          ///< Protects taskQueue_ and stop_
    std::condition_variable condVar_;                ///< Signals task readiness
    bool stop_;                                      ///< Set once by the destructor
};

/**
 * @brief Run fn(0) .. fn(count-1) on the pool and collect the results by index.
 *
 * Results come back in index order even when tasks finish out of order. If a task
 * throws, the exception is rethrown from here once its slot is reached; callers
 * that need per-item isolation catch inside fn.
 */
template<typename Fn>
auto runIndexed(ThreadPool &pool, size_t count, Fn fn)
    -> std::vector<typename std::invoke_result<Fn, size_t>::type>
{
    using result_type = typename std::invoke_result<Fn, size_t>::type;

    std::vector<std::future<result_type>> pending;
    pending.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        pending.push_back(pool.enqueue(fn, i));
    }

    std::vector<result_type> results;
    results.reserve(count);
    for (auto &f : pending) {
        results.push_back(f.get());
    }
    return results;
}

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_THREAD_POOL_HPP
