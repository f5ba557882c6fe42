#ifndef CHUNKWORKER_UTIL_THREAD_POOL_HPP
#define CHUNKWORKER_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <vector>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <stdexcept>
#include "util/logger.hpp"

/**
 * @file thread_pool.hpp
 * @brief Fixed-size pool that runs chunk transfers off the caller's thread.
 *
 * Usage Example:
 *  @code
 *    chunkworker::util::ThreadPool pool(4);
 *    pool.submit([] { fetchSomething(); });
 *    pool.waitIdle();
 *    pool.shutdown();
 *  @endcode
 *
 * Tasks are fire-and-forget: results travel through the task's own
 * completion signal, not through the pool.
 */

namespace chunkworker {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool.
 *
 * - Constructor spawns the worker threads.
 * - submit(...) schedules a task.
 * - shutdown() (also run by the destructor) stops accepting work, finishes the
 *   queued tasks and joins the workers.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false), active_(0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool()
    {
        shutdown();
    }

    /**
     * @brief Queue a task.
     * @throw std::runtime_error if the pool has been shut down.
     */
    void submit(std::function<void()> task)
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("submit on stopped ThreadPool");
            }
            taskQueue_.push(std::move(task));
        }
        condVar_.notify_one();
    }

    /**
     * @brief Block until the queue is empty and no task is running.
     */
    void waitIdle()
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        idleVar_.wait(lock, [this] { return taskQueue_.empty() && active_ == 0; });
    }

    /**
     * @brief Number of tasks queued or running.
     */
    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return taskQueue_.size() + active_;
    }

    /**
     * @brief Stop accepting work, drain the queue and join all workers. Idempotent.
     */
    void shutdown()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_ && workers_.empty()) {
                return;
            }
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        std::lock_guard<std::mutex> lock(queueMutex_);
        workers_.clear();
    }

private:
    void workerLoop()
    {
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
                ++active_;
            }

            try {
                task();
            } catch (const std::exception &ex) {
                // Tasks report their own failures; this only keeps the worker alive
                logger::error(std::string("[ThreadPool] task threw: ") + ex.what());
            } catch (...) {
                logger::error("[ThreadPool] task threw a non-standard exception");
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                --active_;
            }
            idleVar_.notify_all();
        }
    }

    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Task queue
    mutable std::mutex queueMutex_;                  ///< Protects queue, counters, stop flag
    std::condition_variable condVar_;                ///< Signals task readiness
    std::condition_variable idleVar_;                ///< Signals a task finished
    bool stop_;                                      ///< No new tasks accepted
    size_t active_;                                  ///< Tasks currently executing
};

} // namespace util
} // namespace chunkworker

#endif // CHUNKWORKER_UTIL_THREAD_POOL_HPP
