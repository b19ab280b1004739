/**
 * @file thread_pool.hpp
 * @brief Defines a fixed-size, thread-safe thread pool with a bounded queue.
 *
 * This file contains the ThreadPool class used by PhotoPipeline to decode
 * and compress photos concurrently while keeping peak memory bounded.
 */

#ifndef QREPORT_THREAD_POOL_HPP
#define QREPORT_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

/**
 * @brief A fixed-size thread pool for executing tasks concurrently.
 *
 * @details This pool uses std::jthread internally, which automatically
 * handles joining on destruction and supports cooperative cancellation
 * via std::stop_token. Tasks enqueued should accept a
 * `std::stop_token` as their argument.
 *
 * When constructed with a non-zero @p max_queued, enqueue() blocks the
 * producer while the queue is full (backpressure).
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads The number of worker threads to create (at least 1).
     * @param max_queued Maximum number of tasks waiting in the queue;
     * 0 means unbounded.
     */
    explicit ThreadPool(unsigned threads = 2, size_t max_queued = 0);

    /**
     * @brief Destructor.
     * Automatically requests stop and joins all worker threads.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * The task must be a callable that accepts a `std::stop_token`.
     * Blocks while the queue is full.
     *
     * @tparam F The type of the callable task.
     * @param f The task to execute.
     * @return A std::future representing the eventual result of the task.
     * @throws std::runtime_error if enqueue is called on a stopped pool.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            space_cv_.wait(lock, [this] {
                return stop_ || max_queued_ == 0 || tasks_.size() < max_queued_;
            });
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Blocks the calling thread until all pending tasks are complete.
     */
    void wait_idle();

    /**
     * @brief Requests all worker threads to stop and clears the task queue.
     *
     * Pending tasks that have not started are discarded; their futures
     * report std::future_errc::broken_promise.
     * Tasks currently running are notified via their stop_token.
     */
    void request_stop();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::condition_variable idle_cv_;       ///< Notifies wait_idle() when pending_ is zero
    std::condition_variable space_cv_;      ///< Notifies enqueue() when a queue slot frees up
    std::queue<std::function<void(std::stop_token)>> tasks_; ///< The queue of tasks
    size_t max_queued_{0};                  ///< Queue bound, 0 when unbounded
    bool stop_{false};                      ///< Flag to signal workers to stop
    size_t pending_{0};                     ///< Number of tasks enqueued or running
    std::vector<std::jthread> workers_;     ///< The worker threads
};

#endif // QREPORT_THREAD_POOL_HPP
