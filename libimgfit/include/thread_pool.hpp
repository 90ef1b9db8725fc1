/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool behind ImageOptimizer::submit().
 */

#ifndef IMGFIT_THREAD_POOL_HPP
#define IMGFIT_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace imgfit {

/**
 * @brief A fixed-size thread pool running one optimization per task.
 *
 * @details Workers are std::jthread, joined on destruction. Tasks receive
 * the worker's std::stop_token, which request_stop() sets but nothing
 * enforces; exceptions thrown by a task are stored in
 * its future, so a failed optimization surfaces to whoever awaits it.
 */
class ThreadPool {
public:
    /**
     * @brief Starts the workers.
     * @param threads Number of workers; 0 means hardware concurrency (at least 1).
     */
    explicit ThreadPool(unsigned threads = 0);

    /**
     * @brief Finishes the queued tasks, then joins the workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a callable taking a std::stop_token.
     * @return Future of the callable's result.
     * @throws std::runtime_error if the pool is stopping.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        auto future = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return future;
    }

    /**
     * @brief Blocks until every queued and running task has finished.
     */
    void wait_idle();

    /**
     * @brief Drops queued tasks and retires the workers.
     *
     * Futures of dropped tasks report std::future_errc::broken_promise.
     * Running tasks are not interrupted: they finish normally and only
     * see the request if they poll their stop_token.
     */
    void request_stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    void worker_loop(const std::stop_token& st);

    std::mutex queue_mutex_;
    std::condition_variable_any condition_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    std::size_t pending_{0};             ///< Tasks queued or running
    std::vector<std::jthread> workers_;
};

} // namespace imgfit

#endif // IMGFIT_THREAD_POOL_HPP
