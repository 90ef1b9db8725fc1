#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <string>

namespace imgfit {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
    Logger::log(LogLevel::Debug, "Thread pool started with " + std::to_string(threads) + " workers",
                "thread_pool");
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
            if (st.stop_requested() || (stop_ && tasks_.empty())) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores the task's exceptions in its future
        task(st);

        std::lock_guard lock(queue_mutex_);
        if (pending_ > 0) --pending_;
        idle_cv_.notify_all();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
        pending_ -= std::min(pending_, tasks_.size());
        std::queue<std::function<void(std::stop_token)>>().swap(tasks_);
    }
    idle_cv_.notify_all();
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    // jthread destructors request stop and join; drain first so queued futures complete
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

} // namespace imgfit
