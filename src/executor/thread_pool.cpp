/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace kubesim {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();

    // Join before the queue goes away. A runtime call that is still hung
    // delays shutdown until it returns.
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }

    // Tasks never started: their futures report broken_promise.
    std::lock_guard lock(queue_mutex_);
    std::queue<std::function<void()>> dropped;
    dropped.swap(task_queue_);
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            if (!queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); })) {
                return;
            }
            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task();
        --active_tasks_;
    }
}

void ThreadPool::finish_bounded(BoundedCall& call) noexcept {
    std::lock_guard lock(call.mutex);
    call.finished = true;
    if (call.abandoned) --overrunning_;
}

bool ThreadPool::abandon_bounded(BoundedCall& call) noexcept {
    std::lock_guard lock(call.mutex);
    if (call.finished) return false;
    call.abandoned = true;
    ++overrunning_;
    return true;
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace kubesim
