/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool for slow runtime calls.
 * @author Dimitris Kafetzis
 *
 * The node lifecycle manager pushes every container-runtime call through
 * this pool and waits on the returned future with a deadline, so a hung
 * runtime never blocks the caller longer than the configured timeout.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace kubesim {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /**
     * @brief Run `func` on the pool and wait at most `timeout` for it.
     *
     * Returns std::nullopt on timeout. The call keeps running in the
     * background and counts as overrunning until it returns; its result is
     * discarded, so `func` must own (not borrow) everything it touches.
     */
    template <std::invocable F>
        requires (!std::is_void_v<std::invoke_result_t<F>>)
    std::optional<std::invoke_result_t<F>> run_bounded(F&& func, Duration timeout);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

    /// Bounded calls that missed their deadline and have not returned yet.
    [[nodiscard]] size_t overrunning_count() const noexcept { return overrunning_.load(); }

private:
    /// Handshake between a bounded call and the caller waiting on it.
    struct BoundedCall {
        std::mutex mutex;
        bool finished{false};
        bool abandoned{false};
    };

    void worker_loop(std::stop_token stop);
    void finish_bounded(BoundedCall& call) noexcept;
    [[nodiscard]] bool abandon_bounded(BoundedCall& call) noexcept;

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> overrunning_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable F>
    requires (!std::is_void_v<std::invoke_result_t<F>>)
std::optional<std::invoke_result_t<F>> ThreadPool::run_bounded(F&& func, Duration timeout) {
    auto call = std::make_shared<BoundedCall>();

    auto future = submit([this, call, f = std::forward<F>(func)]() mutable {
        struct Finish {
            ThreadPool* pool;
            BoundedCall* call;
            ~Finish() { pool->finish_bounded(*call); }
        } finish{this, call.get()};
        return f();
    });

    // A call that finishes right at the deadline is still taken.
    if (future.wait_for(timeout) != std::future_status::ready && abandon_bounded(*call)) {
        return std::nullopt;
    }
    return future.get();
}

}  // namespace kubesim
