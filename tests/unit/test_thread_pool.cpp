/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace kubesim;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

// ─── run_bounded ───

TEST(ThreadPoolTest, RunBoundedReturnsValue) {
    ThreadPool pool(2);
    auto result = pool.run_bounded([] { return 7; }, Duration{1000});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
}

TEST(ThreadPoolTest, RunBoundedTimesOut) {
    ThreadPool pool(2);
    auto start = std::chrono::steady_clock::now();
    auto result = pool.run_bounded([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return 1;
    }, Duration{20});
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.has_value());
    EXPECT_LT(waited, std::chrono::milliseconds(250));
}

TEST(ThreadPoolTest, PoolStaysUsableAfterTimeout) {
    ThreadPool pool(2);
    auto slow = pool.run_bounded([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return 0;
    }, Duration{5});
    EXPECT_FALSE(slow.has_value());

    auto fast = pool.run_bounded([] { return 2; }, Duration{1000});
    ASSERT_TRUE(fast.has_value());
    EXPECT_EQ(*fast, 2);
}

TEST(ThreadPoolTest, OverrunningCallsAreCounted) {
    ThreadPool pool(2);
    auto slow = pool.run_bounded([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        return 0;
    }, Duration{5});
    EXPECT_FALSE(slow.has_value());
    EXPECT_EQ(pool.overrunning_count(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(pool.overrunning_count(), 0u);
}

TEST(ThreadPoolTest, RunBoundedPropagatesException) {
    ThreadPool pool(1);
    EXPECT_THROW(pool.run_bounded([]() -> int { throw std::runtime_error("boom"); },
                                  Duration{1000}),
                 std::runtime_error);
    EXPECT_EQ(pool.overrunning_count(), 0u);
}

TEST(ThreadPoolTest, DestructionDropsQueuedWork) {
    std::future<int> never_started;
    {
        ThreadPool pool(1);
        pool.submit([] { std::this_thread::sleep_for(std::chrono::milliseconds(50)); });
        never_started = pool.submit([] { return 1; });
    }
    // Either it ran before shutdown or its promise was broken; it never hangs.
    EXPECT_EQ(never_started.wait_for(std::chrono::seconds(0)), std::future_status::ready);
}
