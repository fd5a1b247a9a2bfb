/// @file thread_pool_test.cpp
/// @brief Tests for IPI-Shield thread pool

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

#include "common/thread_pool.h"

namespace ipishield {
namespace {

TEST(ThreadPoolTest, BasicExecution) {
    ThreadPool pool(2);

    auto future = pool.Submit([]() { return 42; });
    ASSERT_TRUE(future.ok());

    EXPECT_EQ(future->get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        auto submitted = pool.Submit([i]() { return i * 2; });
        ASSERT_TRUE(submitted.ok());
        futures.push_back(std::move(submitted).value());
    }

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * 2);
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i) {
        auto submitted = pool.Submit([&counter]() {
            counter.fetch_add(1, std::memory_order_relaxed);
        });
        ASSERT_TRUE(submitted.ok());
    }

    pool.Wait();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, PendingTasks) {
    ThreadPool pool(1);

    // Submit tasks that take some time
    for (int i = 0; i < 5; ++i) {
        auto submitted = pool.Submit([]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
        });
        ASSERT_TRUE(submitted.ok());
    }

    EXPECT_GT(pool.PendingTasks(), 0u);

    pool.Wait();

    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(2);

    auto future = pool.Submit([]() -> int {
        throw std::runtime_error("Test exception");
    });
    ASSERT_TRUE(future.ok());

    EXPECT_THROW(future->get(), std::runtime_error);

    // The worker survives the exception
    auto next = pool.Submit([]() { return 7; });
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next->get(), 7);
}

TEST(ThreadPoolTest, AbandonedFutureStillRuns) {
    std::atomic<bool> ran{false};
    {
        ThreadPool pool(1);
        auto submitted = pool.Submit([&ran]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            ran = true;
        });
        ASSERT_TRUE(submitted.ok());
        // Future dropped here; the destructor drains the queue
    }
    EXPECT_TRUE(ran.load());
}

TEST(ThreadPoolTest, SizeAndName) {
    ThreadPool pool(8, "signals");
    EXPECT_EQ(pool.Size(), 8u);
    EXPECT_EQ(pool.Name(), "signals");
    EXPECT_FALSE(pool.IsStopped());
}

TEST(ThreadPoolTest, DefaultSize) {
    ThreadPool pool;
    EXPECT_GT(pool.Size(), 0u);
}

}  // namespace
}  // namespace ipishield
