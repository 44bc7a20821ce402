#include "../../src/utils/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

namespace {
    TEST(ThreadPoolTest, WaitAllRunsEveryTask) {
        concurrency::ThreadPool pool(3);
        std::atomic<int> counter = 0;

        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&counter]() { ++counter; });
        }
        pool.wait_all();

        EXPECT_EQ(counter.load(), 50);
        EXPECT_EQ(pool.size(), 3U);
    }

    TEST(ThreadPoolTest, SubmitReturnsTheResult) {
        concurrency::ThreadPool pool(2);

        auto result = pool.submit([]() { return 6 * 7; });

        EXPECT_EQ(result.get(), 42);
    }

    TEST(ThreadPoolTest, SubmitDeliversExceptionsThroughTheFuture) {
        concurrency::ThreadPool pool(1);

        auto result = pool.submit([]() -> int { throw std::runtime_error("boom"); });

        EXPECT_THROW(result.get(), std::runtime_error);
    }

    TEST(ThreadPoolTest, ThrowingTaskDoesNotStopTheWorker) {
        concurrency::ThreadPool pool(1);
        std::atomic<bool> ran = false;

        pool.enqueue([]() { throw std::runtime_error("boom"); });
        pool.enqueue([&ran]() { ran = true; });
        pool.wait_all();

        EXPECT_TRUE(ran.load());
    }

    TEST(ThreadPoolTest, DestructorDrainsQueuedTasks) {
        std::atomic<int> counter = 0;
        {
            concurrency::ThreadPool pool(1);
            for (int i = 0; i < 10; ++i) {
                pool.enqueue([&counter]() { ++counter; });
            }
        }
        EXPECT_EQ(counter.load(), 10);
    }
}  // namespace
