#include <gtest/gtest.h>
#include "thread_pool.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

TEST(ThreadPoolTest, ReturnsTaskResults) {
    ThreadPool pool(2);
    auto a = pool.enqueue([](int x) { return x * 2; }, 21);
    auto b = pool.enqueue([] { return std::string("done"); });
    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.enqueue([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, WaitIdleWaitsForQueuedWork) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++done;
        });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 10);
    EXPECT_EQ(pool.pending(), 0u);
    EXPECT_EQ(pool.active(), 0u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto f = pool.enqueue([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_EQ(pool.enqueue([] { return 1; }).get(), 1);
}
