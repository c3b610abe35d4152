#include <gtest/gtest.h>

#include "common/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace {

TEST(ThreadPoolTest, SingleWorkerRunsInSubmissionOrder) {
    ThreadPool pool(1);
    std::vector<int> order;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&order, i] { order.push_back(i); }));
    }
    for (auto& f : futures) f.get();
    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(order[i], i);
}

TEST(ThreadPoolTest, BusyNeverExceedsSize) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.size(), 3u);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 12; ++i) {
        pool.submit([&] {
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        });
    }
    pool.wait_idle();
    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(pool.busy(), 0u);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, ExceptionSurfacesThroughFuture) {
    ThreadPool pool(2);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    auto g = pool.submit([] { return 42; });
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_EQ(g.get(), 42);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

} // namespace
