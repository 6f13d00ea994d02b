/**
 * @file test_worker_pool_adapter.cpp
 * @brief Unit tests for the executor worker pools
 */

#include <gtest/gtest.h>

#include <kcenon/fetcher/adapters/worker_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::fetcher::test {

using adapters::async_worker_pool;
using adapters::worker_pool_factory;

TEST(AsyncWorkerPoolTest, ReportsConfiguredWorkers) {
    async_worker_pool pool(3);

    EXPECT_EQ(pool.worker_count(), 3u);
    EXPECT_TRUE(pool.is_running());
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(AsyncWorkerPoolTest, ZeroWorkersUsesHardwareDefault) {
    async_worker_pool pool(0);

    EXPECT_GT(pool.worker_count(), 0u);
}

TEST(AsyncWorkerPoolTest, RunsSubmittedTasks) {
    async_worker_pool pool(4);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&counter] { ++counter; }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(counter.load(), 10);
}

TEST(AsyncWorkerPoolTest, FutureCarriesTaskException) {
    async_worker_pool pool(1);

    auto future = pool.submit([] { throw std::runtime_error("task failed"); });

    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(AsyncWorkerPoolTest, PendingTasksTracksRunningWork) {
    async_worker_pool pool(1);
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto future = pool.submit([gate] { gate.wait(); });

    EXPECT_EQ(pool.pending_tasks(), 1u);
    EXPECT_NE(future.wait_for(std::chrono::milliseconds(20)), std::future_status::ready);

    release.set_value();
    future.get();
    pool.shutdown(true);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(AsyncWorkerPoolTest, ShutdownWaitsAndRejectsNewTasks) {
    async_worker_pool pool(2);
    std::atomic<bool> finished{false};

    auto first = pool.submit([&finished] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        finished = true;
    });
    pool.shutdown(true);

    EXPECT_TRUE(finished.load());
    EXPECT_FALSE(pool.is_running());

    auto rejected = pool.submit([] {});
    ASSERT_EQ(rejected.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_THROW(rejected.get(), std::runtime_error);
    first.get();
}

TEST(WorkerPoolFactoryTest, CreatesRunningPool) {
    auto pool = worker_pool_factory::create(2, "test_pool");

    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->worker_count(), 2u);

    std::atomic<bool> ran{false};
    pool->submit([&ran] { ran = true; }).get();
    EXPECT_TRUE(ran.load());

    pool->shutdown(true);
    EXPECT_FALSE(pool->is_running());
}

TEST(WorkerPoolFactoryTest, FallbackMatchesBuildConfiguration) {
    auto pool = worker_pool_factory::create(1);

    if (!worker_pool_factory::has_thread_system()) {
        EXPECT_NE(dynamic_cast<async_worker_pool*>(pool.get()), nullptr);
    }
    pool->shutdown(true);
}

}  // namespace kcenon::fetcher::test
