#include <gtest/gtest.h>
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace sfs::concurrency;
using namespace std::chrono_literals;

namespace {

struct CountingTask final : PromisedTask<int> {
    std::atomic<int>& counter;
    explicit CountingTask(std::atomic<int>& c) : counter(c) {}
    void operator()() override { promise.set_value(++counter); }
};

struct ThrowingTask final : Task {
    void operator()() override { throw std::runtime_error("task failure"); }
};

}

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    ThreadPool pool("test", 3);
    EXPECT_EQ(pool.workerCount(), 3u);

    std::atomic<int> counter{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        auto t = std::make_shared<CountingTask>(counter);
        futures.push_back(t->getFuture());
        pool.submit(t);
    }
    for (auto& f : futures) EXPECT_EQ(f.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(counter.load(), 20);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    ThreadPool pool("test", 1);
    pool.submit(std::make_shared<ThrowingTask>());

    std::atomic<int> counter{0};
    auto t = std::make_shared<CountingTask>(counter);
    auto f = t->getFuture();
    pool.submit(t);
    ASSERT_EQ(f.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(f.get(), 1);
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    ThreadPool pool("test", 2);
    pool.stop();
    EXPECT_TRUE(pool.isStopped());
    EXPECT_EQ(pool.workerCount(), 0u);

    std::atomic<int> counter{0};
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(counter)), std::runtime_error);
}

TEST(ThreadPoolTest, WorkerCountIsSafeWhileStopping) {
    ThreadPool pool("test", 4);

    std::atomic<bool> done{false};
    std::atomic<unsigned int> observed{4};
    std::thread reader([&] {
        while (!done.load()) {
            const auto n = pool.workerCount();
            observed.store(n);
            if (n != 0 && n != 4) break;
        }
    });

    std::this_thread::sleep_for(5ms);
    pool.stop();
    std::this_thread::sleep_for(5ms);
    done.store(true);
    reader.join();

    EXPECT_EQ(observed.load(), 0u);
    EXPECT_EQ(pool.workerCount(), 0u);
}

TEST(ThreadPoolTest, ZeroWorkersIsRejected) {
    EXPECT_THROW(ThreadPool("test", 0), std::invalid_argument);
}
