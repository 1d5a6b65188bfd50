#include <gtest/gtest.h>
#include "scan/VerdictCache.hpp"

#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace sfs::scan;
using namespace std::chrono_literals;

namespace {

Fingerprint fp(const std::string& path, const uintmax_t size = 10, const int64_t mtime = 1000) {
    return {.path = path, .size = size, .mtimeSec = mtime, .mtimeNsec = 0};
}

// Blocks until every expected waiter has joined the in-flight scan.
void waitForHits(const VerdictCache& cache, const uint64_t hits) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (cache.stats().hits < hits && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
}

}

class VerdictCacheTest : public ::testing::Test {
protected:
    std::atomic<int> scans{0};
    Verdict next = Verdict::clean();

    VerdictCache::ScanFn counting() {
        return [this](const ByteSource&) {
            ++scans;
            return next;
        };
    }
};

TEST_F(VerdictCacheTest, SecondLookupWithSameFingerprintIsAHit) {
    VerdictCache cache(counting(), 16);

    EXPECT_TRUE(cache.getOrScan(fp("/src/a"), {}).isClean());
    EXPECT_TRUE(cache.getOrScan(fp("/src/a"), {}).isClean());

    EXPECT_EQ(scans.load(), 1);
    const auto s = cache.stats();
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(VerdictCacheTest, ChangedFingerprintForcesRescan) {
    VerdictCache cache(counting(), 16);

    cache.getOrScan(fp("/src/a", 10, 1000), {});
    next = Verdict::infected("Eicar-Test");
    const auto v = cache.getOrScan(fp("/src/a", 10, 1001), {});

    EXPECT_EQ(scans.load(), 2);
    EXPECT_TRUE(v.isInfected());
    EXPECT_EQ(v.detail(), "Eicar-Test");
    EXPECT_EQ(cache.size(), 1u);
    ASSERT_TRUE(cache.peek("/src/a").has_value());
    EXPECT_TRUE(cache.peek("/src/a")->isInfected());
}

TEST_F(VerdictCacheTest, ScanErrorsAreNotRemembered) {
    next = Verdict::error("engine busy");
    VerdictCache cache(counting(), 16);

    EXPECT_TRUE(cache.getOrScan(fp("/src/a"), {}).isError());
    EXPECT_EQ(cache.size(), 0u);

    next = Verdict::clean();
    EXPECT_TRUE(cache.getOrScan(fp("/src/a"), {}).isClean());
    EXPECT_EQ(scans.load(), 2);
    EXPECT_EQ(cache.stats().errors, 1u);
}

TEST_F(VerdictCacheTest, ThrowingScanBecomesScanError) {
    VerdictCache cache([](const ByteSource&) -> Verdict { throw std::runtime_error("boom"); }, 4);

    const auto v = cache.getOrScan(fp("/src/a"), {});
    EXPECT_TRUE(v.isError());
    EXPECT_EQ(v.detail(), "boom");
    EXPECT_EQ(cache.pending(), 0u);
}

TEST_F(VerdictCacheTest, ConcurrentCallersShareOneScan) {
    std::promise<void> release;
    auto gate = release.get_future().share();

    VerdictCache cache([&](const ByteSource&) {
        ++scans;
        gate.wait();
        return Verdict::infected("Shared.Signature");
    }, 16);

    constexpr int callers = 8;
    std::vector<std::future<Verdict>> results;
    for (int i = 0; i < callers; ++i)
        results.push_back(std::async(std::launch::async, [&] { return cache.getOrScan(fp("/src/hot"), {}); }));

    waitForHits(cache, callers - 1);
    EXPECT_EQ(cache.pending(), 1u);
    release.set_value();

    for (auto& r : results) {
        const auto v = r.get();
        EXPECT_TRUE(v.isInfected());
        EXPECT_EQ(v.detail(), "Shared.Signature");
    }
    EXPECT_EQ(scans.load(), 1);
    EXPECT_EQ(cache.stats().scansStarted, 1u);
}

TEST_F(VerdictCacheTest, CapacityEvictsOldestResolvedEntry) {
    VerdictCache cache(counting(), 2);

    cache.getOrScan(fp("/src/a"), {});
    cache.getOrScan(fp("/src/b"), {});
    cache.getOrScan(fp("/src/c"), {});

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.stats().evictions, 1u);
    EXPECT_FALSE(cache.peek("/src/a").has_value());
    EXPECT_TRUE(cache.peek("/src/c").has_value());

    cache.getOrScan(fp("/src/a"), {});
    EXPECT_EQ(scans.load(), 4);
}

TEST_F(VerdictCacheTest, InvalidateDropsPathAndDescendantsOnly) {
    VerdictCache cache(counting(), 16);

    cache.getOrScan(fp("/src/dir/a"), {});
    cache.getOrScan(fp("/src/dir/sub/b"), {});
    cache.getOrScan(fp("/src/dirx"), {});
    cache.getOrScan(fp("/src/dir"), {});

    cache.invalidate("/src/dir");

    EXPECT_FALSE(cache.peek("/src/dir").has_value());
    EXPECT_FALSE(cache.peek("/src/dir/a").has_value());
    EXPECT_FALSE(cache.peek("/src/dir/sub/b").has_value());
    EXPECT_TRUE(cache.peek("/src/dirx").has_value());
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(VerdictCacheTest, InvalidateDuringScanKeepsResultOutOfCache) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    VerdictCache cache([&](const ByteSource&) {
        gate.wait();
        return Verdict::clean();
    }, 16);

    auto inFlight = std::async(std::launch::async, [&] { return cache.getOrScan(fp("/src/a"), {}); });
    while (cache.pending() == 0) std::this_thread::sleep_for(1ms);

    cache.invalidate("/src/a");
    release.set_value();

    EXPECT_TRUE(inFlight.get().isClean());
    EXPECT_FALSE(cache.peek("/src/a").has_value());
}

TEST_F(VerdictCacheTest, AbandonWakesWaitersWithError) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    VerdictCache cache([&](const ByteSource&) {
        gate.wait();
        return Verdict::clean();
    }, 16);

    auto owner = std::async(std::launch::async, [&] { return cache.getOrScan(fp("/src/a"), {}); });
    while (cache.pending() == 0) std::this_thread::sleep_for(1ms);
    auto waiter = std::async(std::launch::async, [&] { return cache.getOrScan(fp("/src/a"), {}); });
    waitForHits(cache, 1);

    EXPECT_FALSE(cache.awaitIdle(20ms));
    cache.abandonWaiters();

    const auto abandoned = waiter.get();
    EXPECT_TRUE(abandoned.isError());
    EXPECT_EQ(abandoned.detail(), "abandoned");

    release.set_value();
    owner.get();
    EXPECT_TRUE(cache.awaitIdle(1s));
    EXPECT_FALSE(cache.peek("/src/a").has_value());
}

TEST_F(VerdictCacheTest, InvalidatedScanStillServesItsFingerprintOnce) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    VerdictCache cache([&](const ByteSource&) {
        ++scans;
        gate.wait();
        return Verdict::clean();
    }, 16);

    auto first = std::async(std::launch::async, [&] { return cache.getOrScan(fp("/src/a"), {}); });
    while (cache.pending() == 0) std::this_thread::sleep_for(1ms);

    cache.invalidate("/src/a");
    auto second = std::async(std::launch::async, [&] { return cache.getOrScan(fp("/src/a"), {}); });
    waitForHits(cache, 1);

    EXPECT_EQ(cache.pending(), 1u);
    release.set_value();

    EXPECT_TRUE(first.get().isClean());
    EXPECT_TRUE(second.get().isClean());
    EXPECT_EQ(scans.load(), 1);
    EXPECT_FALSE(cache.peek("/src/a").has_value());
    EXPECT_EQ(cache.size(), 0u);
}
