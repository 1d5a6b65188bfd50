#pragma once

#include "scan/Fingerprint.hpp"
#include "scan/Verdict.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sfs::scan {

// Fingerprint keyed verdict store with single-flight scanning.
//
// Entries are keyed by real path and carry the fingerprint they were
// resolved for; a lookup with a different fingerprint replaces the entry.
// At most one scan per fingerprint runs at a time, and every caller that
// arrives while it runs receives the same verdict. ScanError verdicts are
// handed to the waiters and then dropped, never stored.
class VerdictCache {
public:
    using ScanFn = std::function<Verdict(const ByteSource&)>;

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t scansStarted = 0;
        uint64_t errors = 0;
        uint64_t evictions = 0;
    };

    VerdictCache(ScanFn scan, size_t capacity);

    Verdict getOrScan(const Fingerprint& fingerprint, const ByteSource& source);

    // Drops every entry for the path and anything beneath it. A scan in
    // flight keeps its waiters but its verdict is not stored.
    void invalidate(const std::filesystem::path& path);

    // True once no scan is in flight, false if the timeout passed first.
    bool awaitIdle(std::chrono::milliseconds timeout);

    // Wakes every waiter with ScanError("abandoned") and forgets pending entries.
    void abandonWaiters();

    [[nodiscard]] std::optional<Verdict> peek(const std::filesystem::path& path) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t pending() const;
    [[nodiscard]] Stats stats() const;

private:
    struct Slot {
        std::condition_variable cv;
        bool done = false;
        std::optional<Verdict> verdict;
    };

    struct Entry {
        Fingerprint fingerprint;
        std::shared_ptr<Slot> slot;
        std::optional<std::list<std::string>::iterator> lruPos;
        bool stale = false;  // invalidated while its scan was running
    };

    void eraseLocked(std::unordered_map<std::string, Entry>::iterator it);
    void evictLocked();

    ScanFn scan_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> lru_;  // resolved keys, most recently resolved first
    size_t pending_ = 0;
    Stats stats_;
};

}
