#include "scan/VerdictCache.hpp"
#include "log/Registry.hpp"

using namespace sfs::scan;
using namespace sfs::log;

namespace {

bool isWithin(const std::string& key, const std::string& prefix) {
    if (key == prefix) return true;
    if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) return false;
    return prefix.back() == '/' || key[prefix.size()] == '/';
}

}

VerdictCache::VerdictCache(ScanFn scan, const size_t capacity)
    : scan_(std::move(scan)), capacity_(capacity) {}

Verdict VerdictCache::getOrScan(const Fingerprint& fingerprint, const ByteSource& source) {
    const auto key = fingerprint.path.string();

    std::unique_lock lock(mutex_);

    if (const auto it = entries_.find(key); it != entries_.end()) {
        if (it->second.fingerprint == fingerprint) {
            ++stats_.hits;
            const auto slot = it->second.slot;
            slot->cv.wait(lock, [&] { return slot->done; });
            return *slot->verdict;
        }

        Registry::scan()->debug("[VerdictCache] Fingerprint changed for {}, rescanning", key);
        eraseLocked(it);
    }

    ++stats_.misses;
    ++stats_.scansStarted;
    ++pending_;

    const auto slot = std::make_shared<Slot>();
    entries_.emplace(key, Entry{fingerprint, slot, std::nullopt});

    lock.unlock();

    auto verdict = Verdict::error("scan did not run");
    try {
        verdict = scan_(source);
    } catch (const std::exception& e) {
        verdict = Verdict::error(e.what());
    }

    lock.lock();
    --pending_;

    if (verdict.isError()) {
        ++stats_.errors;
        Registry::scan()->warn("[VerdictCache] Scan of {} failed: {}", fingerprint.toString(), verdict.detail());
    }

    // The entry may have been invalidated, replaced or abandoned meanwhile;
    // only the entry this call installed is resolved in place.
    const auto it = entries_.find(key);
    if (it != entries_.end() && it->second.slot == slot) {
        if (verdict.isError() || it->second.stale) {
            entries_.erase(it);
        } else {
            lru_.push_front(key);
            it->second.lruPos = lru_.begin();
            evictLocked();
        }
    }

    if (!slot->done) {
        slot->done = true;
        slot->verdict = verdict;
    }
    slot->cv.notify_all();
    idleCv_.notify_all();

    return verdict;
}

void VerdictCache::invalidate(const std::filesystem::path& path) {
    const auto prefix = path.string();
    if (prefix.empty()) return;

    std::scoped_lock lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isWithin(it->first, prefix)) {
            // Erasing a running entry would let a second scan of the same
            // fingerprint start beside it.
            if (!it->second.slot->done) {
                it->second.stale = true;
                ++it;
                continue;
            }
            const auto next = std::next(it);
            eraseLocked(it);
            it = next;
        } else {
            ++it;
        }
    }
}

bool VerdictCache::awaitIdle(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

void VerdictCache::abandonWaiters() {
    std::scoped_lock lock(mutex_);
    size_t abandoned = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& slot = it->second.slot;
        if (slot->done) {
            ++it;
            continue;
        }

        slot->done = true;
        slot->verdict = Verdict::error("abandoned");
        slot->cv.notify_all();
        ++abandoned;

        const auto next = std::next(it);
        eraseLocked(it);
        it = next;
    }

    if (abandoned) Registry::scan()->warn("[VerdictCache] Abandoned {} pending scans", abandoned);
}

std::optional<Verdict> VerdictCache::peek(const std::filesystem::path& path) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(path.string());
    if (it == entries_.end() || !it->second.slot->done) return std::nullopt;
    return it->second.slot->verdict;
}

size_t VerdictCache::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

size_t VerdictCache::pending() const {
    std::scoped_lock lock(mutex_);
    return pending_;
}

VerdictCache::Stats VerdictCache::stats() const {
    std::scoped_lock lock(mutex_);
    return stats_;
}

void VerdictCache::eraseLocked(const std::unordered_map<std::string, Entry>::iterator it) {
    if (it->second.lruPos) lru_.erase(*it->second.lruPos);
    entries_.erase(it);
}

void VerdictCache::evictLocked() {
    while (lru_.size() > capacity_) {
        const auto& victim = lru_.back();
        Registry::scan()->debug("[VerdictCache] Evicting {}", victim);
        entries_.erase(victim);
        lru_.pop_back();
        ++stats_.evictions;
    }
}
