#pragma once

#include "scan/Scanner.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sfs::config { struct ScanningConfig; }
namespace sfs::concurrency { class ThreadPool; }

namespace sfs::scan {

struct EngineOptions {
    std::chrono::milliseconds acquireTimeout{10000};
    std::chrono::milliseconds scanTimeout{30000};
    uintmax_t maxScanSize = 0;  // 0 disables the limit
};

// Fixed pool of scanner handles. Every native call runs on the scan pool
// while holding a leased handle, and the caller waits no longer than
// scanTimeout for it.
class Engine {
public:
    class Lease {
    public:
        Lease(Engine* owner, std::unique_ptr<Scanner> scanner) : owner_(owner), scanner_(std::move(scanner)) {}
        ~Lease();

        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&& other) noexcept;

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Scanner& scanner() { return *scanner_; }

    private:
        Engine* owner_;
        std::unique_ptr<Scanner> scanner_;
    };

    Engine(std::vector<std::unique_ptr<Scanner>> handles, EngineOptions options);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Opens a ClamAV engine from the configured database; throws EngineInitFailure.
    static std::unique_ptr<Engine> makeClamAV(const config::ScanningConfig& cfg);

    Verdict scan(const ByteSource& source);

    std::optional<Lease> acquire(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t poolSize() const { return poolSize_; }
    [[nodiscard]] size_t available() const;

    void shutdown();

    // Releases every caller waiting for a handle or a scan result with
    // ScanError("abandoned"), and answers later calls the same way. Native
    // scans already running finish on the scan pool.
    void abandon();

    [[nodiscard]] bool isAbandoned() const;

private:
    void giveBack(std::unique_ptr<Scanner> scanner);
    void notifyScanDone();

    EngineOptions options_;
    size_t poolSize_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Scanner>> idle_;
    bool abandoned_ = false;

    // Declared last so its workers are joined before the idle list goes away.
    std::unique_ptr<concurrency::ThreadPool> workers_;
};

}
