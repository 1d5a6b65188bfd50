#include "scan/Engine.hpp"
#include "scan/ClamAVScanner.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"
#include "config/util.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <future>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using namespace sfs::scan;
using namespace sfs::concurrency;
using namespace sfs::log;

namespace {

struct ScanTask final : PromisedTask<Verdict> {
    ScanTask(Engine::Lease lease, const int fd, std::filesystem::path path, std::function<void()> onDone)
        : lease_(std::move(lease)), fd_(fd), path_(std::move(path)), onDone_(std::move(onDone)) {}

    ~ScanTask() override {
        if (fd_ >= 0) ::close(fd_);
    }

    void operator()() override {
        try {
            promise.set_value(lease_.scanner().scan({fd_, path_}));
        } catch (const std::exception& e) {
            promise.set_value(Verdict::error(e.what()));
        }
        onDone_();
    }

private:
    Engine::Lease lease_;
    int fd_;
    std::filesystem::path path_;
    std::function<void()> onDone_;
};

}

Engine::Lease::~Lease() {
    if (owner_ && scanner_) owner_->giveBack(std::move(scanner_));
}

Engine::Lease& Engine::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        if (owner_ && scanner_) owner_->giveBack(std::move(scanner_));
        owner_ = other.owner_;
        scanner_ = std::move(other.scanner_);
    }
    return *this;
}

Engine::Engine(std::vector<std::unique_ptr<Scanner>> handles, EngineOptions options)
    : options_(options), poolSize_(handles.size()), idle_(std::move(handles)) {
    if (poolSize_ == 0) throw std::invalid_argument("Engine needs at least one scanner handle");
    workers_ = std::make_unique<ThreadPool>("scan", static_cast<unsigned int>(poolSize_));
}

Engine::~Engine() {
    shutdown();
}

std::unique_ptr<Engine> Engine::makeClamAV(const config::ScanningConfig& cfg) {
    const auto compiled = std::make_shared<const ClamAVEngine>(cfg.database_dir);

    std::vector<std::unique_ptr<Scanner>> handles;
    for (unsigned int i = 0; i < cfg.engine_pool_size; ++i)
        handles.push_back(std::make_unique<ClamAVScanner>(compiled));

    Registry::scan()->info("[Engine] {} ClamAV handles ready, scan timeout {}ms, max scan size {}",
                           handles.size(), cfg.scan_timeout.count(), config::formatByteSize(cfg.max_scan_size));

    return std::make_unique<Engine>(std::move(handles), EngineOptions{
        .acquireTimeout = cfg.acquire_timeout,
        .scanTimeout = cfg.scan_timeout,
        .maxScanSize = cfg.max_scan_size
    });
}

std::optional<Engine::Lease> Engine::acquire(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return abandoned_ || !idle_.empty(); })) return std::nullopt;
    if (abandoned_) return std::nullopt;

    auto scanner = std::move(idle_.back());
    idle_.pop_back();
    return Lease(this, std::move(scanner));
}

size_t Engine::available() const {
    std::scoped_lock lock(mutex_);
    return idle_.size();
}

void Engine::giveBack(std::unique_ptr<Scanner> scanner) {
    {
        std::scoped_lock lock(mutex_);
        idle_.push_back(std::move(scanner));
    }
    cv_.notify_one();
}

void Engine::notifyScanDone() {
    { std::scoped_lock lock(mutex_); }
    cv_.notify_all();
}

void Engine::shutdown() {
    if (workers_) workers_->stop();
}

void Engine::abandon() {
    {
        std::scoped_lock lock(mutex_);
        if (abandoned_) return;
        abandoned_ = true;
    }
    cv_.notify_all();
    Registry::scan()->warn("[Engine] Abandoning scans in progress");
}

bool Engine::isAbandoned() const {
    std::scoped_lock lock(mutex_);
    return abandoned_;
}

Verdict Engine::scan(const ByteSource& source) {
    struct stat st{};
    if (::fstat(source.fd, &st) != 0)
        return Verdict::error(std::string("fstat failed: ") + std::strerror(errno));

    if (options_.maxScanSize && static_cast<uintmax_t>(st.st_size) > options_.maxScanSize) {
        Registry::scan()->warn("[Engine] {} is {} bytes, above the {} byte scan limit",
                               source.path.string(), st.st_size, options_.maxScanSize);
        return Verdict::error("file exceeds maximum scan size");
    }

    if (isAbandoned()) return Verdict::error("abandoned");

    auto lease = acquire(options_.acquireTimeout);
    if (!lease && isAbandoned()) return Verdict::error("abandoned");
    if (!lease) {
        Registry::scan()->warn("[Engine] No scanner handle free after {}ms for {}",
                               options_.acquireTimeout.count(), source.path.string());
        return Verdict::error("no scanner available");
    }

    // The task owns its own descriptor so a timed-out scan can finish safely
    // after the caller has gone and closed theirs.
    const int fd = ::fcntl(source.fd, F_DUPFD_CLOEXEC, 0);
    if (fd < 0) return Verdict::error(std::string("dup failed: ") + std::strerror(errno));

    const auto task = std::make_shared<ScanTask>(std::move(*lease), fd, source.path, [this] { notifyScanDone(); });
    auto future = task->getFuture();

    try {
        workers_->submit(task);
    } catch (const std::runtime_error& e) {
        return Verdict::error(e.what());
    }

    // Woken by the task finishing or by abandon().
    bool settled = false;
    {
        std::unique_lock lock(mutex_);
        settled = cv_.wait_for(lock, options_.scanTimeout, [&] {
            return abandoned_ || future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
    }

    if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (settled) {
            Registry::scan()->warn("[Engine] Scan of {} abandoned while running", source.path.string());
            return Verdict::error("abandoned");
        }
        Registry::scan()->error("[Engine] Scan of {} exceeded {}ms", source.path.string(), options_.scanTimeout.count());
        return Verdict::error("scan timed out");
    }

    try {
        return future.get();
    } catch (const std::future_error& e) {
        return Verdict::error(std::string("scan abandoned: ") + e.what());
    }
}
