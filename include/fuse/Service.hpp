#pragma once

#define FUSE_USE_VERSION 35

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <fuse3/fuse_lowlevel.h>

namespace sfs::concurrency { class ThreadPool; }

namespace sfs::fuse {

class Proxy;

struct ServiceOptions {
    std::filesystem::path mountPoint;
    std::vector<std::string> options;
    unsigned int workerThreads = 8;
};

// Owns the FUSE session: mounts it, reads kernel requests on its own thread
// and dispatches them to the fuse worker pool.
class Service final : public concurrency::AsyncService {
public:
    Service(Proxy& proxy, ServiceOptions options);
    ~Service() override;

    void stop() override;

    // Blocks until the session is mounted or failed to mount.
    bool waitUntilMounted(std::chrono::milliseconds timeout);

    [[nodiscard]] fuse_session* session() const noexcept { return session_; }

protected:
    void runLoop() override;

private:
    void signalMounted(bool ok);

    Proxy& proxy_;
    ServiceOptions options_;
    fuse_session* session_{nullptr};
    std::unique_ptr<concurrency::ThreadPool> pool_;

    std::mutex stateMutex_;
    std::condition_variable stateCv_;
    bool settled_ = false;
    bool mounted_ = false;
};

}
