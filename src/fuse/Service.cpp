#include "fuse/Service.hpp"
#include "fuse/Bridge.hpp"
#include "fuse/Proxy.hpp"
#include "fuse/RequestTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/mount.h>

using namespace sfs::fuse;
using namespace sfs::concurrency;
using namespace sfs::log;

namespace {

void lazyUmount(const std::filesystem::path& p) {
    if (::umount2(p.c_str(), MNT_DETACH) == 0) return;

    // Unprivileged sessions can only be detached through the setuid helper.
    const int err = errno;
    if (const int rc = std::system(std::string("fusermount3 -uz '" + p.string() + "' >/dev/null 2>&1").c_str()); rc != 0)
        Registry::fuse()->warn("[FUSE] Could not detach {} ({}), fusermount3 exited with {}",
                               p.string(), std::strerror(err), rc);
}

void fuse_ll_init(void* userdata, fuse_conn_info* conn) {
    (void)userdata;
    Registry::fuse()->debug("[FUSE] Initializing FUSE connection...");

    constexpr unsigned int MB = 1024 * 1024;

    conn->want |= FUSE_CAP_ASYNC_READ;
    if (conn->capable & FUSE_CAP_ATOMIC_O_TRUNC) conn->want |= FUSE_CAP_ATOMIC_O_TRUNC;

    // Request buffers are handed to worker threads, so keep them in memory.
    conn->want &= ~(FUSE_CAP_SPLICE_READ | FUSE_CAP_SPLICE_WRITE | FUSE_CAP_SPLICE_MOVE);
    conn->want &= ~FUSE_CAP_WRITEBACK_CACHE;

    conn->max_readahead = MB;
    conn->max_write = MB;

    Registry::fuse()->debug("[FUSE] Connection initialized with max_readahead={} bytes, max_write={} bytes",
                            conn->max_readahead, conn->max_write);
}

}

Service::Service(Proxy& proxy, ServiceOptions options)
    : AsyncService("FUSE"), proxy_(proxy), options_(std::move(options)) {}

Service::~Service() {
    stop();
}

bool Service::waitUntilMounted(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(stateMutex_);
    stateCv_.wait_for(lock, timeout, [this] { return settled_; });
    return mounted_;
}

void Service::signalMounted(const bool ok) {
    {
        std::scoped_lock lock(stateMutex_);
        settled_ = true;
        mounted_ = ok;
    }
    stateCv_.notify_all();
}

void Service::stop() {
    if (!isRunning() && !worker_.joinable()) return;
    Registry::fuse()->info("[FUSE] Stopping FUSE session at {}", options_.mountPoint.string());
    interruptFlag_.store(true);

    bool wasMounted = false;
    {
        std::scoped_lock lock(stateMutex_);
        if (session_) fuse_session_exit(session_);
        wasMounted = mounted_;
    }

    // The loop sits in a blocking read on /dev/fuse until the mount goes away.
    if (wasMounted) lazyUmount(options_.mountPoint);

    joinWorker();

    running_.store(false);
    interruptFlag_.store(false);
    Registry::fuse()->info("[FUSE] FUSE service stopped");
}

void Service::runLoop() {
    Registry::fuse()->debug("[FUSE] Running FUSE service");

    std::vector<std::string> argsStr = {"sentryfs", "-f"};
    if (!options_.options.empty()) {
        std::string joined;
        for (const auto& o : options_.options) {
            if (!joined.empty()) joined += ",";
            joined += o;
        }
        argsStr.emplace_back("-o");
        argsStr.push_back(joined);
    }
    argsStr.push_back(options_.mountPoint.string());

    std::vector<std::unique_ptr<char[]>> ownedCStrs;
    std::vector<char*> argsCStr;
    for (const auto& str : argsStr) {
        auto buf = std::make_unique<char[]>(str.size() + 1);
        std::memcpy(buf.get(), str.c_str(), str.size() + 1);
        argsCStr.push_back(buf.get());
        ownedCStrs.push_back(std::move(buf));
    }

    fuse_args args = FUSE_ARGS_INIT(static_cast<int>(argsCStr.size()), argsCStr.data());

    fuse_cmdline_opts opts{};
    if (fuse_parse_cmdline(&args, &opts) != 0 || !opts.mountpoint) {
        Registry::fuse()->error("[FUSE] Failed to parse FUSE options");
        free(opts.mountpoint);
        fuse_opt_free_args(&args);
        signalMounted(false);
        return;
    }

    fuse_lowlevel_ops ops = getOperations();
    ops.init = fuse_ll_init;

    fuse_session* session = fuse_session_new(&args, &ops, sizeof(ops), &proxy_);
    if (!session) {
        Registry::fuse()->error("[FUSE] Failed to create FUSE session");
        free(opts.mountpoint);
        fuse_opt_free_args(&args);
        signalMounted(false);
        return;
    }

    if (fuse_session_mount(session, opts.mountpoint) != 0) {
        Registry::fuse()->error("[FUSE] Failed to mount FUSE filesystem at {}", opts.mountpoint);
        fuse_session_destroy(session);
        free(opts.mountpoint);
        fuse_opt_free_args(&args);
        signalMounted(false);
        return;
    }

    {
        std::scoped_lock lock(stateMutex_);
        session_ = session;
    }
    pool_ = std::make_unique<ThreadPool>("fuse", options_.workerThreads);

    Registry::fuse()->info("[FUSE] Mounted FUSE filesystem at {} with {} workers", opts.mountpoint,
                           options_.workerThreads);
    signalMounted(true);

    while (!fuse_session_exited(session) && !interruptFlag_.load()) {
        fuse_buf buf{};
        const int res = fuse_session_receive_buf(session, &buf);
        if (res == -EINTR) {
            free(buf.mem);
            continue;
        }
        if (res <= 0) {
            free(buf.mem);
            if (res < 0 && res != -ENODEV)
                Registry::fuse()->error("[FUSE] Reading from the session failed: {}", std::strerror(-res));
            break;
        }

        try {
            pool_->submit(std::make_shared<RequestTask>(session, buf));
        } catch (const std::runtime_error& e) {
            Registry::fuse()->error("[FUSE] Dropping request: {}", e.what());
            break;
        }
    }

    Registry::fuse()->info("[FUSE] FUSE service loop exiting");

    // In-flight requests must finish before the session they reply on is destroyed.
    pool_->stop();

    {
        std::scoped_lock lock(stateMutex_);
        session_ = nullptr;
        mounted_ = false;
    }

    fuse_session_unmount(session);
    fuse_session_destroy(session);

    free(opts.mountpoint);
    fuse_opt_free_args(&args);

    Registry::fuse()->info("[FUSE] FUSE service stopped successfully");
}
