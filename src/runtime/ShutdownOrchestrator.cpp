#include "runtime/ShutdownOrchestrator.hpp"
#include "runtime/Deps.hpp"
#include "mount/Graph.hpp"
#include "mount/LoopAllocator.hpp"
#include "mount/Manager.hpp"
#include "scan/Engine.hpp"
#include "scan/VerdictCache.hpp"
#include "fuse/Proxy.hpp"
#include "fuse/Service.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <csignal>
#include <thread>

using namespace sfs::runtime;
using namespace sfs::log;
using namespace std::chrono_literals;

ShutdownOrchestrator::ShutdownOrchestrator(Deps& deps, const std::chrono::milliseconds drainTimeout)
    : deps_(deps), drainTimeout_(drainTimeout) {}

void ShutdownOrchestrator::onSignal(const int signum) {
    (void)signum;
    signals_.fetch_add(1);
}

void ShutdownOrchestrator::installSignalHandlers() {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::signal(SIGHUP, onSignal);
}

void ShutdownOrchestrator::waitForShutdownRequest() const {
    while (signalCount() == 0) {
        if (deps_.fuseService && !deps_.fuseService->isRunning()) {
            Registry::shutdown()->warn("[Shutdown] FUSE session ended without a signal");
            return;
        }
        std::this_thread::sleep_for(200ms);
    }
    Registry::shutdown()->info("[Shutdown] Termination requested");
}

void ShutdownOrchestrator::abandonScans() {
    // Owners of pending scans are released along with their waiters, so the
    // session pool can be joined.
    if (deps_.engine) deps_.engine->abandon();
    if (deps_.cache) deps_.cache->abandonWaiters();
}

int ShutdownOrchestrator::drain() {
    const auto log = Registry::shutdown();

    log->info("[Shutdown] Draining, new opens are refused");
    deps_.draining.store(true);

    bool forced = false;

    if (deps_.cache) {
        const auto deadline = std::chrono::steady_clock::now() + drainTimeout_;
        bool idle = false;
        while (!(idle = deps_.cache->awaitIdle(100ms))) {
            if (signalCount() >= 2) {
                log->warn("[Shutdown] Second signal received, abandoning {} pending scans", deps_.cache->pending());
                forced = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                log->warn("[Shutdown] {} scans still pending after {}ms, abandoning them",
                          deps_.cache->pending(), drainTimeout_.count());
                break;
            }
        }
        if (!idle) abandonScans();
    }

    if (deps_.fuseService) {
        // Release-time rescans can still start while the session winds down;
        // a second signal must not wait for them.
        std::atomic<bool> stopped{false};
        std::thread watcher([this, &stopped] {
            while (!stopped.load()) {
                if (signalCount() >= 2) {
                    abandonScans();
                    return;
                }
                std::this_thread::sleep_for(20ms);
            }
        });
        deps_.fuseService->stop();
        stopped.store(true);
        watcher.join();
    }

    if (deps_.proxy)
        if (const auto closed = deps_.proxy->closeAll(); closed > 0)
            log->info("[Shutdown] Closed {} open handles", closed);

    forced = forced || signalCount() >= 2;

    bool clean = true;
    if (deps_.graph && deps_.mounts) {
        deps_.mounts->setForceCheck([] { return signalCount() >= 2; });
        if (!deps_.graph->unmountAll(*deps_.mounts, forced)) {
            clean = false;
            for (const auto& node : deps_.graph->nodes())
                if (node.state != mount::MountState::Unmounted)
                    log->error("[Shutdown] {} is still mounted at {} ({})", node.name, node.mountPoint.string(),
                               mount::to_string(node.state));
        }
    }

    if (deps_.mounts)
        if (const auto stalled = deps_.mounts->stalledUnmounts(); stalled > 0) {
            clean = false;
            log->error("[Shutdown] {} unmount calls are still blocked in the kernel", stalled);
        }

    if (deps_.loops) {
        for (const auto& slot : deps_.loops->allocated()) {
            clean = false;
            log->error("[Shutdown] {} still attached to {}", slot.device.string(), slot.image.string());
        }
    }

    if (deps_.cache) {
        const auto s = deps_.cache->stats();
        log->info("[Shutdown] Verdict cache: {} hits, {} misses, {} scans, {} errors, {} evictions",
                  s.hits, s.misses, s.scansStarted, s.errors, s.evictions);
    }

    log->info("[Shutdown] Teardown {}", clean ? "complete" : "left resources behind");
    return clean ? 0 : 1;
}
