#pragma once

#include <atomic>
#include <chrono>

namespace sfs::runtime {

struct Deps;

// Turns termination signals into an orderly teardown: stop admitting opens,
// let pending scans settle, stop the session, then unmount the layer stack
// children first. A second signal skips the waiting and forces the unmounts.
class ShutdownOrchestrator {
public:
    ShutdownOrchestrator(Deps& deps, std::chrono::milliseconds drainTimeout);

    // SIGINT, SIGTERM and SIGHUP all count as a shutdown request.
    static void installSignalHandlers();

    [[nodiscard]] static unsigned int signalCount() { return signals_.load(); }
    static void resetSignals() { signals_.store(0); }

    // Blocks until a signal arrives or the FUSE session ends on its own.
    void waitForShutdownRequest() const;

    // Runs the teardown and returns the process exit code.
    int drain();

private:
    static void onSignal(int signum);

    void abandonScans();

    static inline std::atomic<unsigned int> signals_{0};

    Deps& deps_;
    std::chrono::milliseconds drainTimeout_;
};

}
