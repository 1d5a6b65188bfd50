#pragma once

#include "mount/MountNode.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sfs::mount {

class Syscalls;

struct UnmountPolicy {
    unsigned int retries = 5;
    std::chrono::milliseconds backoff{100};
    std::chrono::milliseconds timeout{5000};  // zero waits without bound
};

struct MountFlags {
    unsigned long flags = 0;
    std::string data;  // options the kernel call does not know as flags
};

MountFlags parseMountOptions(const std::vector<std::string>& options, bool readOnly);

// Mounts and unmounts single nodes of the arena owned by Graph, enforcing
// that a parent is mounted before its children and outlives them.
class Manager {
public:
    Manager(Syscalls& sys, LoopAllocator& loops, UnmountPolicy policy);

    // Waits for unmount calls that outlived their deadline.
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Throws MountOrderingViolation if the parent is not Mounted, and
    // MountOperationFailure when the kernel refuses.
    void mount(std::vector<MountNode>& arena, size_t index);

    // Throws MountOrderingViolation if a child is still mounted. A regular
    // unmount throws MountOperationFailure after exhausting its retries; a
    // forced one logs failures and leaves the node Mounted.
    void unmount(std::vector<MountNode>& arena, size_t index, bool forced = false);

    // Polled between unmount retries; once it returns true the remaining
    // attempts collapse into a single lazy detach.
    void setForceCheck(std::function<bool()> check) { forceRequested_ = std::move(check); }

    // umount2 calls still blocked in the kernel after their deadline.
    [[nodiscard]] size_t stalledUnmounts() const;

private:
    int unmountWithDeadline(const std::filesystem::path& target);
    void detachLoop(MountNode& node);
    void finishUnmount(MountNode& node);

    Syscalls& sys_;
    LoopAllocator& loops_;
    UnmountPolicy policy_;
    std::function<bool()> forceRequested_;

    // At most one umount2 per target is in flight; a retry after a timeout
    // waits on the same call instead of starting another.
    struct PendingUnmount {
        std::thread worker;
        std::shared_future<int> result;
    };

    mutable std::mutex pendingMutex_;
    std::map<std::filesystem::path, PendingUnmount> pending_;
};

}
