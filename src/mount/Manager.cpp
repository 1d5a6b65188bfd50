#include "mount/Manager.hpp"
#include "mount/Syscalls.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unordered_map>
#include <sys/mount.h>

using namespace sfs::mount;
using namespace sfs::log;
using sfs::types::MountOperationFailure;
using sfs::types::MountOrderingViolation;

namespace sfs::mount {

MountFlags parseMountOptions(const std::vector<std::string>& options, const bool readOnly) {
    static const std::unordered_map<std::string, std::pair<unsigned long, bool>> known = {
        // name -> (flag, set or clear)
        {"ro", {MS_RDONLY, true}},
        {"rw", {MS_RDONLY, false}},
        {"nosuid", {MS_NOSUID, true}},
        {"suid", {MS_NOSUID, false}},
        {"nodev", {MS_NODEV, true}},
        {"dev", {MS_NODEV, false}},
        {"noexec", {MS_NOEXEC, true}},
        {"exec", {MS_NOEXEC, false}},
        {"sync", {MS_SYNCHRONOUS, true}},
        {"async", {MS_SYNCHRONOUS, false}},
        {"dirsync", {MS_DIRSYNC, true}},
        {"noatime", {MS_NOATIME, true}},
        {"atime", {MS_NOATIME, false}},
        {"nodiratime", {MS_NODIRATIME, true}},
        {"diratime", {MS_NODIRATIME, false}},
        {"relatime", {MS_RELATIME, true}},
        {"norelatime", {MS_RELATIME, false}},
        {"strictatime", {MS_STRICTATIME, true}},
        {"mand", {MS_MANDLOCK, true}},
        {"nomand", {MS_MANDLOCK, false}},
        {"silent", {MS_SILENT, true}},
        {"loud", {MS_SILENT, false}},
        {"defaults", {0, true}},
    };

    MountFlags out;
    for (const auto& opt : options) {
        if (opt.empty()) continue;
        if (const auto it = known.find(opt); it != known.end()) {
            const auto& [flag, set] = it->second;
            if (set) out.flags |= flag;
            else out.flags &= ~flag;
            continue;
        }
        if (!out.data.empty()) out.data += ",";
        out.data += opt;
    }

    if (readOnly) out.flags |= MS_RDONLY;
    return out;
}

}

Manager::Manager(Syscalls& sys, LoopAllocator& loops, UnmountPolicy policy)
    : sys_(sys), loops_(loops), policy_(policy) {}

Manager::~Manager() {
    std::scoped_lock lock(pendingMutex_);
    for (auto& [target, p] : pending_) {
        if (p.result.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            Registry::mount()->warn("[Mount] Waiting for the stalled unmount of {}", target.string());
        p.worker.join();
    }
}

size_t Manager::stalledUnmounts() const {
    std::scoped_lock lock(pendingMutex_);
    return pending_.size();
}

void Manager::mount(std::vector<MountNode>& arena, const size_t index) {
    auto& node = arena.at(index);

    if (node.state == MountState::Mounted) return;
    if (node.state != MountState::Unmounted)
        throw MountOrderingViolation("mount of " + node.name + " while it is " + to_string(node.state));

    if (node.parent) {
        const auto& parent = arena.at(*node.parent);
        if (parent.state != MountState::Mounted)
            throw MountOrderingViolation("mount of " + node.name + " before its parent " + parent.name +
                                         " is mounted (" + to_string(parent.state) + ")");
    }

    node.state = MountState::Mounting;
    Registry::mount()->info("[Mount] Mounting {} ({}) at {}", node.name, node.source.string(), node.mountPoint.string());

    const auto fail = [&](const std::string& op, const int err) {
        detachLoop(node);
        node.state = MountState::Unmounted;
        throw MountOperationFailure(node.name, op, err);
    };

    if (const int rc = sys_.makeDirectories(node.mountPoint); rc != 0) fail("mountpoint creation", rc);

    auto opts = parseMountOptions(node.options, node.readOnly);
    std::string device = node.source.string();
    std::string fsType = node.fsType;

    const auto kind = sys_.sourceKind(node.source);
    switch (kind) {
        case SourceKind::Missing:
            fail("source lookup", ENOENT);
            break;
        case SourceKind::Image:
            try {
                node.loop = loops_.acquire(node.source, node.readOnly);
            } catch (const MountOperationFailure&) {
                node.state = MountState::Unmounted;
                throw;
            }
            device = node.loop->device.string();
            break;
        case SourceKind::BlockDevice:
            break;
        case SourceKind::Directory:
            fsType.clear();
            opts.flags |= MS_BIND;
            break;
    }

    int rc = sys_.mount(device, node.mountPoint, fsType, opts.flags, opts.data);

    // A bind mount ignores MS_RDONLY until it is remounted.
    if (rc == 0 && kind == SourceKind::Directory && (opts.flags & MS_RDONLY)) {
        rc = sys_.mount("", node.mountPoint, "", MS_REMOUNT | MS_BIND | MS_RDONLY, "");
        if (rc != 0) {
            if (const int undo = sys_.unmount(node.mountPoint, MNT_DETACH); undo != 0)
                Registry::mount()->error("[Mount] Could not undo bind of {}: {}", node.name, std::strerror(undo));
        }
    }

    if (rc != 0) fail("mount", rc);

    node.state = MountState::Mounted;
    Registry::mount()->info("[Mount] Mounted {} at {}", node.name, node.mountPoint.string());
}

void Manager::unmount(std::vector<MountNode>& arena, const size_t index, const bool forced) {
    auto& node = arena.at(index);

    if (node.state == MountState::Unmounted) return;

    for (const auto child : node.children) {
        const auto& c = arena.at(child);
        if (c.state != MountState::Unmounted)
            throw MountOrderingViolation("unmount of " + node.name + " while child " + c.name +
                                         " is " + to_string(c.state));
    }

    node.state = MountState::Unmounting;
    const auto& mp = node.mountPoint;

    if (forced) {
        const int rc = sys_.unmount(mp, MNT_DETACH);
        if (rc != 0 && rc != EINVAL) {
            Registry::mount()->error("[Mount] Forced detach of {} failed: {}", node.name, std::strerror(rc));
            node.state = MountState::Mounted;
            return;
        }
        Registry::mount()->warn("[Mount] Lazily detached {} from {}", node.name, mp.string());
        finishUnmount(node);
        return;
    }

    int rc = 0;
    for (unsigned int attempt = 0;; ++attempt) {
        rc = unmountWithDeadline(mp);
        if (rc == 0 || rc == EINVAL) break;  // EINVAL: no longer a mountpoint
        if (rc != EBUSY && rc != ETIMEDOUT) break;
        if (attempt >= policy_.retries) break;

        if (forceRequested_ && forceRequested_()) {
            Registry::mount()->warn("[Mount] Forcing lazy detach of {} after {} attempts", node.name, attempt + 1);
            rc = sys_.unmount(mp, MNT_DETACH);
            break;
        }

        const auto delay = policy_.backoff * (1u << std::min(attempt, 10u));
        Registry::mount()->warn("[Mount] {} busy ({}), retrying in {}ms", node.name, std::strerror(rc), delay.count());
        std::this_thread::sleep_for(delay);
    }

    if (rc != 0 && rc != EINVAL) {
        node.state = MountState::Mounted;
        throw MountOperationFailure(node.name, "unmount", rc);
    }

    finishUnmount(node);
}

int Manager::unmountWithDeadline(const std::filesystem::path& target) {
    if (policy_.timeout.count() <= 0) return sys_.unmount(target, 0);

    // umount2 can block on a wedged filesystem. The call runs on its own
    // thread; a later retry waits on it again rather than stacking another.
    std::shared_future<int> result;
    {
        std::scoped_lock lock(pendingMutex_);
        auto it = pending_.find(target);
        if (it == pending_.end()) {
            std::packaged_task<int()> call([this, target] { return sys_.unmount(target, 0); });
            result = call.get_future().share();
            it = pending_.emplace(target, PendingUnmount{std::thread(std::move(call)), result}).first;
        } else {
            Registry::mount()->debug("[Mount] Unmount of {} still in flight, waiting on it", target.string());
            result = it->second.result;
        }
    }

    if (result.wait_for(policy_.timeout) == std::future_status::timeout) return ETIMEDOUT;

    {
        std::scoped_lock lock(pendingMutex_);
        if (const auto it = pending_.find(target); it != pending_.end()) {
            it->second.worker.join();
            pending_.erase(it);
        }
    }
    return result.get();
}

void Manager::finishUnmount(MountNode& node) {
    node.state = MountState::Unmounted;
    detachLoop(node);
    Registry::mount()->info("[Mount] Unmounted {}", node.name);
}

void Manager::detachLoop(MountNode& node) {
    if (!node.loop) return;
    try {
        loops_.release(*node.loop);
        node.loop.reset();
    } catch (const MountOperationFailure& e) {
        Registry::mount()->error("[Mount] {} keeps {}: {}", node.name, node.loop->device.string(), e.what());
    }
}
