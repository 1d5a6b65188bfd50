#include "mount/LoopAllocator.hpp"
#include "mount/Syscalls.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"

#include <cerrno>
#include <cstring>

using namespace sfs::mount;
using namespace sfs::log;

LoopAllocator::LoopAllocator(Syscalls& sys, const unsigned int attachAttempts)
    : sys_(sys), attachAttempts_(attachAttempts == 0 ? 1 : attachAttempts) {}

LoopAllocator::~LoopAllocator() {
    std::scoped_lock lock(mutex_);
    for (const auto& [index, slot] : inUse_) {
        Registry::mount()->warn("[LoopAllocator] {} still attached to {} at exit", slot.device.string(), slot.image.string());
        if (const int rc = sys_.closeDevice(slot.deviceFd); rc != 0)
            Registry::mount()->error("[LoopAllocator] Closing {} failed: {}", slot.device.string(), std::strerror(rc));
    }
}

LoopSlot LoopAllocator::acquire(const std::filesystem::path& image, const bool readOnly) {
    std::scoped_lock lock(mutex_);

    int lastError = EBUSY;
    for (unsigned int attempt = 0; attempt < attachAttempts_; ++attempt) {
        int index = -1;
        if (const int rc = sys_.loopFindFree(index); rc != 0)
            throw types::MountOperationFailure(image.string(), "loop device lookup", rc);

        // Another process may race us between GET_FREE and SET_FD.
        if (inUse_.contains(index)) {
            lastError = EBUSY;
            continue;
        }

        int deviceFd = -1;
        const int rc = sys_.loopAttach(index, image, readOnly, deviceFd);
        if (rc == EBUSY) {
            Registry::mount()->debug("[LoopAllocator] loop{} taken before attach, retrying", index);
            lastError = rc;
            continue;
        }
        if (rc != 0) throw types::MountOperationFailure(image.string(), "loop attach", rc);

        LoopSlot slot{
            .index = index,
            .device = loopDevicePath(index),
            .image = image,
            .readOnly = readOnly,
            .deviceFd = deviceFd
        };
        inUse_.emplace(index, slot);
        Registry::mount()->info("[LoopAllocator] Attached {} to {}{}", image.string(), slot.device.string(),
                                readOnly ? " (read-only)" : "");
        return slot;
    }

    throw types::MountOperationFailure(image.string(), "loop attach", lastError);
}

void LoopAllocator::release(const LoopSlot& slot) {
    std::scoped_lock lock(mutex_);

    const auto it = inUse_.find(slot.index);
    if (it == inUse_.end()) {
        Registry::mount()->warn("[LoopAllocator] Release of unknown slot {}", slot.device.string());
        return;
    }

    // ENXIO: the device was already unbound. While our descriptor is open
    // the kernel defers the detach to its close.
    if (const int rc = sys_.loopDetach(slot.index); rc != 0 && rc != ENXIO)
        throw types::MountOperationFailure(slot.device.string(), "loop detach", rc);

    if (const int rc = sys_.closeDevice(it->second.deviceFd); rc != 0)
        Registry::mount()->warn("[LoopAllocator] Closing {} failed: {}", slot.device.string(), std::strerror(rc));

    inUse_.erase(it);
    Registry::mount()->info("[LoopAllocator] Released {}", slot.device.string());
}

size_t LoopAllocator::allocatedCount() const {
    std::scoped_lock lock(mutex_);
    return inUse_.size();
}

std::vector<LoopSlot> LoopAllocator::allocated() const {
    std::scoped_lock lock(mutex_);
    std::vector<LoopSlot> out;
    out.reserve(inUse_.size());
    for (const auto& [_, slot] : inUse_) out.push_back(slot);
    return out;
}
