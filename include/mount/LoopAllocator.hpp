#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace sfs::mount {

class Syscalls;

struct LoopSlot {
    int index = -1;
    std::filesystem::path device;
    std::filesystem::path image;
    bool readOnly = false;
    int deviceFd = -1;  // owned by the allocator; keeps the autoclear binding alive
};

// Hands out loop devices for image-backed layers. A slot belongs to exactly
// one node between acquire() and release().
class LoopAllocator {
public:
    explicit LoopAllocator(Syscalls& sys, unsigned int attachAttempts = 5);

    // Closes the descriptors of slots never released.
    ~LoopAllocator();

    LoopAllocator(const LoopAllocator&) = delete;
    LoopAllocator& operator=(const LoopAllocator&) = delete;

    // Throws MountOperationFailure when no device could be attached.
    LoopSlot acquire(const std::filesystem::path& image, bool readOnly);

    // Detaches the device and closes its descriptor. Throws
    // MountOperationFailure when the kernel refuses the detach, in which
    // case the slot stays allocated.
    void release(const LoopSlot& slot);

    [[nodiscard]] size_t allocatedCount() const;
    [[nodiscard]] std::vector<LoopSlot> allocated() const;

private:
    Syscalls& sys_;
    unsigned int attachAttempts_;

    mutable std::mutex mutex_;
    std::map<int, LoopSlot> inUse_;
};

}
