#pragma once

#include "mount/LoopAllocator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sfs::mount {

enum class MountState { Unmounted, Mounting, Mounted, Unmounting };

inline const char* to_string(const MountState s) {
    switch (s) {
        case MountState::Unmounted: return "Unmounted";
        case MountState::Mounting: return "Mounting";
        case MountState::Mounted: return "Mounted";
        case MountState::Unmounting: return "Unmounting";
    }
    return "Unknown";
}

struct MountNode {
    std::string name;
    std::filesystem::path source;
    std::filesystem::path mountPoint;
    std::string fsType;
    std::vector<std::string> options;
    bool readOnly = false;

    MountState state = MountState::Unmounted;
    std::optional<LoopSlot> loop;

    // Arena indices, filled in by Graph.
    std::optional<size_t> parent;
    std::vector<size_t> children;
};

}
