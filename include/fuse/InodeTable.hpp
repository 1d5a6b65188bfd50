#pragma once

#define FUSE_USE_VERSION 35

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <fuse3/fuse_lowlevel.h>

namespace sfs::fuse {

// Stable inode numbers for paths relative to the source root ("/" is
// FUSE_ROOT_ID). An inode is evicted once the kernel has forgotten every
// lookup and no handle keeps it open.
class InodeTable {
public:
    InodeTable();

    // Returns the inode for the path and counts one kernel lookup against it.
    fuse_ino_t lookup(const std::filesystem::path& path);

    [[nodiscard]] std::optional<std::filesystem::path> resolve(fuse_ino_t ino) const;
    [[nodiscard]] std::optional<fuse_ino_t> find(const std::filesystem::path& path) const;

    void forget(fuse_ino_t ino, uint64_t nlookup);

    void pinOpen(fuse_ino_t ino);
    void unpinOpen(fuse_ino_t ino);

    // Relinks the path and everything beneath it to the new location.
    void rename(const std::filesystem::path& from, const std::filesystem::path& to);

    // Detaches the path (and anything beneath it) from its inode.
    void remove(const std::filesystem::path& path);

    [[nodiscard]] size_t size() const;

private:
    struct Node {
        std::filesystem::path path;
        uint64_t lookups = 0;
        uint64_t opens = 0;
        bool unlinked = false;
    };

    void maybeEvict(fuse_ino_t ino);

    mutable std::shared_mutex mutex_;
    fuse_ino_t nextInode_ = FUSE_ROOT_ID + 1;
    std::unordered_map<fuse_ino_t, Node> nodes_;
    std::unordered_map<std::string, fuse_ino_t> pathToInode_;
};

}
