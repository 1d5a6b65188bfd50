#pragma once

#define FUSE_USE_VERSION 35

#include "scan/Verdict.hpp"

#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <optional>
#include <unistd.h>
#include <fuse3/fuse_lowlevel.h>

namespace sfs::fuse {

struct FileHandle {
    fuse_ino_t ino;
    int fd;
    int flags;
    std::optional<scan::Verdict> verdict;  // set when the open went through the gate
    std::atomic<bool> dirty{false};
    bool created = false;
    bool truncated = false;

    FileHandle(const fuse_ino_t i, std::filesystem::path p, const int f, const int fl)
        : ino(i), fd(f), flags(fl), realPath_(std::move(p)) {}

    ~FileHandle() { if (fd >= 0) ::close(fd); }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    // A rename moves the path under a handle that other workers are using.
    [[nodiscard]] std::filesystem::path realPath() const {
        std::scoped_lock lock(pathMutex_);
        return realPath_;
    }

    void relink(std::filesystem::path p) {
        std::scoped_lock lock(pathMutex_);
        realPath_ = std::move(p);
    }

    [[nodiscard]] bool writable() const { return (flags & O_ACCMODE) != O_RDONLY; }

    // Content written through this handle has not been judged yet.
    [[nodiscard]] bool needsRescan() const { return writable() && (dirty.load() || created || truncated); }

    // Closes the descriptor, returning 0 or the errno of close(2).
    int close() {
        if (fd < 0) return 0;
        const int rc = ::close(fd);
        fd = -1;
        return rc == 0 ? 0 : errno;
    }

private:
    mutable std::mutex pathMutex_;
    std::filesystem::path realPath_;
};

}
