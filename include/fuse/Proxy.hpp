#pragma once

#define FUSE_USE_VERSION 35

#include "fuse/FileHandle.hpp"
#include "fuse/InodeTable.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <fuse3/fuse_lowlevel.h>

namespace sfs::scan { class VerdictCache; struct Fingerprint; }

namespace sfs::fuse {

struct ProxyOptions {
    std::filesystem::path sourceRoot;
    double attrTimeout = 1.0;
    double entryTimeout = 1.0;
};

struct DirEntry {
    std::string name;
    struct stat attr{};
};

// The proxied operation set. Every operation forwards to the real tree under
// sourceRoot; open and release additionally pass file content through the
// verdict cache. Operations return 0 or an errno value for the kernel.
class Proxy {
public:
    Proxy(ProxyOptions options, scan::VerdictCache& cache, const std::atomic<bool>& draining);
    ~Proxy();

    Proxy(const Proxy&) = delete;
    Proxy& operator=(const Proxy&) = delete;

    int lookup(fuse_ino_t parent, const std::string& name, fuse_entry_param& out);
    // With a handle, attributes come from its descriptor, so a file stays
    // usable after it is unlinked while open.
    int getattr(fuse_ino_t ino, struct stat& out, const uint64_t* fh = nullptr);
    int setattr(fuse_ino_t ino, const struct stat& attr, int toSet, const uint64_t* fh, struct stat& out);
    int readdir(fuse_ino_t ino, std::vector<DirEntry>& out);
    int readlink(fuse_ino_t ino, std::string& out);

    int open(fuse_ino_t ino, int flags, uint64_t& fh);
    int create(fuse_ino_t parent, const std::string& name, mode_t mode, int flags,
               fuse_entry_param& out, uint64_t& fh);
    int read(uint64_t fh, size_t size, off_t offset, std::vector<char>& out);
    int write(uint64_t fh, const char* buf, size_t size, off_t offset, size_t& written);
    int flush(uint64_t fh);
    int fsync(uint64_t fh, bool datasync);
    int release(uint64_t fh);

    int unlink(fuse_ino_t parent, const std::string& name);
    int mkdir(fuse_ino_t parent, const std::string& name, mode_t mode, fuse_entry_param& out);
    int rmdir(fuse_ino_t parent, const std::string& name);
    int rename(fuse_ino_t parent, const std::string& name, fuse_ino_t newParent,
               const std::string& newName, unsigned int flags);

    int statfs(fuse_ino_t ino, struct statvfs& out);
    int access(fuse_ino_t ino, int mask);
    void forget(fuse_ino_t ino, uint64_t nlookup);

    // Closes every open handle without rescanning; used once the session is gone.
    size_t closeAll();

    [[nodiscard]] size_t openHandles() const;
    [[nodiscard]] double attrTimeout() const { return options_.attrTimeout; }
    [[nodiscard]] InodeTable& inodes() { return inodes_; }
    [[nodiscard]] std::filesystem::path realPath(const std::filesystem::path& rel) const;

private:
    // Scans the open descriptor through the cache; throws AccessDenied or
    // TransientScanFailure unless the content is clean.
    scan::Verdict checkContent(const FileHandle& handle, const struct stat& st);

    int rescanAfterWrite(const std::filesystem::path& rel, const std::filesystem::path& real);

    void reportDenial(const scan::Fingerprint& fp, const std::string& signature, const char* when);

    std::optional<std::filesystem::path> childPath(fuse_ino_t parent, const std::string& name) const;
    int fillEntry(const std::filesystem::path& rel, fuse_entry_param& out);

    uint64_t registerHandle(std::shared_ptr<FileHandle> handle);
    std::shared_ptr<FileHandle> handle(uint64_t fh) const;
    std::shared_ptr<FileHandle> takeHandle(uint64_t fh);
    void relinkHandles(const std::filesystem::path& from, const std::filesystem::path& to);

    ProxyOptions options_;
    scan::VerdictCache& cache_;
    const std::atomic<bool>& draining_;
    InodeTable inodes_;

    mutable std::mutex handlesMutex_;
    uint64_t nextHandle_ = 1;
    std::unordered_map<uint64_t, std::shared_ptr<FileHandle>> handles_;
};

}
