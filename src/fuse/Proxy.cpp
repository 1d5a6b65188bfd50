#include "fuse/Proxy.hpp"
#include "scan/VerdictCache.hpp"
#include "scan/Fingerprint.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

using namespace sfs::fuse;
using namespace sfs::scan;
using namespace sfs::log;

namespace {

bool isWithin(const std::string& path, const std::string& prefix) {
    if (path == prefix) return true;
    return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 && path[prefix.size()] == '/';
}

}

Proxy::Proxy(ProxyOptions options, VerdictCache& cache, const std::atomic<bool>& draining)
    : options_(std::move(options)), cache_(cache), draining_(draining) {}

Proxy::~Proxy() {
    closeAll();
}

std::filesystem::path Proxy::realPath(const std::filesystem::path& rel) const {
    if (rel.empty() || rel == "/") return options_.sourceRoot;
    return options_.sourceRoot / rel.relative_path();
}

std::optional<std::filesystem::path> Proxy::childPath(const fuse_ino_t parent, const std::string& name) const {
    const auto dir = inodes_.resolve(parent);
    if (!dir) return std::nullopt;
    return *dir / name;
}

int Proxy::fillEntry(const std::filesystem::path& rel, fuse_entry_param& out) {
    struct stat st{};
    if (::lstat(realPath(rel).c_str(), &st) != 0) return errno;

    out = {};
    out.ino = inodes_.lookup(rel);
    out.attr = st;
    out.attr.st_ino = out.ino;
    out.attr_timeout = options_.attrTimeout;
    out.entry_timeout = options_.entryTimeout;
    return 0;
}

int Proxy::lookup(const fuse_ino_t parent, const std::string& name, fuse_entry_param& out) {
    const auto rel = childPath(parent, name);
    if (!rel) return ENOENT;
    return fillEntry(*rel, out);
}

int Proxy::getattr(const fuse_ino_t ino, struct stat& out, const uint64_t* fh) {
    if (const auto h = fh ? handle(*fh) : nullptr) {
        if (::fstat(h->fd, &out) != 0) return errno;
        out.st_ino = ino;
        return 0;
    }

    const auto rel = inodes_.resolve(ino);
    if (!rel) return ENOENT;

    if (::lstat(realPath(*rel).c_str(), &out) != 0) return errno;
    out.st_ino = ino;
    return 0;
}

int Proxy::setattr(const fuse_ino_t ino, const struct stat& attr, const int toSet, const uint64_t* fh, struct stat& out) {
    const auto h = fh ? handle(*fh) : nullptr;

    std::filesystem::path real;
    if (h) {
        real = h->realPath();
    } else {
        const auto rel = inodes_.resolve(ino);
        if (!rel) return ENOENT;
        real = realPath(*rel);
    }

    if (toSet & FUSE_SET_ATTR_MODE) {
        const int rc = h ? ::fchmod(h->fd, attr.st_mode) : ::chmod(real.c_str(), attr.st_mode);
        if (rc != 0) return errno;
    }

    if (toSet & (FUSE_SET_ATTR_UID | FUSE_SET_ATTR_GID)) {
        const uid_t uid = (toSet & FUSE_SET_ATTR_UID) ? attr.st_uid : static_cast<uid_t>(-1);
        const gid_t gid = (toSet & FUSE_SET_ATTR_GID) ? attr.st_gid : static_cast<gid_t>(-1);
        const int rc = h ? ::fchown(h->fd, uid, gid) : ::lchown(real.c_str(), uid, gid);
        if (rc != 0) return errno;
    }

    if (toSet & FUSE_SET_ATTR_SIZE) {
        const int rc = h ? ::ftruncate(h->fd, attr.st_size) : ::truncate(real.c_str(), attr.st_size);
        if (rc != 0) return errno;
        if (h && h->writable()) h->truncated = true;
        cache_.invalidate(real);
    }

    if (toSet & (FUSE_SET_ATTR_ATIME | FUSE_SET_ATTR_MTIME | FUSE_SET_ATTR_ATIME_NOW | FUSE_SET_ATTR_MTIME_NOW)) {
        timespec times[2];
        times[0].tv_sec = times[1].tv_sec = 0;
        times[0].tv_nsec = times[1].tv_nsec = UTIME_OMIT;

        if (toSet & FUSE_SET_ATTR_ATIME_NOW) times[0].tv_nsec = UTIME_NOW;
        else if (toSet & FUSE_SET_ATTR_ATIME) times[0] = attr.st_atim;
        if (toSet & FUSE_SET_ATTR_MTIME_NOW) times[1].tv_nsec = UTIME_NOW;
        else if (toSet & FUSE_SET_ATTR_MTIME) times[1] = attr.st_mtim;

        const int rc = h ? ::futimens(h->fd, times) : ::utimensat(AT_FDCWD, real.c_str(), times, AT_SYMLINK_NOFOLLOW);
        if (rc != 0) return errno;

        // A restored mtime must not resurrect a verdict for different bytes.
        if (toSet & (FUSE_SET_ATTR_MTIME | FUSE_SET_ATTR_MTIME_NOW)) cache_.invalidate(real);
    }

    return getattr(ino, out, h ? fh : nullptr);
}

int Proxy::readdir(const fuse_ino_t ino, std::vector<DirEntry>& out) {
    const auto rel = inodes_.resolve(ino);
    if (!rel) return ENOENT;

    DIR* dir = ::opendir(realPath(*rel).c_str());
    if (!dir) return errno;

    out.clear();
    errno = 0;
    while (const dirent* d = ::readdir(dir)) {
        DirEntry e;
        e.name = d->d_name;
        e.attr.st_ino = d->d_ino;
        e.attr.st_mode = DTTOIF(d->d_type);
        out.push_back(std::move(e));
    }
    const int err = errno;
    ::closedir(dir);
    return err;
}

int Proxy::readlink(const fuse_ino_t ino, std::string& out) {
    const auto rel = inodes_.resolve(ino);
    if (!rel) return ENOENT;

    char buf[PATH_MAX];
    const ssize_t n = ::readlink(realPath(*rel).c_str(), buf, sizeof(buf) - 1);
    if (n < 0) return errno;
    out.assign(buf, static_cast<size_t>(n));
    return 0;
}

int Proxy::open(const fuse_ino_t ino, const int flags, uint64_t& fh) {
    if (draining_.load()) {
        Registry::fuse()->debug("[open] Refusing inode {} while draining", ino);
        return EBUSY;
    }

    const auto rel = inodes_.resolve(ino);
    if (!rel) return ENOENT;
    const auto real = realPath(*rel);

    const int fd = ::open(real.c_str(), (flags & ~(O_CREAT | O_EXCL | O_NOCTTY)) | O_CLOEXEC);
    if (fd < 0) return errno;

    auto h = std::make_shared<FileHandle>(ino, real, fd, flags);
    if (flags & O_TRUNC) h->truncated = true;

    struct stat st{};
    if (::fstat(fd, &st) != 0) return errno;

    // Write-only and truncating opens expose no existing bytes; they are
    // judged when released.
    const bool readsExisting = (flags & O_ACCMODE) != O_WRONLY && !(flags & O_TRUNC);
    if (S_ISREG(st.st_mode) && readsExisting) {
        try {
            h->verdict = checkContent(*h, st);
        } catch (const types::AccessDenied&) {
            return EACCES;
        } catch (const types::TransientScanFailure&) {
            return EIO;
        }
    }

    if (h->truncated) cache_.invalidate(real);

    inodes_.pinOpen(ino);
    fh = registerHandle(std::move(h));
    return 0;
}

int Proxy::create(const fuse_ino_t parent, const std::string& name, const mode_t mode, const int flags,
                  fuse_entry_param& out, uint64_t& fh) {
    if (draining_.load()) {
        Registry::fuse()->debug("[create] Refusing {} while draining", name);
        return EBUSY;
    }

    const auto rel = childPath(parent, name);
    if (!rel) return ENOENT;
    const auto real = realPath(*rel);

    const int fd = ::open(real.c_str(), ((flags | O_CREAT) & ~O_NOCTTY) | O_CLOEXEC, mode);
    if (fd < 0) return errno;

    auto h = std::make_shared<FileHandle>(0, real, fd, flags);
    h->created = true;

    if (const int rc = fillEntry(*rel, out); rc != 0) return rc;
    h->ino = out.ino;

    cache_.invalidate(real);
    inodes_.pinOpen(h->ino);
    fh = registerHandle(std::move(h));
    return 0;
}

int Proxy::read(const uint64_t fh, const size_t size, const off_t offset, std::vector<char>& out) {
    const auto h = handle(fh);
    if (!h) return EBADF;

    out.resize(size);
    size_t total = 0;
    while (total < size) {
        const ssize_t n = ::pread(h->fd, out.data() + total, size - total, offset + static_cast<off_t>(total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    out.resize(total);
    return 0;
}

int Proxy::write(const uint64_t fh, const char* buf, const size_t size, const off_t offset, size_t& written) {
    const auto h = handle(fh);
    if (!h) return EBADF;

    written = 0;
    while (written < size) {
        const ssize_t n = ::pwrite(h->fd, buf + written, size - written, offset + static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (written > 0) break;
            return errno;
        }
        written += static_cast<size_t>(n);
    }

    if (!h->dirty.exchange(true)) cache_.invalidate(h->realPath());
    return 0;
}

int Proxy::flush(const uint64_t fh) {
    const auto h = handle(fh);
    if (!h) return EBADF;

    // close() on a duplicate reports deferred write errors without giving up the handle.
    const int dupFd = ::dup(h->fd);
    if (dupFd < 0) return errno;
    return ::close(dupFd) == 0 ? 0 : errno;
}

int Proxy::fsync(const uint64_t fh, const bool datasync) {
    const auto h = handle(fh);
    if (!h) return EBADF;

    const int rc = datasync ? ::fdatasync(h->fd) : ::fsync(h->fd);
    return rc == 0 ? 0 : errno;
}

int Proxy::release(const uint64_t fh) {
    const auto h = takeHandle(fh);
    if (!h) return EBADF;

    inodes_.unpinOpen(h->ino);

    const bool rescan = h->needsRescan();
    const auto real = h->realPath();
    const int rc = h->close();
    if (!rescan) return rc;

    cache_.invalidate(real);
    const auto rel = std::filesystem::path("/") / real.lexically_relative(options_.sourceRoot);
    if (const int verdictRc = rescanAfterWrite(rel, real); verdictRc != 0) return verdictRc;
    return rc;
}

int Proxy::rescanAfterWrite(const std::filesystem::path& rel, const std::filesystem::path& real) {
    const int fd = ::open(real.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) {
        if (errno == ENOENT) return 0;  // removed before the last close
        Registry::fuse()->error("[release] Cannot reopen {} for scanning: {}", real.string(), std::strerror(errno));
        return EIO;
    }
    const FileHandle reading(0, real, fd, O_RDONLY);

    struct stat st{};
    if (::fstat(reading.fd, &st) != 0) return errno;
    if (!S_ISREG(st.st_mode)) return 0;

    const auto fp = Fingerprint::fromStat(real, st);
    const auto verdict = cache_.getOrScan(fp, {reading.fd, real});

    if (verdict.isClean()) return 0;

    if (verdict.isInfected()) {
        reportDenial(fp, verdict.detail(), "release");
        if (::unlink(real.c_str()) != 0 && errno != ENOENT)
            Registry::fuse()->error("[release] Failed to remove infected {}: {}", real.string(), std::strerror(errno));
        cache_.invalidate(real);
        inodes_.remove(rel);
        return EACCES;
    }

    Registry::fuse()->warn("[release] Scan of written file {} failed: {}", fp.toString(), verdict.detail());
    return EIO;
}

Verdict Proxy::checkContent(const FileHandle& handle, const struct stat& st) {
    const auto path = handle.realPath();
    const auto fp = Fingerprint::fromStat(path, st);
    auto verdict = cache_.getOrScan(fp, {handle.fd, path});

    if (verdict.isInfected()) {
        reportDenial(fp, verdict.detail(), "open");
        throw types::AccessDenied(path.string(), verdict.detail());
    }

    if (verdict.isError()) {
        Registry::fuse()->warn("[open] Not serving {}: {}", fp.toString(), verdict.detail());
        throw types::TransientScanFailure(path.string(), verdict.detail());
    }

    return verdict;
}

void Proxy::reportDenial(const Fingerprint& fp, const std::string& signature, const char* when) {
    Registry::audit()->warn("[Denied] op={} path={} signature={} fingerprint={}",
                            when, fp.path.string(), signature, fp.toString());
    Registry::fuse()->warn("[{}] Infected content in {}: {}", when, fp.path.string(), signature);
}

int Proxy::unlink(const fuse_ino_t parent, const std::string& name) {
    const auto rel = childPath(parent, name);
    if (!rel) return ENOENT;
    const auto real = realPath(*rel);

    if (::unlink(real.c_str()) != 0) return errno;
    cache_.invalidate(real);
    inodes_.remove(*rel);
    return 0;
}

int Proxy::mkdir(const fuse_ino_t parent, const std::string& name, const mode_t mode, fuse_entry_param& out) {
    const auto rel = childPath(parent, name);
    if (!rel) return ENOENT;

    if (::mkdir(realPath(*rel).c_str(), mode) != 0) return errno;
    return fillEntry(*rel, out);
}

int Proxy::rmdir(const fuse_ino_t parent, const std::string& name) {
    const auto rel = childPath(parent, name);
    if (!rel) return ENOENT;
    const auto real = realPath(*rel);

    if (::rmdir(real.c_str()) != 0) return errno;
    cache_.invalidate(real);
    inodes_.remove(*rel);
    return 0;
}

int Proxy::rename(const fuse_ino_t parent, const std::string& name, const fuse_ino_t newParent,
                  const std::string& newName, const unsigned int flags) {
    if (flags & ~static_cast<unsigned int>(RENAME_NOREPLACE)) return EINVAL;

    const auto from = childPath(parent, name);
    const auto to = childPath(newParent, newName);
    if (!from || !to) return ENOENT;

    const auto fromReal = realPath(*from);
    const auto toReal = realPath(*to);

    const int rc = flags ? ::renameat2(AT_FDCWD, fromReal.c_str(), AT_FDCWD, toReal.c_str(), flags)
                         : ::rename(fromReal.c_str(), toReal.c_str());
    if (rc != 0) return errno;

    cache_.invalidate(fromReal);
    cache_.invalidate(toReal);
    inodes_.rename(*from, *to);
    relinkHandles(fromReal, toReal);
    return 0;
}

int Proxy::statfs(const fuse_ino_t ino, struct statvfs& out) {
    (void)ino;
    return ::statvfs(options_.sourceRoot.c_str(), &out) == 0 ? 0 : errno;
}

int Proxy::access(const fuse_ino_t ino, const int mask) {
    const auto rel = inodes_.resolve(ino);
    if (!rel) return ENOENT;
    return ::faccessat(AT_FDCWD, realPath(*rel).c_str(), mask, AT_EACCESS) == 0 ? 0 : errno;
}

void Proxy::forget(const fuse_ino_t ino, const uint64_t nlookup) {
    inodes_.forget(ino, nlookup);
}

size_t Proxy::closeAll() {
    std::unordered_map<uint64_t, std::shared_ptr<FileHandle>> open;
    {
        std::scoped_lock lock(handlesMutex_);
        open.swap(handles_);
    }

    for (const auto& [id, h] : open) {
        inodes_.unpinOpen(h->ino);
        const auto path = h->realPath();
        if (h->needsRescan())
            Registry::fuse()->warn("[closeAll] {} closed with unscanned writes", path.string());
        if (const int rc = h->close(); rc != 0)
            Registry::fuse()->error("[closeAll] close of {} failed: {}", path.string(), std::strerror(rc));
    }
    return open.size();
}

size_t Proxy::openHandles() const {
    std::scoped_lock lock(handlesMutex_);
    return handles_.size();
}

uint64_t Proxy::registerHandle(std::shared_ptr<FileHandle> handle) {
    std::scoped_lock lock(handlesMutex_);
    const auto id = nextHandle_++;
    handles_.emplace(id, std::move(handle));
    return id;
}

std::shared_ptr<FileHandle> Proxy::handle(const uint64_t fh) const {
    std::scoped_lock lock(handlesMutex_);
    const auto it = handles_.find(fh);
    return it == handles_.end() ? nullptr : it->second;
}

std::shared_ptr<FileHandle> Proxy::takeHandle(const uint64_t fh) {
    std::scoped_lock lock(handlesMutex_);
    const auto it = handles_.find(fh);
    if (it == handles_.end()) return nullptr;
    auto h = std::move(it->second);
    handles_.erase(it);
    return h;
}

void Proxy::relinkHandles(const std::filesystem::path& from, const std::filesystem::path& to) {
    const auto fromKey = from.string();
    std::scoped_lock lock(handlesMutex_);
    for (const auto& [id, h] : handles_) {
        const auto p = h->realPath().string();
        if (isWithin(p, fromKey)) h->relink(to.string() + p.substr(fromKey.size()));
    }
}
