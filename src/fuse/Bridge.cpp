#include "fuse/Bridge.hpp"
#include "fuse/Proxy.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

using namespace sfs::log;

namespace sfs::fuse {

namespace {

Proxy& proxyFor(const fuse_req_t req) {
    return *static_cast<Proxy*>(fuse_req_userdata(req));
}

// The kernel gave up on the request (interrupted open); the handle is unreachable.
void dropOrphan(Proxy& proxy, const uint64_t fh) {
    if (const int rc = proxy.release(fh); rc != 0)
        Registry::fuse()->warn("[open] Orphaned handle {} released with {}", fh, std::strerror(rc));
}

void replyEntry(const fuse_req_t req, const int rc, const fuse_entry_param& e) {
    if (rc != 0) fuse_reply_err(req, rc);
    else fuse_reply_entry(req, &e);
}

}

void lookup(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    Registry::fuse()->debug("[lookup] Called for parent: {}, name: {}", parent, name);
    if (!name || std::strlen(name) == 0) {
        fuse_reply_err(req, EINVAL);
        return;
    }

    try {
        fuse_entry_param e{};
        replyEntry(req, proxyFor(req).lookup(parent, name, e), e);
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[lookup] {} under {}: {}", name, parent, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void forget(const fuse_req_t req, const fuse_ino_t ino, const uint64_t nlookup) {
    Registry::fuse()->debug("[forget] Inode {} by {}", ino, nlookup);
    proxyFor(req).forget(ino, nlookup);
    fuse_reply_none(req);
}

void forget_multi(const fuse_req_t req, const size_t count, fuse_forget_data* forgets) {
    auto& proxy = proxyFor(req);
    for (size_t i = 0; i < count; ++i) proxy.forget(forgets[i].ino, forgets[i].nlookup);
    fuse_reply_none(req);
}

void getattr(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    Registry::fuse()->debug("[getattr] Called for inode: {}", ino);

    try {
        auto& proxy = proxyFor(req);
        struct stat st{};
        const uint64_t* fh = fi ? &fi->fh : nullptr;
        if (const int rc = proxy.getattr(ino, st, fh); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }
        fuse_reply_attr(req, &st, proxy.attrTimeout());
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[getattr] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void setattr(const fuse_req_t req, const fuse_ino_t ino, struct stat* attr, const int to_set, fuse_file_info* fi) {
    Registry::fuse()->debug("[setattr] Called for inode: {}, to_set: {}", ino, to_set);

    try {
        auto& proxy = proxyFor(req);
        struct stat out{};
        const uint64_t* fh = fi ? &fi->fh : nullptr;
        if (const int rc = proxy.setattr(ino, *attr, to_set, fh, out); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }
        fuse_reply_attr(req, &out, proxy.attrTimeout());
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[setattr] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void readlink(const fuse_req_t req, const fuse_ino_t ino) {
    try {
        std::string target;
        if (const int rc = proxyFor(req).readlink(ino, target); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }
        fuse_reply_readlink(req, target.c_str());
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[readlink] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void readdir(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    Registry::fuse()->debug("[readdir] Called for inode: {}, size: {}, offset: {}", ino, size, off);
    (void)fi;

    try {
        std::vector<DirEntry> entries;
        if (const int rc = proxyFor(req).readdir(ino, entries); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }

        std::vector<char> buf(size);
        size_t buf_used = 0;

        auto add_entry = [&](const std::string& name, const struct stat& st, const off_t next_off) {
            const size_t entry_size = fuse_add_direntry(req, nullptr, 0, name.c_str(), &st, next_off);
            if (buf_used + entry_size > size) return false;

            fuse_add_direntry(req, buf.data() + buf_used, entry_size, name.c_str(), &st, next_off);
            buf_used += entry_size;
            return true;
        };

        for (size_t i = static_cast<size_t>(off); i < entries.size(); ++i)
            if (!add_entry(entries[i].name, entries[i].attr, static_cast<off_t>(i + 1))) break;

        fuse_reply_buf(req, buf.data(), buf_used);
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[readdir] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void open(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    Registry::fuse()->debug("[open] Called for inode: {}, flags: {:#o}", ino, fi->flags);

    try {
        auto& proxy = proxyFor(req);
        uint64_t fh = 0;
        if (const int rc = proxy.open(ino, fi->flags, fh); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }

        fi->fh = fh;
        fi->keep_cache = 0;  // a verdict can change under an unchanged inode
        fi->direct_io = 0;   // keeps mmap and exec working
        if (fuse_reply_open(req, fi) == -ENOENT) dropOrphan(proxy, fh);
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[open] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void create(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode, fuse_file_info* fi) {
    Registry::fuse()->debug("[create] Called for parent: {}, name: {}, mode: {:#o}", parent, name, mode);

    try {
        auto& proxy = proxyFor(req);
        fuse_entry_param e{};
        uint64_t fh = 0;
        if (const int rc = proxy.create(parent, name, mode, fi->flags, e, fh); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }

        fi->fh = fh;
        fi->keep_cache = 0;
        fi->direct_io = 0;
        if (fuse_reply_create(req, &e, fi) == -ENOENT) dropOrphan(proxy, fh);
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[create] {} under {}: {}", name, parent, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void read(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    Registry::fuse()->debug("[read] Called for inode: {}, size: {}, offset: {}", ino, size, off);

    try {
        std::vector<char> data;
        if (const int rc = proxyFor(req).read(fi->fh, size, off, data); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }
        fuse_reply_buf(req, data.data(), data.size());
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[read] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void write(const fuse_req_t req, const fuse_ino_t ino, const char* buf, const size_t size, const off_t off,
           fuse_file_info* fi) {
    Registry::fuse()->debug("[write] Called for inode: {}, size: {}, offset: {}", ino, size, off);

    try {
        size_t written = 0;
        if (const int rc = proxyFor(req).write(fi->fh, buf, size, off, written); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }
        fuse_reply_write(req, written);
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[write] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void flush(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    try {
        fuse_reply_err(req, proxyFor(req).flush(fi->fh));
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[flush] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void fsync(const fuse_req_t req, const fuse_ino_t ino, const int datasync, fuse_file_info* fi) {
    try {
        fuse_reply_err(req, proxyFor(req).fsync(fi->fh, datasync != 0));
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[fsync] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void release(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    Registry::fuse()->debug("[release] Called for inode: {}", ino);

    try {
        fuse_reply_err(req, proxyFor(req).release(fi->fh));
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[release] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void unlink(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    Registry::fuse()->debug("[unlink] Called for parent: {}, name: {}", parent, name);

    try {
        fuse_reply_err(req, proxyFor(req).unlink(parent, name));
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[unlink] {} under {}: {}", name, parent, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void mkdir(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode) {
    Registry::fuse()->debug("[mkdir] Called for parent: {}, name: {}", parent, name);

    try {
        fuse_entry_param e{};
        replyEntry(req, proxyFor(req).mkdir(parent, name, mode, e), e);
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[mkdir] {} under {}: {}", name, parent, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void rmdir(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    Registry::fuse()->debug("[rmdir] Called for parent: {}, name: {}", parent, name);

    try {
        fuse_reply_err(req, proxyFor(req).rmdir(parent, name));
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[rmdir] {} under {}: {}", name, parent, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void rename(const fuse_req_t req, const fuse_ino_t parent, const char* name, const fuse_ino_t newparent,
            const char* newname, const unsigned int flags) {
    Registry::fuse()->debug("[rename] {}/{} -> {}/{}", parent, name, newparent, newname);

    try {
        fuse_reply_err(req, proxyFor(req).rename(parent, name, newparent, newname, flags));
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[rename] {} -> {}: {}", name, newname, ex.what());
        fuse_reply_err(req, EIO);
    }
}

void statfs(const fuse_req_t req, const fuse_ino_t ino) {
    try {
        struct statvfs st{};
        if (const int rc = proxyFor(req).statfs(ino, st); rc != 0) {
            fuse_reply_err(req, rc);
            return;
        }
        fuse_reply_statfs(req, &st);
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[statfs] {}", ex.what());
        fuse_reply_err(req, EIO);
    }
}

void access(const fuse_req_t req, const fuse_ino_t ino, const int mask) {
    try {
        fuse_reply_err(req, proxyFor(req).access(ino, mask));
    } catch (const std::exception& ex) {
        Registry::fuse()->error("[access] Inode {}: {}", ino, ex.what());
        fuse_reply_err(req, EIO);
    }
}

fuse_lowlevel_ops getOperations() {
    fuse_lowlevel_ops ops = {};
    ops.lookup = lookup;
    ops.forget = forget;
    ops.forget_multi = forget_multi;
    ops.getattr = getattr;
    ops.setattr = setattr;
    ops.readlink = readlink;
    ops.readdir = readdir;
    ops.open = open;
    ops.create = create;
    ops.read = read;
    ops.write = write;
    ops.flush = flush;
    ops.fsync = fsync;
    ops.release = release;
    ops.unlink = unlink;
    ops.mkdir = mkdir;
    ops.rmdir = rmdir;
    ops.rename = rename;
    ops.statfs = statfs;
    ops.access = access;
    return ops;
}

}
