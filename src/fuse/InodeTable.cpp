#include "fuse/InodeTable.hpp"
#include "log/Registry.hpp"

#include <mutex>
#include <vector>

using namespace sfs::fuse;
using namespace sfs::log;

namespace {

bool isWithin(const std::string& path, const std::string& prefix) {
    if (path == prefix) return true;
    if (prefix == "/") return true;
    return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 && path[prefix.size()] == '/';
}

}

InodeTable::InodeTable() {
    nodes_[FUSE_ROOT_ID] = Node{.path = "/", .lookups = 1};
    pathToInode_["/"] = FUSE_ROOT_ID;
}

fuse_ino_t InodeTable::lookup(const std::filesystem::path& path) {
    std::unique_lock lock(mutex_);
    const auto key = path.string();

    if (const auto it = pathToInode_.find(key); it != pathToInode_.end()) {
        ++nodes_[it->second].lookups;
        return it->second;
    }

    const auto ino = nextInode_++;
    nodes_[ino] = Node{.path = path, .lookups = 1};
    pathToInode_[key] = ino;
    return ino;
}

std::optional<std::filesystem::path> InodeTable::resolve(const fuse_ino_t ino) const {
    std::shared_lock lock(mutex_);
    const auto it = nodes_.find(ino);
    if (it == nodes_.end() || it->second.unlinked) return std::nullopt;
    return it->second.path;
}

std::optional<fuse_ino_t> InodeTable::find(const std::filesystem::path& path) const {
    std::shared_lock lock(mutex_);
    const auto it = pathToInode_.find(path.string());
    if (it == pathToInode_.end()) return std::nullopt;
    return it->second;
}

void InodeTable::forget(const fuse_ino_t ino, const uint64_t nlookup) {
    if (ino == FUSE_ROOT_ID) return;

    std::unique_lock lock(mutex_);
    const auto it = nodes_.find(ino);
    if (it == nodes_.end()) return;

    it->second.lookups = nlookup >= it->second.lookups ? 0 : it->second.lookups - nlookup;
    maybeEvict(ino);
}

void InodeTable::pinOpen(const fuse_ino_t ino) {
    std::unique_lock lock(mutex_);
    if (const auto it = nodes_.find(ino); it != nodes_.end()) ++it->second.opens;
}

void InodeTable::unpinOpen(const fuse_ino_t ino) {
    std::unique_lock lock(mutex_);
    const auto it = nodes_.find(ino);
    if (it == nodes_.end()) return;
    if (it->second.opens > 0) --it->second.opens;
    maybeEvict(ino);
}

void InodeTable::rename(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::unique_lock lock(mutex_);
    const auto fromKey = from.string();
    const auto toKey = to.string();

    // The target name no longer refers to whatever it named before.
    if (const auto it = pathToInode_.find(toKey); it != pathToInode_.end()) {
        nodes_[it->second].unlinked = true;
        pathToInode_.erase(it);
    }

    std::vector<std::pair<std::string, fuse_ino_t>> moved;
    for (const auto& [p, ino] : pathToInode_)
        if (isWithin(p, fromKey) && p != "/") moved.emplace_back(p, ino);

    for (const auto& [oldKey, ino] : moved) {
        const auto newKey = toKey + oldKey.substr(fromKey.size());
        pathToInode_.erase(oldKey);
        pathToInode_[newKey] = ino;
        nodes_[ino].path = newKey;
    }
}

void InodeTable::remove(const std::filesystem::path& path) {
    std::unique_lock lock(mutex_);
    const auto key = path.string();
    if (key == "/") return;

    std::vector<std::string> gone;
    for (const auto& [p, ino] : pathToInode_)
        if (isWithin(p, key)) gone.push_back(p);

    for (const auto& p : gone) {
        const auto ino = pathToInode_[p];
        pathToInode_.erase(p);
        nodes_[ino].unlinked = true;
        maybeEvict(ino);
    }
}

size_t InodeTable::size() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

void InodeTable::maybeEvict(const fuse_ino_t ino) {
    const auto it = nodes_.find(ino);
    if (it == nodes_.end() || it->second.lookups > 0 || it->second.opens > 0) return;

    if (!it->second.unlinked) {
        const auto pit = pathToInode_.find(it->second.path.string());
        if (pit != pathToInode_.end() && pit->second == ino) pathToInode_.erase(pit);
    }
    Registry::fuse()->debug("[InodeTable] Evicted inode {} ({})", ino, it->second.path.string());
    nodes_.erase(it);
}
