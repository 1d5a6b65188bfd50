#pragma once

#include <atomic>
#include <memory>

namespace sfs::mount { class Syscalls; class LoopAllocator; class Manager; class Graph; }
namespace sfs::scan { class Engine; class VerdictCache; }
namespace sfs::fuse { class Proxy; class Service; }

namespace sfs::runtime {

// Process-wide shared state, owned in one place and handed out by reference.
// Members are torn down in reverse declaration order: the session goes
// before the proxy, the proxy before the cache and engine, and the mount
// stack last.
struct Deps {
    std::atomic<bool> draining{false};

    std::unique_ptr<mount::Syscalls> syscalls;
    std::unique_ptr<mount::LoopAllocator> loops;
    std::unique_ptr<mount::Manager> mounts;
    std::unique_ptr<mount::Graph> graph;

    std::unique_ptr<scan::Engine> engine;
    std::unique_ptr<scan::VerdictCache> cache;

    std::unique_ptr<fuse::Proxy> proxy;
    std::unique_ptr<fuse::Service> fuseService;

    Deps();
    ~Deps();

    Deps(const Deps&) = delete;
    Deps& operator=(const Deps&) = delete;
};

}
