#include "runtime/Deps.hpp"
#include "mount/Syscalls.hpp"
#include "mount/LoopAllocator.hpp"
#include "mount/Manager.hpp"
#include "mount/Graph.hpp"
#include "scan/Engine.hpp"
#include "scan/VerdictCache.hpp"
#include "fuse/Proxy.hpp"
#include "fuse/Service.hpp"

namespace sfs::runtime {

Deps::Deps() = default;
Deps::~Deps() = default;

}
