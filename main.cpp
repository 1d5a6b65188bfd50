#include "cli/Args.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "mount/Graph.hpp"
#include "mount/LoopAllocator.hpp"
#include "mount/Manager.hpp"
#include "mount/Syscalls.hpp"
#include "scan/Engine.hpp"
#include "scan/VerdictCache.hpp"
#include "fuse/Proxy.hpp"
#include "fuse/Service.hpp"
#include "runtime/Deps.hpp"
#include "runtime/ShutdownOrchestrator.hpp"
#include "types/errors.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace sfs;
using namespace sfs::config;
using namespace sfs::log;

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "sentryfs";

    cli::Args args;
    try {
        args = cli::parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << program << ": " << e.what() << "\n\n" << cli::usage(program);
        return 1;
    }

    if (args.help) {
        std::cout << cli::usage(program);
        return 0;
    }

    try {
        Config cfg;
        const auto path = args.configPath.value_or(DEFAULT_CONFIG_PATH);
        if (args.configPath || fs::exists(path)) cfg = loadConfig(path);
        cli::applyOverrides(args, cfg);

        ConfigRegistry::init(std::move(cfg));
        Registry::init();
    } catch (const std::exception& e) {
        std::cerr << program << ": failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    const auto& cfg = ConfigRegistry::get();
    Registry::config()->debug("[Config] Effective configuration: {}", nlohmann::json(cfg).dump());

    std::error_code ec;
    if (!fs::is_directory(cfg.fuse.mount_point, ec)) {
        Registry::sentryfs()->error("[*] MOUNTPOINT {} does not exist or is not a directory", cfg.fuse.mount_point.string());
        return 1;
    }

    runtime::ShutdownOrchestrator::installSignalHandlers();

    runtime::Deps deps;
    runtime::ShutdownOrchestrator orchestrator(deps, cfg.shutdown.drain_timeout);

    Registry::sentryfs()->info("[*] Initializing scan engine from {}...", cfg.scanning.database_dir.string());
    try {
        deps.engine = scan::Engine::makeClamAV(cfg.scanning);
    } catch (const types::EngineInitFailure& e) {
        Registry::sentryfs()->critical("[!] Scan engine unavailable: {}", e.what());
        return 1;
    }

    deps.syscalls = std::make_unique<mount::LinuxSyscalls>();
    deps.loops = std::make_unique<mount::LoopAllocator>(*deps.syscalls);
    deps.mounts = std::make_unique<mount::Manager>(*deps.syscalls, *deps.loops, mount::UnmountPolicy{
        .retries = cfg.shutdown.unmount_retries,
        .backoff = cfg.shutdown.unmount_backoff,
        .timeout = cfg.shutdown.unmount_timeout
    });

    try {
        deps.graph = std::make_unique<mount::Graph>(mount::Graph::fromLayers(cfg.layers));
        if (!deps.graph->empty())
            Registry::sentryfs()->info("[*] Mounting {} layers...", deps.graph->nodes().size());
        deps.graph->mountAll(*deps.mounts);
    } catch (const std::exception& e) {
        Registry::sentryfs()->critical("[!] Layer setup failed: {}", e.what());
        return 1;
    }

    if (!fs::is_directory(cfg.fuse.source_root, ec)) {
        Registry::sentryfs()->error("[*] SOURCE {} does not exist or is not a directory", cfg.fuse.source_root.string());
        orchestrator.drain();
        return 1;
    }

    deps.cache = std::make_unique<scan::VerdictCache>(
        [engine = deps.engine.get()](const scan::ByteSource& src) { return engine->scan(src); },
        cfg.scanning.cache_capacity);

    deps.proxy = std::make_unique<fuse::Proxy>(fuse::ProxyOptions{
        .sourceRoot = fs::canonical(cfg.fuse.source_root),
        .attrTimeout = cfg.fuse.attr_timeout,
        .entryTimeout = cfg.fuse.entry_timeout
    }, *deps.cache, deps.draining);

    deps.fuseService = std::make_unique<fuse::Service>(*deps.proxy, fuse::ServiceOptions{
        .mountPoint = cfg.fuse.mount_point,
        .options = cfg.fuse.options,
        .workerThreads = cfg.fuse.worker_threads
    });

    if (runtime::ShutdownOrchestrator::signalCount() > 0) {
        Registry::sentryfs()->warn("[!] Signal received during startup, tearing down");
        return orchestrator.drain();
    }

    deps.fuseService->start();
    if (!deps.fuseService->waitUntilMounted(std::chrono::seconds(10))) {
        Registry::sentryfs()->critical("[!] FUSE session failed to mount at {}", cfg.fuse.mount_point.string());
        orchestrator.drain();
        return 1;
    }

    Registry::sentryfs()->info("[✓] Serving {} at {}", cfg.fuse.source_root.string(), cfg.fuse.mount_point.string());

    orchestrator.waitForShutdownRequest();
    return orchestrator.drain();
}
