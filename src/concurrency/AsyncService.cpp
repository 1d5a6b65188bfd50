#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace sfs::concurrency;
using namespace sfs::log;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    joinWorker();
}

void AsyncService::start() {
    if (isRunning()) return;

    joinWorker();
    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::sentryfs()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::sentryfs()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning() && !worker_.joinable()) return;

    Registry::sentryfs()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true);

    joinWorker();

    running_.store(false);
    interruptFlag_.store(false);

    Registry::sentryfs()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::joinWorker() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id())
        worker_.join();
}
