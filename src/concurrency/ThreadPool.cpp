#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace sfs::concurrency;

ThreadPool::ThreadPool(std::string name, const unsigned int nThreads)
    : name_(std::move(name)) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool '" + name_ + "' needs at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    std::vector<std::thread> workers;
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load() && threads_.empty()) return;
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
        stopFlag.store(true);
        workers.swap(threads_);
    }
    cv.notify_all();

    for (auto& t : workers) {
        if (!t.joinable()) continue;
        // A task stopping its own pool cannot join itself.
        if (t.get_id() == std::this_thread::get_id()) t.detach();
        else t.join();
    }
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool '" + name_ + "' is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    std::scoped_lock lock(mutex);
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                sfs::log::Registry::sentryfs()->error("[ThreadPool:{}] Task failed: {}", name_, e.what());
            }
        }
    });
}
