#pragma once

#include <future>

namespace sfs::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<T> p) : promise(std::move(p)) {}

    std::future<T> getFuture() { return promise.get_future(); }
};

}
