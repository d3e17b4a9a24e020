#pragma once

#include <future>

namespace mds::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// A task that reports its outcome through a promise. Implementations must
// set the promise on every path, including failures.
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    std::future<T> getFuture() { return promise.get_future(); }
};

}
