#pragma once

#include <cstddef>
#include <functional>

namespace pyspot {

// Bounded fan-out: runs task(i) for every i in [0, count) on at most
// max_workers threads and returns once all of them finished. The first
// exception thrown by a task is rethrown on the calling thread.
class WorkerPool {
public:
    explicit WorkerPool(size_t max_workers);

    auto parallel_for(size_t count, const std::function<void(size_t)>& task) const -> void;

    auto max_workers() const -> size_t { return max_workers_; }

private:
    size_t max_workers_;
};

} // namespace pyspot
