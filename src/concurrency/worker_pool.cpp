#include "pyspot/concurrency/worker_pool.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pyspot {

WorkerPool::WorkerPool(size_t max_workers) : max_workers_(std::max<size_t>(max_workers, 1)) {}

auto WorkerPool::parallel_for(size_t count, const std::function<void(size_t)>& task) const -> void {
    if (count == 0) {
        return;
    }

    size_t thread_count = std::min(max_workers_, count);
    if (thread_count == 1) {
        for (size_t i = 0; i < count; ++i) {
            task(i);
        }
        return;
    }

    std::atomic<size_t> next_index{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&] {
        while (!failed.load()) {
            size_t i = next_index.fetch_add(1);
            if (i >= count) {
                return;
            }
            try {
                task(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true);
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (size_t t = 0; t < thread_count; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace pyspot
