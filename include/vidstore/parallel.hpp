#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace vidstore::parallel {

// VIDSTORE_WORKERS, else hardware concurrency, capped at max_tasks.
std::size_t ResolveWorkers(std::size_t max_tasks);

// Runs fn(worker, index) for every index in [0, count). Indices are claimed in order, so
// once an index fails every lower index has still run; the exception from the lowest
// failing index is rethrown on the calling thread after all workers stop.
template <typename Fn>
void ParallelFor(std::size_t count, std::size_t workers, Fn&& fn) {
    workers = std::min(workers, count);
    if (count == 0) {
        return;
    }
    if (workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(std::size_t{0}, i);
        }
        return;
    }
    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::size_t first_error_index = count;
    std::mutex error_mutex;
    std::vector<std::thread> threads;
    threads.reserve(workers);
    auto join_all = [&threads]() {
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    };
    try {
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&, w]() {
                while (!failed.load()) {
                    std::size_t idx = next.fetch_add(1);
                    if (idx >= count) {
                        break;
                    }
                    try {
                        fn(w, idx);
                    } catch (...) {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (idx < first_error_index) {
                            first_error = std::current_exception();
                            first_error_index = idx;
                        }
                        failed.store(true);
                    }
                }
            });
        }
    } catch (...) {
        failed.store(true);
        join_all();
        throw;
    }
    join_all();
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace vidstore::parallel
