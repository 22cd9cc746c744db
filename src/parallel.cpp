#include "vidstore/parallel.hpp"

#include "vidstore/env.hpp"

namespace vidstore::parallel {

std::size_t ResolveWorkers(std::size_t max_tasks) {
    std::size_t cap = std::max<std::size_t>(1, max_tasks);
    std::uint64_t parsed = env::GetUnsigned("VIDSTORE_WORKERS", 0);
    if (parsed > 0) {
        return std::min(static_cast<std::size_t>(parsed), cap);
    }
    unsigned int hw = std::thread::hardware_concurrency();
    std::size_t workers = hw > 0 ? static_cast<std::size_t>(hw) : 1;
    return std::min(workers, cap);
}

}  // namespace vidstore::parallel
