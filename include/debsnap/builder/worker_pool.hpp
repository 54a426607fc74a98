#pragma once

#include "debsnap/util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

namespace debsnap {

// Upper bound for a configured worker count.
inline constexpr unsigned kMaxJobs = 1024;

// Configured worker count, or the detected core count when 0. Never below 1.
inline unsigned ResolveJobs(unsigned configured) {
    if (configured > 0) return configured;
    return std::max(1u, std::thread::hardware_concurrency());
}

// Runs fn over every item on at most `jobs` threads. Items are read-only;
// each result lands in the slot of its item, so no locking is needed on the
// result vector. fn must not throw.
template <typename Item, typename Fn>
auto RunBounded(const std::vector<Item>& items, unsigned jobs, Fn fn)
    -> std::vector<std::invoke_result_t<Fn&, const Item&>> {
    using R = std::invoke_result_t<Fn&, const Item&>;
    std::vector<R> results(items.size());
    if (items.empty()) return results;

    const size_t workers = std::min<size_t>(std::max(1u, jobs), items.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= items.size()) return;
            results[i] = fn(items[i]);
        }
    };

    if (workers == 1) {
        worker();
        return results;
    }

    // Threads that did start drain the whole cursor, so running short of
    // threads only costs parallelism.
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t t = 0; t < workers; ++t) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            LogWarn("started %zu of %zu workers: %s", threads.size(), workers, e.what());
            break;
        }
    }
    if (threads.empty()) worker();
    for (auto& th : threads) th.join();
    return results;
}

} // namespace debsnap
