#pragma once

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include "common/Logger.h"

namespace ustw {
namespace engine {

struct ThreadSpawner {
    template <typename Fn>
    std::thread operator()(Fn&& fn) const {
        return std::thread(std::forward<Fn>(fn));
    }
};

// Runs job(i) once for every i in [0, count) on up to `workers` threads.
// A thread that cannot be started is not fatal: the calling thread drains
// the remaining indices itself. Returns the number of threads started.
template <typename Job, typename Spawner = ThreadSpawner>
size_t parallelFor(size_t count, size_t workers, Job job, Spawner spawn = Spawner()) {
    if (count == 0) {
        return 0;
    }
    std::atomic<size_t> next{0};
    auto drain = [&]() {
        for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            job(i);
        }
    };

    const size_t wanted = std::max<size_t>(1, std::min(workers, count));
    std::vector<std::thread> threads;
    threads.reserve(wanted);
    try {
        for (size_t w = 0; w < wanted; ++w) {
            threads.push_back(spawn(drain));
        }
    } catch (const std::system_error& e) {
        LOG_WARN("Worker thread start failed after {} of {}: {}", threads.size(), wanted, e.what());
        drain();
    }
    for (auto& t : threads) {
        t.join();
    }
    return threads.size();
}

} // namespace engine
} // namespace ustw
