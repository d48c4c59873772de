#pragma once

#include <cstddef>
#include <thread>
#include <vector>

namespace linkguard {

// Runs fn(i) for every i in [0, n) on its own thread and joins all of them before returning.
// fn must write its output to storage addressed by i.
template <class Fn>
void FanOut(std::size_t n, Fn&& fn) {
    std::vector<std::thread> workers;
    workers.reserve(n);
    try {
        for (std::size_t i = 0; i < n; ++i) {
            workers.emplace_back([&fn, i] { fn(i); });
        }
    } catch (...) {
        for (auto& t : workers) {
            t.join();
        }
        throw;
    }
    for (auto& t : workers) {
        t.join();
    }
}

} // namespace linkguard
