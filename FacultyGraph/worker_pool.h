#pragma once

#include <vector>
#include <future>
#include <atomic>
#include <functional>
#include <exception>
#include <algorithm>

#include "log_utils.h"

using namespace std;

// Applies fn to every item with at most `workers` calls in flight.
// Results keep the input order. A call that throws leaves a value-initialised slot.
template <typename T, typename R>
vector<R> parallelMap(const vector<T>& items, size_t workers, const function<R(const T&)>& fn) {
    vector<R> results(items.size());
    if (items.empty()) return results;
    size_t poolSize = max<size_t>(1, min(workers, items.size()));
    atomic<size_t> next{ 0 };

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= items.size()) break;
            try {
                results[i] = fn(items[i]);
            }
            catch (const std::exception& e) {
                logWarn("worker", string("task failed: ") + e.what());
            }
        }
    };

    vector<future<void>> running;
    running.reserve(poolSize);
    for (size_t w = 0; w < poolSize; ++w) {
        running.push_back(async(launch::async, worker));
    }
    for (auto& f : running) f.get();
    return results;
}
