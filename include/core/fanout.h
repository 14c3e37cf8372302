#pragma once

#include <algorithm>
#include <exception>
#include <future>
#include <type_traits>
#include <vector>

#include "infrastructure/error_handling.h"
#include "utils/thread_pool.h"

namespace liarslie::core {

// Runs fn over every item on a private worker pool and joins all of them.
// fn returns a Result; a task that throws is reported as TASK_FAILURE in its slot.
// The output is index-aligned with items.
template<typename Item, typename Fn>
auto fanOut(const std::vector<Item>& items, size_t maxThreads, Fn fn)
    -> std::vector<std::invoke_result_t<Fn&, const Item&>> {
    using R = std::invoke_result_t<Fn&, const Item&>;
    std::vector<R> results;
    if (items.empty()) return results;

    std::vector<std::future<R>> futures;
    futures.reserve(items.size());
    {
        utils::ThreadPool pool(std::max<size_t>(1, std::min(items.size(), maxThreads)));
        for (const auto& item : items) {
            const Item* p = &item;
            futures.push_back(pool.submit([&fn, p]() { return fn(*p); }));
        }
        for (auto& f : futures) f.wait();
    }

    results.reserve(items.size());
    for (auto& f : futures) {
        try {
            results.push_back(f.get());
        } catch (const std::exception& e) {
            results.push_back(R(makeError(ErrorCode::TASK_FAILURE, e.what())));
        }
    }
    return results;
}

}
