#pragma once

#include <future>
#include <numeric>
#include <vector>

#include <oneapi/tbb/parallel_for_each.h>

namespace ithim::core {

/// @brief Run a given function asynchronous
/// @tparam F Function type
/// @tparam ...Ts Function parameters type
/// @param action The action to run
/// @param ...params The action parameters
/// @return The std::future referring to the function call.
template <class F, class... Ts> auto run_async(F &&action, Ts &&...params) {
    return std::async(std::launch::async, std::forward<F>(action), std::forward<Ts>(params)...);
};

/// @brief Parallel for each over an indexed accessed containers
/// @tparam Index Iterator type
/// @tparam UnaryFunction Function type
/// @param first The first element index
/// @param last The last element index, inclusive
/// @param func The function object to apply
/// @return none
template <class Index, class UnaryFunction>
auto parallel_for(Index first, Index last, UnaryFunction func) {
    auto range = std::vector<size_t>(last - first + 1);
    std::iota(range.begin(), range.end(), first);
    tbb::parallel_for_each(range.begin(), range.end(), std::move(func));
}

} // namespace ithim::core
