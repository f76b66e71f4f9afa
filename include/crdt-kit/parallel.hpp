/// @file parallel.hpp
/// @brief Merge many replica states at once, optionally on a Taskflow executor.

#pragma once

#include <crdt-kit/crdt.hpp>

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/reduce.hpp>

#include <span>

namespace crdt_kit {

/// Process-global executor sized to std::thread::hardware_concurrency().
/// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

/// Merge every state in @p states into the first one, in order.
/// @return A default-constructed T when @p states is empty.
template <Crdt T>
auto merge_all(std::span<const T> states) -> T {
    if (states.empty()) return T{};
    auto result = states.front();
    for (const auto& s : states.subspan(1)) result.merge(s);
    return result;
}

/// Merge every state in @p states into one as a parallel reduction.
///
/// Any grouping of the merges gives the same result because merge is
/// associative, commutative and idempotent. Which input's owner id the
/// result carries is not specified.
///
/// @code
/// auto replicas = std::vector<GCounter>{...};
/// auto combined = merge_all<GCounter>(replicas, global_executor());
/// @endcode
template <Crdt T>
auto merge_all(std::span<const T> states, tf::Executor& executor) -> T {
    if (states.size() < 2) return merge_all(states);

    auto result = states.front();
    auto taskflow = tf::Taskflow{};
    taskflow.reduce(states.begin() + 1, states.end(), result,
        [](T lhs, const T& rhs) {
            lhs.merge(rhs);
            return lhs;
        });
    executor.run(taskflow).wait();
    return result;
}

}  // namespace crdt_kit
