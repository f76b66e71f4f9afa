/// @file crdt.hpp
/// @brief Capability contracts shared by every CRDT type: Crdt and DeltaCrdt.

#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <vector>

namespace crdt_kit {

namespace detail {
struct StateAccess;
}  // namespace detail

/// A state-based CRDT.
///
/// `merge` computes the least upper bound of two states in place. It must be
/// idempotent (`merge(a, a) == a`), commutative and associative, never fail
/// and never allocate beyond the union of both inputs. `value` is a pure
/// projection. `encode`/`decode` round-trip every piece of merge metadata.
template <typename T>
concept Crdt = std::copyable<T> && std::equality_comparable<T> &&
    requires(T& local, const T& other, std::span<const std::byte> bytes) {
        local.merge(other);
        other.value();
        { other.encode() } -> std::same_as<std::vector<std::byte>>;
        { T::decode(bytes) } -> std::same_as<T>;
    };

/// A CRDT that can ship only the part of its state a peer has not seen.
///
/// `summary()` describes what a replica already knows. On another replica,
/// `delta(summary)` returns the changes missing from it, and
/// `apply_delta(d)` on the summarized replica yields exactly
/// `merge(summarized, producer)`. Applying a delta twice is a no-op.
template <typename T>
concept DeltaCrdt = Crdt<T> &&
    requires(T& local, const T& other,
             const typename T::summary_type& summary,
             const typename T::delta_type& delta,
             std::span<const std::byte> bytes) {
        { other.summary() } -> std::same_as<typename T::summary_type>;
        { other.delta(summary) } -> std::same_as<typename T::delta_type>;
        local.apply_delta(delta);
        { delta.encode() } -> std::same_as<std::vector<std::byte>>;
        { T::delta_type::decode(bytes) } -> std::same_as<typename T::delta_type>;
    };

/// Merge two states without modifying either input.
template <Crdt T>
auto merged(T local, const T& other) -> T {
    local.merge(other);
    return local;
}

}  // namespace crdt_kit
