/// @file state_access.hpp
/// @brief Read/write access to replicated state for serializers (json.hpp).
///
/// Every CRDT type befriends detail::StateAccess. The accessors below are
/// resolved by member name, so each one applies to whichever types carry
/// that member. Not part of the stable API.

#pragma once

namespace crdt_kit::detail {

struct StateAccess {
    template <typename C>
    static auto replica(C& c) -> decltype((c.replica_)) { return c.replica_; }

    template <typename C>
    static auto counter(C& c) -> decltype((c.counter_)) { return c.counter_; }

    template <typename C>
    static auto counts(C& c) -> decltype((c.counts_)) { return c.counts_; }

    template <typename C>
    static auto increments(C& c) -> decltype((c.increments_)) { return c.increments_; }

    template <typename C>
    static auto decrements(C& c) -> decltype((c.decrements_)) { return c.decrements_; }

    template <typename C>
    static auto elements(C& c) -> decltype((c.elements_)) { return c.elements_; }

    template <typename C>
    static auto added(C& c) -> decltype((c.added_)) { return c.added_; }

    template <typename C>
    static auto removed(C& c) -> decltype((c.removed_)) { return c.removed_; }

    template <typename C>
    static auto tombstones(C& c) -> decltype((c.tombstones_)) { return c.tombstones_; }

    template <typename C>
    static auto entry(C& c) -> decltype((c.entry_)) { return c.entry_; }

    template <typename C>
    static auto entries(C& c) -> decltype((c.entries_)) { return c.entries_; }

    template <typename C>
    static auto version(C& c) -> decltype((c.version_)) { return c.version_; }

    template <typename C>
    static auto nodes(C& c) -> decltype((c.nodes_)) { return c.nodes_; }

    template <typename C>
    static auto chars(C& c) -> decltype((c.chars_)) { return c.chars_; }

    /// Recompute derived indexes after nodes were replaced wholesale.
    template <typename C>
    static auto rebuild(C& c) -> decltype(c.rebuild_sequence()) { return c.rebuild_sequence(); }

    template <typename C>
    static auto reindex(C& c) -> decltype(c.reindex()) { return c.reindex(); }

    template <typename C, typename TagT>
    static auto minted_in_range(const C& c, const TagT& tag) -> bool { return c.minted_in_range(tag); }
};

}  // namespace crdt_kit::detail
