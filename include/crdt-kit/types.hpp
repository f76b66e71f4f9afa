/// @file types.hpp
/// @brief Core identity types: ReplicaId, Tag, VersionVector.

#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crdt_kit {

/// A byte array value.
using Bytes = std::vector<std::byte>;

/// An opaque identifier for a replica.
///
/// Every replica that mutates CRDT state needs an identifier that is
/// unique among all replicas it will ever merge with. Uniqueness is the
/// caller's responsibility and is not checked.
///
/// Replica ids are totally ordered lexicographically on their unsigned
/// bytes (a strict prefix sorts first). This order is the deterministic
/// tie-break used by every type in the library.
struct ReplicaId {
    Bytes bytes;  ///< Raw identifier bytes.

    ReplicaId() = default;

    /// Construct from raw bytes.
    explicit ReplicaId(Bytes b) : bytes{std::move(b)} {}

    /// Construct from raw bytes.
    explicit ReplicaId(std::span<const std::byte> b) : bytes{b.begin(), b.end()} {}

    /// Construct from a human-readable name (convenience for apps and tests).
    ReplicaId(std::string_view name) {  // NOLINT(google-explicit-constructor)
        bytes.reserve(name.size());
        std::ranges::transform(name, std::back_inserter(bytes),
            [](char c) { return static_cast<std::byte>(c); });
    }

    ReplicaId(const char* name) : ReplicaId{std::string_view{name}} {}  // NOLINT

    auto operator<=>(const ReplicaId&) const = default;
    auto operator==(const ReplicaId&) const -> bool = default;

    /// True if the id has no bytes.
    auto empty() const -> bool { return bytes.empty(); }

    /// Lowercase hex rendering of the raw bytes.
    auto to_hex() const -> std::string;

    /// The raw bytes as text when printable ASCII, otherwise hex.
    auto to_string() const -> std::string;

    /// Parse a hex rendering produced by to_hex().
    /// @throws std::invalid_argument on odd length or non-hex characters.
    static auto from_hex(std::string_view hex) -> ReplicaId;
};

/// A unique identifier minted per logical operation: (counter, replica).
///
/// Tags are namespaced by replica id, so replicas mint them without any
/// coordination. Ordered by counter first, then replica.
struct Tag {
    std::uint64_t counter{0};  ///< Per-replica increasing counter.
    ReplicaId replica{};       ///< The replica that minted this tag.

    Tag() = default;
    Tag(std::uint64_t c, ReplicaId r) : counter{c}, replica{std::move(r)} {}

    auto operator<=>(const Tag&) const = default;
    auto operator==(const Tag&) const -> bool = default;
};

/// A version vector: replica -> number of events observed from it.
///
/// Zero entries are never stored, so two vectors that describe the same
/// causal history always compare equal.
class VersionVector {
public:
    using map_type = std::map<ReplicaId, std::uint64_t>;
    using const_iterator = map_type::const_iterator;

    VersionVector() = default;
    VersionVector(std::initializer_list<std::pair<const ReplicaId, std::uint64_t>> init);

    /// Counter for a replica (0 if never seen).
    auto get(const ReplicaId& replica) const -> std::uint64_t;

    /// Set a replica's counter. Setting 0 erases the entry.
    void set(const ReplicaId& replica, std::uint64_t value);

    /// Bump a replica's counter by one and return the new value.
    auto increment(const ReplicaId& replica) -> std::uint64_t;

    /// Pointwise maximum with another vector.
    void merge(const VersionVector& other);

    /// True if this vector is >= other in every component.
    auto dominates(const VersionVector& other) const -> bool;

    /// True if this vector dominates other and differs from it.
    auto strictly_dominates(const VersionVector& other) const -> bool;

    /// True if neither vector dominates the other.
    auto concurrent_with(const VersionVector& other) const -> bool;

    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }
    auto begin() const -> const_iterator { return entries_.begin(); }
    auto end() const -> const_iterator { return entries_.end(); }

    auto operator<=>(const VersionVector&) const = default;
    auto operator==(const VersionVector&) const -> bool = default;

private:
    map_type entries_;
};

}  // namespace crdt_kit

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<crdt_kit::ReplicaId> {
    auto operator()(const crdt_kit::ReplicaId& id) const noexcept -> std::size_t {
        // FNV-1a over the id bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<crdt_kit::Tag> {
    auto operator()(const crdt_kit::Tag& tag) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(tag.counter);
        auto h2 = std::hash<crdt_kit::ReplicaId>{}(tag.replica);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
