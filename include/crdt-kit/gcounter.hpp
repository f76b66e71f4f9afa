/// @file gcounter.hpp
/// @brief Grow-only counter (G-Counter) and its delta.

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace crdt_kit {

/// The per-replica counts a GCounter holds that a peer has not seen.
struct GCounterDelta {
    VersionVector counts;  ///< Only entries above the peer's known value.

    auto empty() const -> bool { return counts.empty(); }

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>;
    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> GCounterDelta;

    auto operator==(const GCounterDelta&) const -> bool = default;
};

/// A grow-only counter.
///
/// Each replica counts its own increments; the value is the sum over all
/// replicas and merge takes the per-replica maximum. A replica's own entry
/// never decreases.
///
/// @code
/// auto a = GCounter{"device-a"};
/// a.increment(5);
/// auto b = GCounter{"device-b"};
/// b.increment();
/// a.merge(b);  // a.value() == 6
/// @endcode
class GCounter {
public:
    using summary_type = VersionVector;
    using delta_type = GCounterDelta;

    GCounter() = default;

    /// Construct an empty counter owned by @p replica.
    explicit GCounter(ReplicaId replica) : replica_{std::move(replica)} {}

    /// Add @p n to this replica's count, saturating at UINT64_MAX.
    void increment(std::uint64_t n = 1);

    /// The sum of all replica counts, saturating at UINT64_MAX.
    auto value() const -> std::uint64_t;

    /// The count contributed by a specific replica.
    auto count_for(const ReplicaId& replica) const -> std::uint64_t {
        return counts_.get(replica);
    }

    /// All per-replica counts.
    auto counts() const -> const VersionVector& { return counts_; }

    auto replica() const -> const ReplicaId& { return replica_; }

    void merge(const GCounter& other);

    // -- Delta sync -----------------------------------------------------------

    /// What this replica knows: its per-replica counts.
    auto summary() const -> VersionVector { return counts_; }

    /// Entries where this replica is ahead of @p since.
    auto delta(const VersionVector& since) const -> GCounterDelta;

    void apply_delta(const GCounterDelta& delta);

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>;
    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> GCounter;

    /// Equal when the replicated counts are equal (owner id is not compared).
    auto operator==(const GCounter& other) const -> bool {
        return counts_ == other.counts_;
    }

private:
    friend class PNCounter;
    friend struct detail::StateAccess;

    ReplicaId replica_;
    VersionVector counts_;
};

}  // namespace crdt_kit
