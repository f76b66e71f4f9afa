/// @file pncounter.hpp
/// @brief Positive-negative counter (PN-Counter) and its delta.

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/gcounter.hpp>
#include <crdt-kit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace crdt_kit {

/// What a peer knows of each PNCounter component.
struct PNCounterSummary {
    VersionVector increments;
    VersionVector decrements;

    auto operator==(const PNCounterSummary&) const -> bool = default;
};

/// Deltas of both PNCounter components.
struct PNCounterDelta {
    GCounterDelta increments;
    GCounterDelta decrements;

    auto empty() const -> bool { return increments.empty() && decrements.empty(); }

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>;
    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> PNCounterDelta;

    auto operator==(const PNCounterDelta&) const -> bool = default;
};

/// A counter supporting increment and decrement.
///
/// Two GCounters, one per direction. The value is increments - decrements;
/// each component converges independently.
class PNCounter {
public:
    using summary_type = PNCounterSummary;
    using delta_type = PNCounterDelta;

    PNCounter() = default;

    /// Construct an empty counter owned by @p replica.
    explicit PNCounter(const ReplicaId& replica)
        : increments_{replica}, decrements_{replica} {}

    void increment(std::uint64_t n = 1) { increments_.increment(n); }
    void decrement(std::uint64_t n = 1) { decrements_.increment(n); }

    /// increments - decrements, clamped to the std::int64_t range.
    auto value() const -> std::int64_t;

    auto increments() const -> const GCounter& { return increments_; }
    auto decrements() const -> const GCounter& { return decrements_; }

    auto replica() const -> const ReplicaId& { return increments_.replica(); }

    void merge(const PNCounter& other);

    // -- Delta sync -----------------------------------------------------------

    auto summary() const -> PNCounterSummary;
    auto delta(const PNCounterSummary& since) const -> PNCounterDelta;
    void apply_delta(const PNCounterDelta& delta);

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>;
    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> PNCounter;

    auto operator==(const PNCounter&) const -> bool = default;

private:
    friend struct detail::StateAccess;

    GCounter increments_;
    GCounter decrements_;
};

}  // namespace crdt_kit
