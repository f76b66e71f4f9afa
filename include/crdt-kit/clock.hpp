/// @file clock.hpp
/// @brief Hybrid Logical Clock (HLC): HybridTimestamp and HybridClock.

#pragma once

#include <compare>
#include <cstdint>
#include <functional>

namespace crdt_kit {

/// A timestamp issued by a HybridClock: (physical milliseconds, logical).
///
/// Ordered lexicographically. The logical counter orders events that share
/// a physical millisecond, and carries causality forward when a remote
/// clock is ahead of the local physical source.
struct HybridTimestamp {
    std::uint64_t physical{0};  ///< Physical time component (milliseconds).
    std::uint32_t logical{0};   ///< Counter for same-millisecond ordering.

    auto operator<=>(const HybridTimestamp&) const = default;
    auto operator==(const HybridTimestamp&) const -> bool = default;
};

/// A source of physical time in milliseconds.
using TimeSource = std::function<std::uint64_t()>;

/// Milliseconds since the Unix epoch, read from the system clock.
auto system_time_ms() -> std::uint64_t;

/// A Hybrid Logical Clock for a single replica.
///
/// Timestamps returned by now() and receive() are strictly increasing for
/// the lifetime of the clock, even if the physical source goes backward.
/// When the logical component would pass UINT32_MAX it carries into the
/// physical component instead.
/// The time source is injectable so tests can replay exact scenarios.
///
/// @code
/// auto clock = HybridClock{[] { return std::uint64_t{5000}; }};
/// auto t1 = clock.now();              // {5000, 0}
/// auto t2 = clock.now();              // {5000, 1}
/// auto t3 = clock.receive({9000, 3}); // {9000, 4}
/// @endcode
class HybridClock {
public:
    /// Construct a clock reading the system clock.
    HybridClock();

    /// Construct a clock with a custom physical time source.
    explicit HybridClock(TimeSource source);

    /// Generate a timestamp for a local event (or for sending).
    auto now() -> HybridTimestamp;

    /// Update the clock upon receiving a remote timestamp.
    /// @return A timestamp strictly greater than both the last local
    ///   timestamp and @p remote.
    auto receive(const HybridTimestamp& remote) -> HybridTimestamp;

    /// The last timestamp issued by this clock.
    auto last() const -> HybridTimestamp { return last_; }

private:
    TimeSource source_;
    HybridTimestamp last_{};
};

}  // namespace crdt_kit
