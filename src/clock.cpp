#include <crdt-kit/clock.hpp>

#include <algorithm>
#include <chrono>
#include <limits>

namespace crdt_kit {

auto system_time_ms() -> std::uint64_t {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
    return ms > 0 ? static_cast<std::uint64_t>(ms) : 0;
}

HybridClock::HybridClock() : source_{system_time_ms} {}

HybridClock::HybridClock(TimeSource source) : source_{std::move(source)} {}

namespace {

// The next timestamp after @p t. A saturated logical counter carries into
// the physical component so ordering is never lost.
auto successor(const HybridTimestamp& t) -> HybridTimestamp {
    if (t.logical == std::numeric_limits<std::uint32_t>::max()) {
        return HybridTimestamp{.physical = t.physical + 1, .logical = 0};
    }
    return HybridTimestamp{.physical = t.physical, .logical = t.logical + 1};
}

}  // anonymous namespace

auto HybridClock::now() -> HybridTimestamp {
    const auto pt = source_();
    last_ = pt > last_.physical ? HybridTimestamp{.physical = pt, .logical = 0} : successor(last_);
    return last_;
}

auto HybridClock::receive(const HybridTimestamp& remote) -> HybridTimestamp {
    const auto pt = source_();
    const auto latest = std::max(last_, remote);
    last_ = pt > latest.physical ? HybridTimestamp{.physical = pt, .logical = 0} : successor(latest);
    return last_;
}

}  // namespace crdt_kit
