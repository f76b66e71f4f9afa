#include <crdt-kit/pncounter.hpp>

#include <crdt-kit/encoding/deserializer.hpp>
#include <crdt-kit/encoding/serializer.hpp>

#include <limits>

namespace crdt_kit {

auto PNCounter::value() const -> std::int64_t {
    constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    const auto up = increments_.value();
    const auto down = decrements_.value();
    if (up >= down) {
        const auto diff = up - down;
        return diff > max ? std::numeric_limits<std::int64_t>::max() : static_cast<std::int64_t>(diff);
    }
    // |INT64_MIN| is max + 1
    const auto diff = down - up;
    return diff > max ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(diff);
}

void PNCounter::merge(const PNCounter& other) {
    increments_.merge(other.increments_);
    decrements_.merge(other.decrements_);
}

auto PNCounter::summary() const -> PNCounterSummary {
    return PNCounterSummary{.increments = increments_.summary(),
                            .decrements = decrements_.summary()};
}

auto PNCounter::delta(const PNCounterSummary& since) const -> PNCounterDelta {
    return PNCounterDelta{.increments = increments_.delta(since.increments),
                          .decrements = decrements_.delta(since.decrements)};
}

void PNCounter::apply_delta(const PNCounterDelta& delta) {
    increments_.apply_delta(delta.increments);
    decrements_.apply_delta(delta.decrements);
}

auto PNCounter::encode(const CodecOptions& options) const -> std::vector<std::byte> {
    auto s = encoding::Serializer{};
    s.write_replica_id(replica());
    s.write_version_vector(increments_.counts_);
    s.write_version_vector(decrements_.counts_);
    return encode_envelope(CrdtType::pncounter, s.data(), options);
}

auto PNCounter::decode(std::span<const std::byte> data,
                       const CodecOptions& options) -> PNCounter {
    const auto payload = decode_envelope(data, CrdtType::pncounter, options);
    auto d = encoding::Deserializer{payload};
    auto counter = PNCounter{d.read_replica_id()};
    counter.increments_.counts_ = d.read_version_vector();
    counter.decrements_.counts_ = d.read_version_vector();
    d.expect_end();
    return counter;
}

// -- PNCounterDelta -----------------------------------------------------------

auto PNCounterDelta::encode(const CodecOptions& options) const -> std::vector<std::byte> {
    auto s = encoding::Serializer{};
    s.write_version_vector(increments.counts);
    s.write_version_vector(decrements.counts);
    return encode_envelope(CrdtType::pncounter_delta, s.data(), options);
}

auto PNCounterDelta::decode(std::span<const std::byte> data,
                            const CodecOptions& options) -> PNCounterDelta {
    const auto payload = decode_envelope(data, CrdtType::pncounter_delta, options);
    auto d = encoding::Deserializer{payload};
    auto delta = PNCounterDelta{};
    delta.increments.counts = d.read_version_vector();
    delta.decrements.counts = d.read_version_vector();
    d.expect_end();
    return delta;
}

}  // namespace crdt_kit
