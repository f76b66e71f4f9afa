#include <crdt-kit/gcounter.hpp>

#include <crdt-kit/encoding/deserializer.hpp>
#include <crdt-kit/encoding/serializer.hpp>

#include <limits>
#include <numeric>

namespace crdt_kit {

namespace {

constexpr auto counter_max = std::numeric_limits<std::uint64_t>::max();

auto saturating_add(std::uint64_t a, std::uint64_t b) -> std::uint64_t {
    return b > counter_max - a ? counter_max : a + b;
}

}  // anonymous namespace

void GCounter::increment(std::uint64_t n) {
    if (n == 0) return;
    counts_.set(replica_, saturating_add(counts_.get(replica_), n));
}

auto GCounter::value() const -> std::uint64_t {
    return std::accumulate(counts_.begin(), counts_.end(), std::uint64_t{0},
        [](std::uint64_t sum, const auto& entry) { return saturating_add(sum, entry.second); });
}

void GCounter::merge(const GCounter& other) {
    counts_.merge(other.counts_);
}

auto GCounter::delta(const VersionVector& since) const -> GCounterDelta {
    auto result = GCounterDelta{};
    for (const auto& [replica, count] : counts_) {
        if (count > since.get(replica)) {
            result.counts.set(replica, count);
        }
    }
    return result;
}

void GCounter::apply_delta(const GCounterDelta& delta) {
    counts_.merge(delta.counts);
}

auto GCounter::encode(const CodecOptions& options) const -> std::vector<std::byte> {
    auto s = encoding::Serializer{};
    s.write_replica_id(replica_);
    s.write_version_vector(counts_);
    return encode_envelope(CrdtType::gcounter, s.data(), options);
}

auto GCounter::decode(std::span<const std::byte> data,
                      const CodecOptions& options) -> GCounter {
    const auto payload = decode_envelope(data, CrdtType::gcounter, options);
    auto d = encoding::Deserializer{payload};
    auto counter = GCounter{d.read_replica_id()};
    counter.counts_ = d.read_version_vector();
    d.expect_end();
    return counter;
}

// -- GCounterDelta ------------------------------------------------------------

auto GCounterDelta::encode(const CodecOptions& options) const -> std::vector<std::byte> {
    auto s = encoding::Serializer{};
    s.write_version_vector(counts);
    return encode_envelope(CrdtType::gcounter_delta, s.data(), options);
}

auto GCounterDelta::decode(std::span<const std::byte> data,
                           const CodecOptions& options) -> GCounterDelta {
    const auto payload = decode_envelope(data, CrdtType::gcounter_delta, options);
    auto d = encoding::Deserializer{payload};
    auto delta = GCounterDelta{.counts = d.read_version_vector()};
    d.expect_end();
    return delta;
}

}  // namespace crdt_kit
