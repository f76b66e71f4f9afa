/// @file lww_register.hpp
/// @brief Last-writer-wins register (LWW-Register).

#pragma once

#include <crdt-kit/clock.hpp>
#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/encoding/value_codec.hpp>
#include <crdt-kit/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <tuple>
#include <vector>

namespace crdt_kit {

/// A single-value register resolved by (timestamp, writer replica).
///
/// Merge keeps the write whose (timestamp, writer) pair is lexicographically
/// greatest, using the ReplicaId byte order to break exact timestamp ties.
/// An empty register loses to any written one. Two writes with the same
/// timestamp and writer must carry the same value; the library does not
/// check this.
template <typename T>
class LWWRegister {
public:
    using value_type = T;

    /// A write: the value plus the (timestamp, writer) pair that orders it.
    struct Entry {
        T value;
        HybridTimestamp timestamp;
        ReplicaId writer;

        auto operator==(const Entry&) const -> bool = default;
    };

    LWWRegister() = default;

    /// Construct an empty register owned by @p replica.
    explicit LWWRegister(ReplicaId replica) : replica_{std::move(replica)} {}

    /// Construct a register holding @p value written at @p timestamp.
    LWWRegister(ReplicaId replica, T value, HybridTimestamp timestamp)
        : replica_{std::move(replica)} {
        entry_ = Entry{.value = std::move(value), .timestamp = timestamp, .writer = replica_};
    }

    /// Write @p value at an explicit timestamp.
    /// @return true if the write took effect, false if the register already
    ///   holds a write ordered after (timestamp, this replica).
    auto set(T value, HybridTimestamp timestamp) -> bool {
        if (entry_ && ordered_after(entry_->timestamp, entry_->writer, timestamp, replica_)) {
            return false;
        }
        entry_ = Entry{.value = std::move(value), .timestamp = timestamp, .writer = replica_};
        return true;
    }

    /// Write @p value stamped by @p clock.
    ///
    /// The clock first observes the current timestamp, so the new write is
    /// ordered after everything this register has already merged.
    auto set(T value, HybridClock& clock) -> HybridTimestamp {
        const auto ts = entry_ ? clock.receive(entry_->timestamp) : clock.now();
        entry_ = Entry{.value = std::move(value), .timestamp = ts, .writer = replica_};
        return ts;
    }

    /// The current value, or nullopt if nothing was ever written.
    auto value() const -> std::optional<T> {
        if (!entry_) return std::nullopt;
        return entry_->value;
    }

    /// Timestamp of the current write (zero if empty).
    auto timestamp() const -> HybridTimestamp {
        return entry_ ? entry_->timestamp : HybridTimestamp{};
    }

    /// The replica that wrote the current value, or nullopt if empty.
    auto writer() const -> std::optional<ReplicaId> {
        if (!entry_) return std::nullopt;
        return entry_->writer;
    }

    auto entry() const -> const std::optional<Entry>& { return entry_; }

    auto replica() const -> const ReplicaId& { return replica_; }

    void merge(const LWWRegister& other) {
        if (!other.entry_) return;
        if (!entry_ || ordered_after(other.entry_->timestamp, other.entry_->writer,
                                     entry_->timestamp, entry_->writer)) {
            entry_ = other.entry_;
        }
    }

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>
        requires encoding::Encodable<T> {
        auto s = encoding::Serializer{};
        s.write_replica_id(replica_);
        s.write_bool(entry_.has_value());
        if (entry_) {
            s.write_timestamp(entry_->timestamp);
            s.write_replica_id(entry_->writer);
            encoding::write_value(s, entry_->value);
        }
        return encode_envelope(CrdtType::lww_register, s.data(), options);
    }

    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> LWWRegister
        requires encoding::Encodable<T> {
        const auto payload = decode_envelope(data, CrdtType::lww_register, options);
        auto d = encoding::Deserializer{payload};
        auto reg = LWWRegister{d.read_replica_id()};
        if (d.read_bool()) {
            auto ts = d.read_timestamp();
            auto writer = d.read_replica_id();
            auto value = encoding::read_value<T>(d);
            reg.entry_ = Entry{.value = std::move(value), .timestamp = ts, .writer = std::move(writer)};
        }
        d.expect_end();
        return reg;
    }

    /// Equal when both hold the same write (owner id is not compared).
    auto operator==(const LWWRegister& other) const -> bool {
        return entry_ == other.entry_;
    }

private:
    friend struct detail::StateAccess;

    static auto ordered_after(const HybridTimestamp& ts_a, const ReplicaId& writer_a,
                              const HybridTimestamp& ts_b, const ReplicaId& writer_b) -> bool {
        return std::tie(ts_a, writer_a) > std::tie(ts_b, writer_b);
    }

    ReplicaId replica_;
    std::optional<Entry> entry_;
};

}  // namespace crdt_kit
