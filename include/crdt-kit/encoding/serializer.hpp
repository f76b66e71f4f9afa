#pragma once

// Byte stream serializer for crdt-kit payloads.

#include <crdt-kit/clock.hpp>
#include <crdt-kit/types.hpp>
#include <crdt-kit/encoding/leb128.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace crdt_kit::encoding {

class Serializer {
public:
    void write_byte(std::byte b) {
        data_.push_back(b);
    }

    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bool(bool v) {
        write_u8(v ? 1 : 0);
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_raw_bytes(const void* ptr, std::size_t n) {
        auto* p = static_cast<const std::byte*>(ptr);
        data_.insert(data_.end(), p, p + n);
    }

    void write_uleb128(std::uint64_t value) {
        write_leb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        write_leb128(value, data_);
    }

    // IEEE-754 bits, little-endian regardless of host order.
    void write_f64(double v) {
        auto bits = std::uint64_t{0};
        std::memcpy(&bits, &v, sizeof(v));
        for (int i = 0; i < 8; ++i) {
            write_u8(static_cast<std::uint8_t>(bits >> (i * 8)));
        }
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    void write_length_prefixed(std::span<const std::byte> bytes) {
        write_uleb128(bytes.size());
        write_bytes(bytes);
    }

    void write_replica_id(const ReplicaId& id) {
        write_length_prefixed(id.bytes);
    }

    void write_tag(const Tag& tag) {
        write_uleb128(tag.counter);
        write_replica_id(tag.replica);
    }

    void write_timestamp(const HybridTimestamp& ts) {
        write_uleb128(ts.physical);
        write_uleb128(ts.logical);
    }

    void write_version_vector(const VersionVector& vv) {
        write_uleb128(vv.size());
        for (const auto& [replica, counter] : vv) {
            write_replica_id(replica);
            write_uleb128(counter);
        }
    }

    auto size() const -> std::size_t { return data_.size(); }
    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace crdt_kit::encoding
