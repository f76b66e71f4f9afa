#pragma once

// Byte stream deserializer for crdt-kit payloads.
//
// Every read either returns a complete value or throws DecodeError; a
// partially decoded replica is never handed back to the caller.

#include <crdt-kit/clock.hpp>
#include <crdt-kit/error.hpp>
#include <crdt-kit/types.hpp>
#include <crdt-kit/encoding/leb128.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <vector>

namespace crdt_kit::encoding {

class Deserializer {
public:
    explicit Deserializer(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_byte() -> std::byte {
        if (pos_ >= data_.size()) truncated("byte");
        return data_[pos_++];
    }

    auto read_u8() -> std::uint8_t {
        return static_cast<std::uint8_t>(read_byte());
    }

    auto read_bool() -> bool {
        auto v = read_u8();
        if (v > 1) malformed("boolean out of range");
        return v == 1;
    }

    auto read_bytes(std::size_t n) -> std::span<const std::byte> {
        if (n > remaining()) truncated("byte run");
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::uint64_t { return read_integer<std::uint64_t>(); }
    auto read_sleb128() -> std::int64_t { return read_integer<std::int64_t>(); }

    /// LEB128 value that must fit @p T.
    template <std::integral T>
    auto read_integer() -> T {
        auto r = read_leb128<T>(data_.subspan(pos_));
        switch (r.status) {
            case Leb128Status::ok:
                break;
            case Leb128Status::truncated:
                truncated("LEB128 integer");
            case Leb128Status::overflow:
                malformed("LEB128 integer out of range at offset " + std::to_string(pos_));
        }
        pos_ += r.bytes_read;
        return r.value;
    }

    // Reads an element count and checks it against the bytes left, assuming
    // every element occupies at least one byte. Guards against huge reserves.
    auto read_count() -> std::size_t {
        auto n = read_uleb128();
        if (n > remaining()) {
            malformed("element count " + std::to_string(n) + " exceeds remaining input");
        }
        return static_cast<std::size_t>(n);
    }

    auto read_f64() -> double {
        auto bits = std::uint64_t{0};
        auto raw = read_bytes(8);
        for (int i = 0; i < 8; ++i) {
            bits |= static_cast<std::uint64_t>(raw[static_cast<std::size_t>(i)]) << (i * 8);
        }
        auto v = 0.0;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    auto read_string() -> std::string {
        auto len = read_uleb128();
        auto bytes = read_bytes(checked_size(len));
        return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    auto read_length_prefixed() -> std::vector<std::byte> {
        auto len = read_uleb128();
        auto bytes = read_bytes(checked_size(len));
        return {bytes.begin(), bytes.end()};
    }

    auto read_replica_id() -> ReplicaId {
        return ReplicaId{read_length_prefixed()};
    }

    auto read_tag() -> Tag {
        auto counter = read_uleb128();
        return Tag{counter, read_replica_id()};
    }

    auto read_timestamp() -> HybridTimestamp {
        auto physical = read_uleb128();
        auto logical = read_integer<std::uint32_t>();
        return HybridTimestamp{.physical = physical, .logical = logical};
    }

    auto read_version_vector() -> VersionVector {
        auto vv = VersionVector{};
        auto n = read_count();
        for (std::size_t i = 0; i < n; ++i) {
            auto replica = read_replica_id();
            auto counter = read_uleb128();
            if (counter == 0) malformed("zero entry in version vector");
            vv.set(replica, counter);
        }
        return vv;
    }

    // Fails if any input is left over.
    void expect_end() const {
        if (!at_end()) {
            throw DecodeError{ErrorKind::trailing_bytes,
                std::to_string(remaining()) + " bytes after end of payload"};
        }
    }

    [[noreturn]] void malformed(const std::string& what) const {
        throw DecodeError{ErrorKind::malformed_payload,
            what + " at offset " + std::to_string(pos_)};
    }

private:
    [[noreturn]] void truncated(const char* what) const {
        throw DecodeError{ErrorKind::truncated_input,
            std::string{"unexpected end of input reading "} + what +
            " at offset " + std::to_string(pos_)};
    }

    auto checked_size(std::uint64_t len) const -> std::size_t {
        if (len > remaining()) truncated("length-prefixed data");
        return static_cast<std::size_t>(len);
    }

    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace crdt_kit::encoding
