#pragma once

// LEB128 (Little Endian Base 128) variable-length integers.
//
// Every integer in an envelope payload (counts, counters, lengths, clock
// components) is LEB128. Readers are width-aware: a value that does not
// fit the requested integer type is an overflow, which the deserializer
// reports as a malformed payload rather than as truncated input.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <type_traits>
#include <vector>

namespace crdt_kit::encoding {

/// Longest encoding of a 64-bit value.
inline constexpr std::size_t max_leb128_bytes = 10;

enum class Leb128Status : std::uint8_t {
    ok,
    truncated,  ///< input ended before the terminating byte
    overflow,   ///< value does not fit the requested type
};

/// Outcome of read_leb128(). `value` and `bytes_read` are meaningful only
/// when `status == Leb128Status::ok`.
template <std::integral T>
struct Leb128Read {
    Leb128Status status{Leb128Status::truncated};
    T value{};
    std::size_t bytes_read{0};
};

// -- Writing ------------------------------------------------------------------

/// Append @p value to @p output: unsigned LEB128 for unsigned types,
/// signed LEB128 for signed ones.
template <std::integral T>
void write_leb128(T value, std::vector<std::byte>& output) {
    if constexpr (std::is_unsigned_v<T>) {
        auto v = static_cast<std::uint64_t>(value);
        do {
            auto byte = static_cast<std::byte>(v & 0x7F);
            v >>= 7;
            if (v != 0) byte |= std::byte{0x80};
            output.push_back(byte);
        } while (v != 0);
    } else {
        auto v = static_cast<std::int64_t>(value);
        for (;;) {
            auto byte = static_cast<std::byte>(v & 0x7F);
            v >>= 7;  // arithmetic shift keeps the sign
            const bool sign_bit = (byte & std::byte{0x40}) != std::byte{0};
            if ((v == 0 && !sign_bit) || (v == -1 && sign_bit)) {
                output.push_back(byte);
                return;
            }
            output.push_back(byte | std::byte{0x80});
        }
    }
}

/// Number of bytes write_leb128() emits for @p value.
template <std::integral T>
constexpr auto leb128_size(T value) -> std::size_t {
    auto n = std::size_t{1};
    if constexpr (std::is_unsigned_v<T>) {
        for (auto v = static_cast<std::uint64_t>(value) >> 7; v != 0; v >>= 7) ++n;
    } else {
        auto v = static_cast<std::int64_t>(value);
        while (v < -64 || v > 63) {
            v >>= 7;
            ++n;
        }
    }
    return n;
}

// -- Reading ------------------------------------------------------------------

/// Read one LEB128 value of type @p T from the front of @p input.
template <std::integral T>
auto read_leb128(std::span<const std::byte> input) -> Leb128Read<T> {
    auto raw = std::uint64_t{0};
    auto shift = 0u;
    auto i = std::size_t{0};
    auto last = std::byte{0};

    for (;; ++i) {
        if (i == input.size()) return {.status = Leb128Status::truncated};
        if (i == max_leb128_bytes) return {.status = Leb128Status::overflow};
        last = input[i];
        const auto bits = static_cast<std::uint64_t>(last & std::byte{0x7F});
        if (shift == 63) {
            // Only the sign (or top) bit fits; the rest must repeat it.
            const auto allowed = std::is_signed_v<T> ? bits == 0 || bits == 0x7F : bits <= 1;
            if (!allowed) return {.status = Leb128Status::overflow};
        }
        raw |= bits << shift;
        shift += 7;
        if ((last & std::byte{0x80}) == std::byte{0}) break;
    }
    const auto bytes_read = i + 1;

    if constexpr (std::is_unsigned_v<T>) {
        if (raw > std::numeric_limits<T>::max()) return {.status = Leb128Status::overflow};
        return {.status = Leb128Status::ok, .value = static_cast<T>(raw), .bytes_read = bytes_read};
    } else {
        if (shift < 64 && (last & std::byte{0x40}) != std::byte{0}) raw |= ~std::uint64_t{0} << shift;
        const auto v = static_cast<std::int64_t>(raw);
        if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
            return {.status = Leb128Status::overflow};
        }
        return {.status = Leb128Status::ok, .value = static_cast<T>(v), .bytes_read = bytes_read};
    }
}

// -- Fixed-width helpers ------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    write_leb128(value, output);
}

inline auto encode_uleb128(std::uint64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    write_leb128(value, result);
    return result;
}

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    write_leb128(value, output);
}

inline auto encode_sleb128(std::int64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    write_leb128(value, result);
    return result;
}

template <std::integral T>
struct Decoded {
    T value;
    std::size_t bytes_read;
};

using DecodeResult = Decoded<std::uint64_t>;
using SignedDecodeResult = Decoded<std::int64_t>;

/// nullopt on truncated or overflowing input.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto r = read_leb128<std::uint64_t>(input);
    if (r.status != Leb128Status::ok) return std::nullopt;
    return DecodeResult{.value = r.value, .bytes_read = r.bytes_read};
}

/// nullopt on truncated or overflowing input.
inline auto decode_sleb128(std::span<const std::byte> input) -> std::optional<SignedDecodeResult> {
    auto r = read_leb128<std::int64_t>(input);
    if (r.status != Leb128Status::ok) return std::nullopt;
    return SignedDecodeResult{.value = r.value, .bytes_read = r.bytes_read};
}

}  // namespace crdt_kit::encoding
