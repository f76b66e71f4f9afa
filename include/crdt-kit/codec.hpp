/// @file codec.hpp
/// @brief Versioned binary envelope shared by every encoded CRDT.
///
/// Binary layout:
/// @code
///   magic (1 byte: 0xCF)
///   format version (1 byte)
///   crdt type (1 byte, CrdtType)
///   flags (1 byte, bit 0 = payload is raw DEFLATE)
///   payload length (ULEB128)
///   payload (payload length bytes)
/// @endcode

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace crdt_kit {

/// Identifies the kind of state stored in an envelope.
enum class CrdtType : std::uint8_t {
    gcounter        = 1,
    pncounter       = 2,
    gset            = 3,
    twop_set        = 4,
    lww_register    = 5,
    mv_register     = 6,
    or_set          = 7,
    rga             = 8,
    text            = 9,
    gcounter_delta  = 16,
    pncounter_delta = 17,
    or_set_delta    = 18,
};

/// Convert a CrdtType to its string representation.
constexpr auto to_string_view(CrdtType type) noexcept -> std::string_view {
    switch (type) {
        case CrdtType::gcounter:        return "gcounter";
        case CrdtType::pncounter:       return "pncounter";
        case CrdtType::gset:            return "gset";
        case CrdtType::twop_set:        return "twop_set";
        case CrdtType::lww_register:    return "lww_register";
        case CrdtType::mv_register:     return "mv_register";
        case CrdtType::or_set:          return "or_set";
        case CrdtType::rga:             return "rga";
        case CrdtType::text:            return "text";
        case CrdtType::gcounter_delta:  return "gcounter_delta";
        case CrdtType::pncounter_delta: return "pncounter_delta";
        case CrdtType::or_set_delta:    return "or_set_delta";
    }
    return "unknown";
}

/// The envelope magic byte.
inline constexpr std::uint8_t envelope_magic = 0xCF;

/// The envelope format version written by this library.
inline constexpr std::uint8_t envelope_version = 1;

/// Tuning knobs for encoding and decoding.
struct CodecOptions {
    /// Payloads larger than this many bytes are DEFLATE-compressed.
    std::size_t deflate_threshold = 256;
    /// Upper bound on the inflated size of a compressed payload.
    std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;
};

/// A decoded envelope: type tag plus the (inflated) payload.
struct Envelope {
    CrdtType type;
    std::vector<std::byte> payload;
};

/// Wrap a payload in an envelope, compressing it when above the threshold.
auto encode_envelope(CrdtType type, std::span<const std::byte> payload,
                     const CodecOptions& options = {}) -> std::vector<std::byte>;

/// Parse an envelope and inflate its payload.
/// @throws DecodeError on bad magic, unknown version, truncation, trailing
///   bytes or a payload that fails to inflate.
auto decode_envelope(std::span<const std::byte> data,
                     const CodecOptions& options = {}) -> Envelope;

/// Parse an envelope and check that it holds the expected type.
/// @throws DecodeError as decode_envelope, plus ErrorKind::type_mismatch.
auto decode_envelope(std::span<const std::byte> data, CrdtType expected,
                     const CodecOptions& options = {}) -> std::vector<std::byte>;

}  // namespace crdt_kit
