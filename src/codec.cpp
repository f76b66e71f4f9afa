#include <crdt-kit/codec.hpp>
#include <crdt-kit/error.hpp>

#include "compression.hpp"
#include <crdt-kit/encoding/deserializer.hpp>
#include <crdt-kit/encoding/serializer.hpp>

#include <string>

namespace crdt_kit {

namespace {

constexpr std::uint8_t flag_deflate = 0x01;

auto is_known_type(std::uint8_t raw) -> bool {
    switch (static_cast<CrdtType>(raw)) {
        case CrdtType::gcounter:
        case CrdtType::pncounter:
        case CrdtType::gset:
        case CrdtType::twop_set:
        case CrdtType::lww_register:
        case CrdtType::mv_register:
        case CrdtType::or_set:
        case CrdtType::rga:
        case CrdtType::text:
        case CrdtType::gcounter_delta:
        case CrdtType::pncounter_delta:
        case CrdtType::or_set_delta:
            return true;
    }
    return false;
}

}  // anonymous namespace

auto encode_envelope(CrdtType type, std::span<const std::byte> payload,
                     const CodecOptions& options) -> std::vector<std::byte> {
    const auto compressed = detail::compress_payload(payload, options);
    const auto flags = compressed ? flag_deflate : std::uint8_t{0};

    auto s = encoding::Serializer{};
    s.write_u8(envelope_magic);
    s.write_u8(envelope_version);
    s.write_u8(static_cast<std::uint8_t>(type));
    s.write_u8(flags);
    if (compressed) {
        s.write_length_prefixed(*compressed);
    } else {
        s.write_length_prefixed(payload);
    }
    return s.take();
}

auto decode_envelope(std::span<const std::byte> data,
                     const CodecOptions& options) -> Envelope {
    auto d = encoding::Deserializer{data};

    if (d.read_u8() != envelope_magic) {
        throw DecodeError{ErrorKind::bad_magic, "input is not a crdt-kit envelope"};
    }
    const auto version = d.read_u8();
    if (version != envelope_version) {
        throw DecodeError{ErrorKind::unsupported_version,
            "envelope version " + std::to_string(version)};
    }
    const auto raw_type = d.read_u8();
    if (!is_known_type(raw_type)) {
        throw DecodeError{ErrorKind::malformed_payload,
            "unknown crdt type " + std::to_string(raw_type)};
    }
    const auto flags = d.read_u8();
    if ((flags & ~flag_deflate) != 0) {
        throw DecodeError{ErrorKind::malformed_payload,
            "unknown envelope flags " + std::to_string(flags)};
    }

    auto payload = d.read_length_prefixed();
    d.expect_end();

    if ((flags & flag_deflate) != 0) payload = detail::inflate_payload(payload, options);

    return Envelope{.type = static_cast<CrdtType>(raw_type), .payload = std::move(payload)};
}

auto decode_envelope(std::span<const std::byte> data, CrdtType expected,
                     const CodecOptions& options) -> std::vector<std::byte> {
    auto envelope = decode_envelope(data, options);
    if (envelope.type != expected) {
        throw DecodeError{ErrorKind::type_mismatch,
            "expected " + std::string{to_string_view(expected)} + ", found " +
            std::string{to_string_view(envelope.type)}};
    }
    return std::move(envelope.payload);
}

}  // namespace crdt_kit
