/// @file error.hpp
/// @brief Error types for the crdt-kit library.

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace crdt_kit {

/// Categories of errors that can occur while decoding replicated state.
enum class ErrorKind : std::uint8_t {
    truncated_input,       ///< The input ended before a complete value was read.
    bad_magic,             ///< The envelope does not start with the crdt-kit magic byte.
    unsupported_version,   ///< The envelope format version is not understood.
    type_mismatch,         ///< The envelope holds a different CRDT type than requested.
    malformed_payload,     ///< The payload is structurally invalid.
    decompression_failed,  ///< A compressed payload could not be inflated.
    trailing_bytes,        ///< Extra bytes follow a complete value.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::truncated_input:      return "truncated_input";
        case ErrorKind::bad_magic:            return "bad_magic";
        case ErrorKind::unsupported_version:  return "unsupported_version";
        case ErrorKind::type_mismatch:        return "type_mismatch";
        case ErrorKind::malformed_payload:    return "malformed_payload";
        case ErrorKind::decompression_failed: return "decompression_failed";
        case ErrorKind::trailing_bytes:       return "trailing_bytes";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Thrown by decode routines on malformed or truncated input.
///
/// Decoding is the only fallible operation in the library. A caller that
/// catches DecodeError should reject the record; the replica that attempted
/// the decode is unaffected.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    DecodeError(ErrorKind kind, std::string message)
        : DecodeError{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

/// Decode a value, returning nullopt instead of throwing on malformed input.
/// @code
/// auto counter = try_decode<GCounter>(bytes);
/// if (!counter) reject_record();
/// @endcode
template <typename T>
auto try_decode(std::span<const std::byte> data) -> std::optional<T> {
    try {
        return T::decode(data);
    } catch (const DecodeError&) {
        return std::nullopt;
    }
}

}  // namespace crdt_kit
