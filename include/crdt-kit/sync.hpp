/// @file sync.hpp
/// @brief Decode-and-merge helpers for transport and storage code.
///
/// A peer's record that fails to decode is rejected: the failure is
/// logged at warning level, the local replica is left untouched and the
/// helper returns false. The exchange can simply continue with the next
/// record.

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/error.hpp>
#include <crdt-kit/logging.hpp>

#include <cstddef>
#include <span>
#include <string>

namespace crdt_kit {

/// Decode a peer's full state and merge it into @p local.
/// @return false if the record was rejected.
template <Crdt T>
auto merge_encoded(T& local, std::span<const std::byte> bytes,
                   const CodecOptions& options = {}) -> bool {
    try {
        local.merge(T::decode(bytes, options));
    } catch (const DecodeError& e) {
        logging::write(logging::level::warning,
            "rejected state record of " + std::to_string(bytes.size()) + " bytes: " + e.what());
        return false;
    }
    logging::write(logging::level::debug,
        "merged state record of " + std::to_string(bytes.size()) + " bytes");
    return true;
}

/// Decode a peer's delta and apply it to @p local.
/// @return false if the record was rejected.
template <DeltaCrdt T>
auto apply_encoded_delta(T& local, std::span<const std::byte> bytes,
                         const CodecOptions& options = {}) -> bool {
    try {
        local.apply_delta(T::delta_type::decode(bytes, options));
    } catch (const DecodeError& e) {
        logging::write(logging::level::warning,
            "rejected delta record of " + std::to_string(bytes.size()) + " bytes: " + e.what());
        return false;
    }
    logging::write(logging::level::debug,
        "applied delta record of " + std::to_string(bytes.size()) + " bytes");
    return true;
}

/// Encode the part of @p local that a peer described by @p since lacks.
template <DeltaCrdt T>
auto encode_delta_for(const T& local, const typename T::summary_type& since,
                      const CodecOptions& options = {}) -> std::vector<std::byte> {
    return local.delta(since).encode(options);
}

}  // namespace crdt_kit
