// Fuzz target for the LEB128 codec, exercising decode edge cases
// (overflow, truncation, maximum-length encodings).

#include <crdt-kit/encoding/leb128.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    // Anything that decodes must re-encode to the same value.
    if (auto u = crdt_kit::encoding::decode_uleb128(span)) {
        auto again = crdt_kit::encoding::decode_uleb128(crdt_kit::encoding::encode_uleb128(u->value));
        if (!again || again->value != u->value) std::abort();
    }

    if (auto s = crdt_kit::encoding::decode_sleb128(span)) {
        auto again = crdt_kit::encoding::decode_sleb128(crdt_kit::encoding::encode_sleb128(s->value));
        if (!again || again->value != s->value) std::abort();
    }

    return 0;
}
