#pragma once

// Raw DEFLATE for envelope payloads (no zlib/gzip header, windowBits -15).
//
// compress_payload() applies CodecOptions::deflate_threshold and keeps the
// raw payload whenever compressing would not shrink it. inflate_payload()
// streams into a buffer bounded by CodecOptions::max_inflated_size and
// throws DecodeError(decompression_failed) on corrupt or oversized input.
//
// Internal header, not installed.

#include <crdt-kit/codec.hpp>
#include <crdt-kit/error.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <zlib.h>

namespace crdt_kit::detail {

constexpr int raw_deflate_window_bits = -15;

// Owns a z_stream for one direction and ends it on scope exit.
template <bool Inflate>
class ZStream {
public:
    ZStream() {
        if constexpr (Inflate) {
            ok_ = ::inflateInit2(&stream_, raw_deflate_window_bits) == Z_OK;
        } else {
            ok_ = ::deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                                 raw_deflate_window_bits, 8, Z_DEFAULT_STRATEGY) == Z_OK;
        }
    }
    ~ZStream() {
        if (!ok_) return;
        if constexpr (Inflate) {
            ::inflateEnd(&stream_);
        } else {
            ::deflateEnd(&stream_);
        }
    }
    ZStream(const ZStream&) = delete;
    auto operator=(const ZStream&) -> ZStream& = delete;

    auto ok() const -> bool { return ok_; }
    auto get() -> z_stream* { return &stream_; }

private:
    z_stream stream_{};
    bool ok_{false};
};

/// The compressed form of @p payload, or nullopt when the payload is at or
/// below the threshold, compression fails, or it would not save space.
inline auto compress_payload(std::span<const std::byte> payload, const CodecOptions& options)
    -> std::optional<std::vector<std::byte>> {
    if (payload.size() <= options.deflate_threshold) return std::nullopt;

    auto z = ZStream<false>{};
    if (!z.ok()) return std::nullopt;
    auto* s = z.get();

    const auto bound = ::deflateBound(s, static_cast<uLong>(payload.size()));
    auto out = std::vector<std::byte>(bound);
    s->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(payload.data()));
    s->avail_in = static_cast<uInt>(payload.size());
    s->next_out = reinterpret_cast<Bytef*>(out.data());
    s->avail_out = static_cast<uInt>(out.size());

    if (::deflate(s, Z_FINISH) != Z_STREAM_END) return std::nullopt;
    if (s->total_out >= payload.size()) return std::nullopt;
    out.resize(s->total_out);
    return out;
}

/// Inflate a compressed envelope payload.
/// @throws DecodeError(decompression_failed) on a corrupt stream, trailing
///   bytes after the stream, or output beyond options.max_inflated_size.
inline auto inflate_payload(std::span<const std::byte> compressed, const CodecOptions& options)
    -> std::vector<std::byte> {
    auto fail = [&](const std::string& why) -> DecodeError {
        return DecodeError{ErrorKind::decompression_failed,
            "payload of " + std::to_string(compressed.size()) + " bytes: " + why};
    };

    auto z = ZStream<true>{};
    if (!z.ok()) throw fail("inflate initialisation failed");
    auto* s = z.get();
    s->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(compressed.data()));
    s->avail_in = static_cast<uInt>(compressed.size());

    auto out = std::vector<std::byte>{};
    auto chunk = std::array<std::byte, 16 * 1024>{};
    for (;;) {
        s->next_out = reinterpret_cast<Bytef*>(chunk.data());
        s->avail_out = static_cast<uInt>(chunk.size());
        const auto ret = ::inflate(s, Z_NO_FLUSH);
        const auto produced = chunk.size() - s->avail_out;
        if (out.size() + produced > options.max_inflated_size) {
            throw fail("inflates beyond " + std::to_string(options.max_inflated_size) + " bytes");
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));

        if (ret == Z_STREAM_END) break;
        if (ret == Z_BUF_ERROR || (ret == Z_OK && produced == 0 && s->avail_in == 0)) {
            throw fail("deflate stream ends early");
        }
        if (ret != Z_OK) throw fail("corrupt deflate stream");
    }
    if (s->avail_in != 0) throw fail("trailing bytes after deflate stream");
    return out;
}

}  // namespace crdt_kit::detail
