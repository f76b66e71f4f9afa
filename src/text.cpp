#include <crdt-kit/text.hpp>

#include <crdt-kit/encoding/deserializer.hpp>
#include <crdt-kit/encoding/serializer.hpp>

#include <cstdint>
#include <stdexcept>

namespace crdt_kit {

namespace {

constexpr char32_t replacement_char = 0xFFFD;

auto decode_utf8(std::string_view utf8) -> std::vector<char32_t> {
    auto out = std::vector<char32_t>{};
    out.reserve(utf8.size());

    std::size_t i = 0;
    while (i < utf8.size()) {
        const auto lead = static_cast<std::uint8_t>(utf8[i]);
        auto len = std::size_t{0};
        auto cp = char32_t{0};
        auto min = char32_t{0};
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; min = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; min = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; min = 0x10000;
        } else {
            out.push_back(replacement_char);
            ++i;
            continue;
        }

        auto consumed = std::size_t{1};
        for (; consumed < len && i + consumed < utf8.size(); ++consumed) {
            const auto next = static_cast<std::uint8_t>(utf8[i + consumed]);
            if ((next & 0xC0) != 0x80) break;
            cp = (cp << 6) | (next & 0x3F);
        }

        // Truncated, overlong, surrogate or out-of-range sequences
        if (consumed < len || cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(replacement_char);
        } else {
            out.push_back(cp);
        }
        i += consumed;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = replacement_char;

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}  // anonymous namespace

void TextCrdt::insert(std::size_t index, char32_t ch) {
    chars_.insert(index, ch);
}

void TextCrdt::insert_str(std::size_t index, std::string_view utf8) {
    if (index > size()) {
        throw std::out_of_range{"text insert index " + std::to_string(index) +
                                " beyond size " + std::to_string(size())};
    }
    for (auto cp : decode_utf8(utf8)) {
        chars_.insert(index++, cp);
    }
}

auto TextCrdt::remove(std::size_t index) -> std::optional<char32_t> {
    return chars_.remove(index);
}

void TextCrdt::remove_range(std::size_t start, std::size_t len) {
    if (start > size() || len > size() - start) {
        throw std::out_of_range{"text range [" + std::to_string(start) + ", +" +
                                std::to_string(len) + ") beyond size " +
                                std::to_string(size())};
    }
    for (std::size_t i = 0; i < len; ++i) {
        chars_.remove(start);
    }
}

auto TextCrdt::fork(ReplicaId replica) const -> TextCrdt {
    auto copy = *this;
    copy.chars_.replica_ = std::move(replica);
    return copy;
}

auto TextCrdt::to_string() const -> std::string {
    auto out = std::string{};
    for (auto cp : chars_.to_vector()) append_utf8(out, cp);
    return out;
}

auto TextCrdt::encode(const CodecOptions& options) const -> std::vector<std::byte> {
    auto s = encoding::Serializer{};
    chars_.write_state(s);
    return encode_envelope(CrdtType::text, s.data(), options);
}

auto TextCrdt::decode(std::span<const std::byte> data,
                      const CodecOptions& options) -> TextCrdt {
    const auto payload = decode_envelope(data, CrdtType::text, options);
    auto d = encoding::Deserializer{payload};
    auto text = TextCrdt{};
    text.chars_ = Rga<char32_t>::read_state(d);
    d.expect_end();
    return text;
}

}  // namespace crdt_kit
