/// @file text.hpp
/// @brief Collaborative plain text built on Rga.

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/rga.hpp>
#include <crdt-kit/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crdt_kit {

/// A text document edited concurrently by several replicas.
///
/// The document is an Rga of Unicode code points. Indexes and sizes count
/// code points, not bytes. Input is UTF-8; malformed bytes are replaced by
/// U+FFFD.
///
/// @code
/// auto a = TextCrdt{"alice"};
/// a.insert_str(0, "Hello");
/// auto b = a.fork("bob");
/// b.insert_str(5, " world");
/// a.merge(b);  // a.to_string() == "Hello world"
/// @endcode
class TextCrdt {
public:
    TextCrdt() = default;

    /// Construct an empty document owned by @p replica.
    explicit TextCrdt(ReplicaId replica) : chars_{std::move(replica)} {}

    /// Insert a single code point at @p index.
    /// @throws std::out_of_range if index > size().
    void insert(std::size_t index, char32_t ch);

    /// Insert UTF-8 text so that its first code point lands at @p index.
    /// @throws std::out_of_range if index > size().
    void insert_str(std::size_t index, std::string_view utf8);

    /// Remove the code point at @p index.
    /// @return The removed code point, or nullopt if out of bounds.
    auto remove(std::size_t index) -> std::optional<char32_t>;

    /// Remove @p len code points starting at @p start.
    /// @throws std::out_of_range if the range extends past size().
    void remove_range(std::size_t start, std::size_t len);

    /// A copy of this document's history under a new replica identity.
    auto fork(ReplicaId replica) const -> TextCrdt;

    /// The document as UTF-8.
    auto to_string() const -> std::string;
    auto value() const -> std::string { return to_string(); }

    /// Length in code points.
    auto size() const -> std::size_t { return chars_.size(); }
    auto empty() const -> bool { return chars_.empty(); }

    /// The underlying code point sequence.
    auto chars() const -> const Rga<char32_t>& { return chars_; }
    auto replica() const -> const ReplicaId& { return chars_.replica(); }

    void merge(const TextCrdt& other) { chars_.merge(other.chars_); }

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>;
    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> TextCrdt;

    auto operator==(const TextCrdt& other) const -> bool = default;

private:
    friend struct detail::StateAccess;

    Rga<char32_t> chars_;
};

}  // namespace crdt_kit
