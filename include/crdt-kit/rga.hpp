/// @file rga.hpp
/// @brief Replicated Growable Array (RGA): an ordered sequence CRDT.

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/encoding/value_codec.hpp>
#include <crdt-kit/types.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace crdt_kit {

/// An ordered sequence that replicas edit concurrently.
///
/// Every element is a node naming the node it was inserted after (its
/// parent, or the head of the sequence). Siblings are ordered by
/// descending Tag, so the most recent insert at a position comes first,
/// and the document order is a depth-first walk from the head. Removed
/// nodes stay as tombstones so later inserts anchored on them still have
/// a place.
///
/// Node tags are Lamport-style: a new node's counter is one more than the
/// largest counter this replica has seen from anyone.
///
/// @code
/// auto a = Rga<char>{"alice"};
/// a.insert(0, 'H');
/// a.insert(1, 'i');
/// auto b = a;
/// b.insert(2, '!');
/// a.remove(0);
/// a.merge(b);  // a.to_vector() == {'i', '!'}
/// @endcode
template <typename T>
class Rga {
public:
    using value_type = T;

    /// A sequence element. Removal only sets `deleted`.
    struct Node {
        std::optional<Tag> parent;  ///< nullopt = inserted at the head
        T value;
        bool deleted{false};

        auto operator==(const Node&) const -> bool = default;
    };

    Rga() = default;

    /// Construct an empty sequence owned by @p replica.
    explicit Rga(ReplicaId replica) : replica_{std::move(replica)} {}

    /// Insert @p value so that it becomes the element at @p index.
    /// @throws std::out_of_range if index > size().
    /// @return The id of the new node.
    auto insert(std::size_t index, T value) -> Tag {
        if (index > size()) {
            throw std::out_of_range{"rga insert index " + std::to_string(index) +
                                    " beyond size " + std::to_string(size())};
        }

        auto parent = std::optional<Tag>{};
        auto pos = std::size_t{0};
        if (index > 0) {
            pos = position_of(index - 1);
            parent = sequence_[pos];
            ++pos;
        }

        auto tag = Tag{++counter_, replica_};
        nodes_.emplace(tag, Node{.parent = std::move(parent), .value = std::move(value)});
        // The new tag outranks every sibling, so it directly follows its parent.
        sequence_.insert(sequence_.begin() + static_cast<std::ptrdiff_t>(pos), tag);
        return tag;
    }

    /// Insert at the end of the sequence.
    auto push_back(T value) -> Tag { return insert(size(), std::move(value)); }

    /// Tombstone the element at @p index.
    /// @return The removed value, or nullopt if @p index is out of bounds.
    auto remove(std::size_t index) -> std::optional<T> {
        if (index >= size()) return std::nullopt;
        auto& node = nodes_.at(sequence_[position_of(index)]);
        node.deleted = true;
        return node.value;
    }

    /// The element at @p index, or nullopt if out of bounds.
    auto get(std::size_t index) const -> std::optional<T> {
        if (index >= size()) return std::nullopt;
        return nodes_.at(sequence_[position_of(index)]).value;
    }

    /// Number of visible elements.
    auto size() const -> std::size_t { return nodes_.size() - tombstone_count(); }
    auto empty() const -> bool { return size() == 0; }

    /// Total nodes held, tombstones included.
    auto node_count() const -> std::size_t { return nodes_.size(); }

    auto tombstone_count() const -> std::size_t {
        return static_cast<std::size_t>(std::ranges::count_if(
            nodes_, [](const auto& entry) { return entry.second.deleted; }));
    }

    /// Visible elements in document order.
    auto to_vector() const -> std::vector<T> {
        auto result = std::vector<T>{};
        result.reserve(nodes_.size());
        for (const auto& tag : sequence_) {
            const auto& node = nodes_.at(tag);
            if (!node.deleted) result.push_back(node.value);
        }
        return result;
    }

    auto value() const -> std::vector<T> { return to_vector(); }

    auto nodes() const -> const std::map<Tag, Node>& { return nodes_; }
    auto replica() const -> const ReplicaId& { return replica_; }

    void merge(const Rga& other) {
        auto grew = false;
        for (const auto& [tag, node] : other.nodes_) {
            auto [it, inserted] = nodes_.emplace(tag, node);
            if (inserted) {
                grew = true;
            } else if (node.deleted) {
                it->second.deleted = true;
            }
            counter_ = std::max(counter_, tag.counter);
        }
        if (grew) rebuild_sequence();
    }

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>
        requires encoding::Encodable<T> {
        auto s = encoding::Serializer{};
        write_state(s);
        return encode_envelope(CrdtType::rga, s.data(), options);
    }

    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> Rga
        requires encoding::Encodable<T> {
        const auto payload = decode_envelope(data, CrdtType::rga, options);
        auto d = encoding::Deserializer{payload};
        auto rga = read_state(d);
        d.expect_end();
        return rga;
    }

    /// Equal when the node sets match (owner and counter are not compared).
    auto operator==(const Rga& other) const -> bool { return nodes_ == other.nodes_; }

private:
    friend class TextCrdt;
    friend struct detail::StateAccess;

    // Index into sequence_ of the visible element at @p index (caller checks bounds).
    auto position_of(std::size_t index) const -> std::size_t {
        auto seen = std::size_t{0};
        for (std::size_t pos = 0; pos < sequence_.size(); ++pos) {
            if (nodes_.at(sequence_[pos]).deleted) continue;
            if (seen == index) return pos;
            ++seen;
        }
        throw std::out_of_range{"rga index " + std::to_string(index)};
    }

    void rebuild_sequence() {
        auto children = std::map<std::optional<Tag>, std::vector<Tag>>{};
        for (const auto& [tag, node] : nodes_) children[node.parent].push_back(tag);

        sequence_.clear();
        sequence_.reserve(nodes_.size());

        // Depth-first, siblings by descending tag. The stack holds them reversed.
        auto stack = std::vector<Tag>{};
        auto push_children = [&](const std::optional<Tag>& parent) {
            auto it = children.find(parent);
            if (it == children.end()) return;
            // Ascending map order pushed as-is leaves the largest tag on top.
            stack.insert(stack.end(), it->second.begin(), it->second.end());
        };
        push_children(std::nullopt);
        while (!stack.empty()) {
            auto tag = std::move(stack.back());
            stack.pop_back();
            sequence_.push_back(tag);
            push_children(tag);
        }
    }

    void write_state(encoding::Serializer& s) const {
        s.write_replica_id(replica_);
        s.write_uleb128(counter_);
        s.write_uleb128(nodes_.size());
        for (const auto& [tag, node] : nodes_) {
            s.write_tag(tag);
            s.write_bool(node.parent.has_value());
            if (node.parent) s.write_tag(*node.parent);
            encoding::write_value(s, node.value);
            s.write_bool(node.deleted);
        }
    }

    static auto read_state(encoding::Deserializer& d) -> Rga {
        auto rga = Rga{d.read_replica_id()};
        rga.counter_ = d.read_uleb128();
        auto n = d.read_count();
        for (std::size_t i = 0; i < n; ++i) {
            auto tag = d.read_tag();
            auto parent = std::optional<Tag>{};
            if (d.read_bool()) parent = d.read_tag();
            auto value = encoding::read_value<T>(d);
            auto deleted = d.read_bool();

            if (tag.counter == 0 || tag.counter > rga.counter_) {
                d.malformed("node counter outside the sequence clock");
            }
            if (parent && parent->counter >= tag.counter) {
                d.malformed("node anchored on a later node");
            }
            auto node = Node{.parent = std::move(parent), .value = std::move(value), .deleted = deleted};
            if (!rga.nodes_.emplace(std::move(tag), std::move(node)).second) {
                d.malformed("duplicate node id");
            }
        }
        for (const auto& [tag, node] : rga.nodes_) {
            if (node.parent && !rga.nodes_.contains(*node.parent)) {
                d.malformed("node anchored on a missing node");
            }
        }
        rga.rebuild_sequence();
        return rga;
    }

    ReplicaId replica_;
    std::uint64_t counter_{0};      // largest counter seen
    std::map<Tag, Node> nodes_;
    std::vector<Tag> sequence_;     // every node in document order
};

}  // namespace crdt_kit
