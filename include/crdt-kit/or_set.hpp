/// @file or_set.hpp
/// @brief Observed-remove set (OR-Set) with add-wins semantics, and its delta.

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/encoding/value_codec.hpp>
#include <crdt-kit/types.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <set>
#include <span>
#include <vector>

namespace crdt_kit {

/// The add-tags and tombstones a replica already knows.
struct ORSetSummary {
    std::set<Tag> adds;        ///< Live add-tags.
    std::set<Tag> tombstones;  ///< Removed add-tags.

    auto operator==(const ORSetSummary&) const -> bool = default;
};

/// Add-tags and tombstones a peer has not seen yet.
template <typename T>
struct ORSetDelta {
    std::map<T, std::set<Tag>> additions;
    std::set<Tag> tombstones;

    auto empty() const -> bool { return additions.empty() && tombstones.empty(); }

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>
        requires encoding::Encodable<T> {
        auto s = encoding::Serializer{};
        s.write_uleb128(additions.size());
        for (const auto& [value, tags] : additions) {
            encoding::write_value(s, value);
            write_tags(s, tags);
        }
        write_tags(s, tombstones);
        return encode_envelope(CrdtType::or_set_delta, s.data(), options);
    }

    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> ORSetDelta
        requires encoding::Encodable<T> {
        const auto payload = decode_envelope(data, CrdtType::or_set_delta, options);
        auto d = encoding::Deserializer{payload};
        auto delta = ORSetDelta{};
        auto n = d.read_count();
        for (std::size_t i = 0; i < n; ++i) {
            auto value = encoding::read_value<T>(d);
            auto tags = read_tags(d);
            if (tags.empty()) d.malformed("element without add-tags");
            if (!delta.additions.emplace(std::move(value), std::move(tags)).second) {
                d.malformed("duplicate set element");
            }
        }
        delta.tombstones = read_tags(d);
        d.expect_end();
        return delta;
    }

    auto operator==(const ORSetDelta&) const -> bool = default;

    // Shared with ORSet's own payload.
    static void write_tags(encoding::Serializer& s, const std::set<Tag>& tags) {
        s.write_uleb128(tags.size());
        for (const auto& tag : tags) s.write_tag(tag);
    }

    static auto read_tags(encoding::Deserializer& d) -> std::set<Tag> {
        auto tags = std::set<Tag>{};
        auto n = d.read_count();
        for (std::size_t i = 0; i < n; ++i) {
            if (!tags.insert(d.read_tag()).second) d.malformed("duplicate tag");
        }
        return tags;
    }
};

/// An add-wins set.
///
/// Every add mints a unique Tag. A remove tombstones only the tags this
/// replica has observed for the element, so an add made concurrently on
/// another replica survives the merge. An element is present while at
/// least one of its tags is live. Tombstones are never discarded.
///
/// @code
/// auto a = ORSet<std::string>{"alice"};
/// a.add("milk");
/// a.remove("milk");
/// auto b = ORSet<std::string>{"bob"};
/// b.add("milk");
/// a.merge(b);  // a.contains("milk"): the concurrent add wins
/// @endcode
template <typename T>
class ORSet {
public:
    using value_type = T;
    using summary_type = ORSetSummary;
    using delta_type = ORSetDelta<T>;

    ORSet() = default;

    /// Construct an empty set owned by @p replica.
    explicit ORSet(ReplicaId replica) : replica_{std::move(replica)} {}

    /// Add an element under a freshly minted tag.
    /// @return The minted tag.
    auto add(T value) -> Tag {
        auto tag = Tag{++counter_, replica_};
        owners_.emplace(tag, value);
        elements_[std::move(value)].insert(tag);
        return tag;
    }

    /// Remove an element by tombstoning every tag observed for it.
    /// @return false if the element was not present.
    auto remove(const T& value) -> bool {
        auto it = elements_.find(value);
        if (it == elements_.end()) return false;
        for (const auto& tag : it->second) {
            tombstones_.insert(tag);
            owners_.erase(tag);
        }
        elements_.erase(it);
        return true;
    }

    auto contains(const T& value) const -> bool { return elements_.contains(value); }
    auto size() const -> std::size_t { return elements_.size(); }
    auto empty() const -> bool { return elements_.empty(); }

    /// Present elements in ascending order.
    auto value() const -> std::vector<T> {
        auto result = std::vector<T>{};
        result.reserve(elements_.size());
        for (const auto& [v, tags] : elements_) result.push_back(v);
        return result;
    }

    /// The live tags of @p value (empty when absent).
    auto tags_of(const T& value) const -> std::set<Tag> {
        auto it = elements_.find(value);
        return it == elements_.end() ? std::set<Tag>{} : it->second;
    }

    auto tombstones() const -> const std::set<Tag>& { return tombstones_; }
    auto replica() const -> const ReplicaId& { return replica_; }

    void merge(const ORSet& other) {
        absorb(other.elements_, other.tombstones_);
    }

    // -- Delta sync -----------------------------------------------------------

    auto summary() const -> ORSetSummary {
        auto s = ORSetSummary{.adds = {}, .tombstones = tombstones_};
        for (const auto& [v, tags] : elements_) s.adds.insert(tags.begin(), tags.end());
        return s;
    }

    /// Tags and tombstones missing from a peer described by @p since.
    auto delta(const ORSetSummary& since) const -> ORSetDelta<T> {
        auto d = ORSetDelta<T>{};
        for (const auto& [v, tags] : elements_) {
            auto fresh = std::set<Tag>{};
            for (const auto& tag : tags) {
                if (!since.adds.contains(tag) && !since.tombstones.contains(tag)) {
                    fresh.insert(tag);
                }
            }
            if (!fresh.empty()) d.additions.emplace(v, std::move(fresh));
        }
        std::ranges::set_difference(tombstones_, since.tombstones,
                                    std::inserter(d.tombstones, d.tombstones.end()));
        return d;
    }

    void apply_delta(const ORSetDelta<T>& delta) {
        absorb(delta.additions, delta.tombstones);
    }

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>
        requires encoding::Encodable<T> {
        auto s = encoding::Serializer{};
        s.write_replica_id(replica_);
        s.write_uleb128(counter_);
        s.write_uleb128(elements_.size());
        for (const auto& [value, tags] : elements_) {
            encoding::write_value(s, value);
            ORSetDelta<T>::write_tags(s, tags);
        }
        ORSetDelta<T>::write_tags(s, tombstones_);
        return encode_envelope(CrdtType::or_set, s.data(), options);
    }

    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> ORSet
        requires encoding::Encodable<T> {
        const auto payload = decode_envelope(data, CrdtType::or_set, options);
        auto d = encoding::Deserializer{payload};
        auto set = ORSet{d.read_replica_id()};
        set.counter_ = d.read_uleb128();
        auto n = d.read_count();
        for (std::size_t i = 0; i < n; ++i) {
            auto value = encoding::read_value<T>(d);
            auto tags = ORSetDelta<T>::read_tags(d);
            if (tags.empty()) d.malformed("element without live tags");
            if (!set.elements_.emplace(std::move(value), std::move(tags)).second) {
                d.malformed("duplicate set element");
            }
        }
        set.tombstones_ = ORSetDelta<T>::read_tags(d);
        d.expect_end();

        for (const auto& [v, tags] : set.elements_) {
            for (const auto& tag : tags) {
                if (set.tombstones_.contains(tag)) d.malformed("live tag is tombstoned");
                if (!set.minted_in_range(tag)) d.malformed("tag minted ahead of counter");
            }
        }
        for (const auto& tag : set.tombstones_) {
            if (!set.minted_in_range(tag)) d.malformed("tombstone minted ahead of counter");
        }
        if (!set.reindex()) d.malformed("tag shared by two elements");
        return set;
    }

    /// Equal when live tags and tombstones match (owner and counter are not compared).
    auto operator==(const ORSet& other) const -> bool {
        return elements_ == other.elements_ && tombstones_ == other.tombstones_;
    }

private:
    friend struct detail::StateAccess;

    void absorb(const std::map<T, std::set<Tag>>& additions, const std::set<Tag>& tombstones) {
        for (const auto& [value, tags] : additions) {
            for (const auto& tag : tags) {
                observe(tag);
                if (tombstones_.contains(tag) || tombstones.contains(tag)) continue;
                if (owners_.emplace(tag, value).second) elements_[value].insert(tag);
            }
        }
        for (const auto& tag : tombstones) {
            observe(tag);
            if (!tombstones_.insert(tag).second) continue;
            auto owner = owners_.find(tag);
            if (owner == owners_.end()) continue;
            auto element = elements_.find(owner->second);
            element->second.erase(tag);
            if (element->second.empty()) elements_.erase(element);
            owners_.erase(owner);
        }
    }

    // Rebuilds owners_ from elements_ after the state was loaded wholesale.
    // False if some tag is listed under two elements.
    auto reindex() -> bool {
        owners_.clear();
        for (const auto& [value, tags] : elements_) {
            for (const auto& tag : tags) {
                if (!owners_.emplace(tag, value).second) return false;
            }
        }
        return true;
    }

    // Tags carrying this replica's id must not be ahead of its mint counter.
    auto minted_in_range(const Tag& tag) const -> bool {
        return tag.replica != replica_ || tag.counter <= counter_;
    }

    // A restored replica must never re-mint a tag already in circulation.
    void observe(const Tag& tag) {
        if (tag.replica == replica_) counter_ = std::max(counter_, tag.counter);
    }

    ReplicaId replica_;
    std::uint64_t counter_{0};
    std::map<T, std::set<Tag>> elements_;  // only elements with live tags
    std::set<Tag> tombstones_;
    std::map<Tag, T> owners_;              // live tag -> its element
};

}  // namespace crdt_kit
