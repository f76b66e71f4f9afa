/// @file twop_set.hpp
/// @brief Two-phase set (2P-Set): add, then permanently remove.

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/encoding/value_codec.hpp>
#include <crdt-kit/gset.hpp>
#include <crdt-kit/types.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <vector>

namespace crdt_kit {

/// A set built from two grow-only sets: added and removed (tombstones).
///
/// Once an element is removed it can never reappear, not even through a
/// later or concurrent add on another replica. Use ORSet when re-adding
/// must be possible.
template <typename T>
class TwoPSet {
public:
    using value_type = T;

    TwoPSet() = default;

    /// Construct an empty set owned by @p replica.
    explicit TwoPSet(const ReplicaId& replica) : added_{replica}, removed_{replica} {}

    /// Insert an element.
    /// @return false if the element is already present or was removed.
    auto insert(T value) -> bool {
        if (removed_.contains(value)) return false;
        return added_.insert(std::move(value));
    }

    /// Permanently remove a present element.
    /// @return true if the element was present and is now removed.
    auto remove(const T& value) -> bool {
        if (!contains(value)) return false;
        return removed_.insert(value);
    }

    auto contains(const T& value) const -> bool {
        return added_.contains(value) && !removed_.contains(value);
    }

    auto size() const -> std::size_t {
        return static_cast<std::size_t>(std::ranges::count_if(added_,
            [this](const T& v) { return !removed_.contains(v); }));
    }

    auto empty() const -> bool { return size() == 0; }

    /// added - removed, in ascending order.
    auto value() const -> std::vector<T> {
        auto result = std::vector<T>{};
        std::ranges::set_difference(added_.value(), removed_.value(),
                                    std::back_inserter(result));
        return result;
    }

    auto added() const -> const GSet<T>& { return added_; }
    auto removed() const -> const GSet<T>& { return removed_; }

    auto replica() const -> const ReplicaId& { return added_.replica(); }

    void merge(const TwoPSet& other) {
        added_.merge(other.added_);
        removed_.merge(other.removed_);
    }

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>
        requires encoding::Encodable<T> {
        auto s = encoding::Serializer{};
        s.write_replica_id(replica());
        GSet<T>::write_elements(s, added_.elements_);
        GSet<T>::write_elements(s, removed_.elements_);
        return encode_envelope(CrdtType::twop_set, s.data(), options);
    }

    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> TwoPSet
        requires encoding::Encodable<T> {
        const auto payload = decode_envelope(data, CrdtType::twop_set, options);
        auto d = encoding::Deserializer{payload};
        auto set = TwoPSet{d.read_replica_id()};
        set.added_.elements_ = GSet<T>::read_elements(d);
        set.removed_.elements_ = GSet<T>::read_elements(d);
        d.expect_end();
        if (!std::ranges::includes(set.added_.elements_, set.removed_.elements_)) {
            d.malformed("removed element that was never added");
        }
        return set;
    }

    auto operator==(const TwoPSet&) const -> bool = default;

private:
    friend struct detail::StateAccess;

    GSet<T> added_;
    GSet<T> removed_;
};

}  // namespace crdt_kit
