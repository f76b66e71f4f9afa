/// @file gset.hpp
/// @brief Grow-only set (G-Set).

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/encoding/value_codec.hpp>
#include <crdt-kit/types.hpp>

#include <cstddef>
#include <set>
#include <span>
#include <vector>

namespace crdt_kit {

template <typename T>
class TwoPSet;

/// A grow-only set: merge is union and there is no removal.
template <typename T>
class GSet {
public:
    using value_type = T;
    using const_iterator = typename std::set<T>::const_iterator;

    GSet() = default;

    /// Construct an empty set owned by @p replica.
    explicit GSet(ReplicaId replica) : replica_{std::move(replica)} {}

    /// Insert an element. Returns true if it was not already present.
    auto insert(T value) -> bool {
        return elements_.insert(std::move(value)).second;
    }

    auto contains(const T& value) const -> bool { return elements_.contains(value); }
    auto size() const -> std::size_t { return elements_.size(); }
    auto empty() const -> bool { return elements_.empty(); }
    auto begin() const -> const_iterator { return elements_.begin(); }
    auto end() const -> const_iterator { return elements_.end(); }

    /// All elements in ascending order.
    auto value() const -> const std::set<T>& { return elements_; }

    auto replica() const -> const ReplicaId& { return replica_; }

    void merge(const GSet& other) {
        elements_.insert(other.elements_.begin(), other.elements_.end());
    }

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>
        requires encoding::Encodable<T> {
        auto s = encoding::Serializer{};
        s.write_replica_id(replica_);
        write_elements(s, elements_);
        return encode_envelope(CrdtType::gset, s.data(), options);
    }

    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> GSet
        requires encoding::Encodable<T> {
        const auto payload = decode_envelope(data, CrdtType::gset, options);
        auto d = encoding::Deserializer{payload};
        auto set = GSet{d.read_replica_id()};
        set.elements_ = read_elements(d);
        d.expect_end();
        return set;
    }

    auto operator==(const GSet& other) const -> bool {
        return elements_ == other.elements_;
    }

private:
    friend class TwoPSet<T>;
    friend struct detail::StateAccess;

    static void write_elements(encoding::Serializer& s, const std::set<T>& elements) {
        s.write_uleb128(elements.size());
        for (const auto& e : elements) encoding::write_value(s, e);
    }

    static auto read_elements(encoding::Deserializer& d) -> std::set<T> {
        auto elements = std::set<T>{};
        auto n = d.read_count();
        for (std::size_t i = 0; i < n; ++i) {
            if (!elements.insert(encoding::read_value<T>(d)).second) {
                d.malformed("duplicate set element");
            }
        }
        return elements;
    }

    ReplicaId replica_;
    std::set<T> elements_;
};

}  // namespace crdt_kit
