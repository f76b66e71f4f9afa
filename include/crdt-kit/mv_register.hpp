/// @file mv_register.hpp
/// @brief Multi-value register (MV-Register).

#pragma once

#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/encoding/value_codec.hpp>
#include <crdt-kit/types.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace crdt_kit {

/// A register that keeps every concurrent write.
///
/// Each write is stamped with the writer's version vector at write time.
/// Merge keeps every entry that no other entry causally dominates, so
/// concurrent writes survive side by side. More than one surviving entry
/// means the register is conflicted: a normal state the application
/// resolves by calling set() again.
///
/// @code
/// auto a = MVRegister<std::string>{"alice"};
/// a.set("alice's edit");
/// auto b = MVRegister<std::string>{"bob"};
/// b.set("bob's edit");
/// a.merge(b);
/// a.is_conflicted();  // true, a.values() holds both edits
/// a.set("merged edit");
/// a.is_conflicted();  // false
/// @endcode
template <typename T>
class MVRegister {
public:
    using value_type = T;

    /// A write and the version stamp it was made at.
    struct Entry {
        T value;
        VersionVector stamp;

        auto operator==(const Entry&) const -> bool = default;
    };

    MVRegister() = default;

    /// Construct an empty register owned by @p replica.
    explicit MVRegister(ReplicaId replica) : replica_{std::move(replica)} {}

    /// Write a value, superseding every entry this replica has observed.
    void set(T value) {
        version_.increment(replica_);
        entries_.clear();
        entries_.push_back(Entry{.value = std::move(value), .stamp = version_});
    }

    /// All surviving values, ordered by version stamp.
    auto values() const -> std::vector<T> {
        auto result = std::vector<T>{};
        result.reserve(entries_.size());
        for (const auto& e : entries_) result.push_back(e.value);
        return result;
    }

    /// Same as values().
    auto value() const -> std::vector<T> { return values(); }

    /// True when concurrent writes are waiting to be resolved.
    auto is_conflicted() const -> bool { return entries_.size() > 1; }

    auto empty() const -> bool { return entries_.empty(); }

    auto entries() const -> const std::vector<Entry>& { return entries_; }

    /// Everything this replica has observed.
    auto version() const -> const VersionVector& { return version_; }

    auto replica() const -> const ReplicaId& { return replica_; }

    void merge(const MVRegister& other) {
        auto combined = entries_;
        for (const auto& e : other.entries_) {
            auto same_stamp = [&](const Entry& mine) { return mine.stamp == e.stamp; };
            if (std::ranges::none_of(combined, same_stamp)) combined.push_back(e);
        }

        auto survivors = std::vector<Entry>{};
        survivors.reserve(combined.size());
        for (const auto& candidate : combined) {
            const auto dominated = std::ranges::any_of(combined, [&](const Entry& e) {
                return e.stamp.strictly_dominates(candidate.stamp);
            });
            if (!dominated) survivors.push_back(candidate);
        }
        std::ranges::sort(survivors, {}, &Entry::stamp);

        entries_ = std::move(survivors);
        version_.merge(other.version_);
    }

    // -- Encoding -------------------------------------------------------------

    auto encode(const CodecOptions& options = {}) const -> std::vector<std::byte>
        requires encoding::Encodable<T> {
        auto s = encoding::Serializer{};
        s.write_replica_id(replica_);
        s.write_version_vector(version_);
        s.write_uleb128(entries_.size());
        for (const auto& e : entries_) {
            s.write_version_vector(e.stamp);
            encoding::write_value(s, e.value);
        }
        return encode_envelope(CrdtType::mv_register, s.data(), options);
    }

    static auto decode(std::span<const std::byte> data,
                       const CodecOptions& options = {}) -> MVRegister
        requires encoding::Encodable<T> {
        const auto payload = decode_envelope(data, CrdtType::mv_register, options);
        auto d = encoding::Deserializer{payload};
        auto reg = MVRegister{d.read_replica_id()};
        reg.version_ = d.read_version_vector();
        auto n = d.read_count();
        for (std::size_t i = 0; i < n; ++i) {
            auto stamp = d.read_version_vector();
            auto value = encoding::read_value<T>(d);
            if (!reg.version_.dominates(stamp)) d.malformed("entry stamp ahead of register version");
            if (!reg.entries_.empty() && !(reg.entries_.back().stamp < stamp)) {
                d.malformed("entries out of order");
            }
            if (!concurrent_with_all(reg.entries_, stamp)) d.malformed("entry is causally dominated");
            reg.entries_.push_back(Entry{.value = std::move(value), .stamp = std::move(stamp)});
        }
        d.expect_end();
        return reg;
    }

    /// Equal when surviving entries and version match (owner id is not compared).
    auto operator==(const MVRegister& other) const -> bool {
        return version_ == other.version_ && entries_ == other.entries_;
    }

private:
    friend struct detail::StateAccess;

    static auto concurrent_with_all(const std::vector<Entry>& entries, const VersionVector& stamp) -> bool {
        return std::ranges::all_of(entries, [&](const Entry& e) { return e.stamp.concurrent_with(stamp); });
    }

    ReplicaId replica_;
    VersionVector version_;
    std::vector<Entry> entries_;  // sorted by stamp, pairwise concurrent
};

}  // namespace crdt_kit
