#include <crdt-kit/types.hpp>

#include <stdexcept>

namespace crdt_kit {

namespace {

auto hex_char_to_nibble(char c) -> std::byte {
    if (c >= '0' && c <= '9') return std::byte(c - '0');
    if (c >= 'a' && c <= 'f') return std::byte(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return std::byte(c - 'A' + 10);
    throw std::invalid_argument{"invalid hex character"};
}

}  // anonymous namespace

// -- ReplicaId ----------------------------------------------------------------

auto ReplicaId::to_hex() const -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

auto ReplicaId::to_string() const -> std::string {
    const auto printable = std::ranges::all_of(bytes, [](std::byte b) {
        auto v = static_cast<unsigned char>(b);
        return v >= 0x20 && v < 0x7F;
    });
    if (!printable) return to_hex();
    return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

auto ReplicaId::from_hex(std::string_view hex) -> ReplicaId {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument{"hex string has odd length"};
    }
    auto out = Bytes(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = (hex_char_to_nibble(hex[i * 2]) << 4) | hex_char_to_nibble(hex[i * 2 + 1]);
    }
    return ReplicaId{std::move(out)};
}

// -- VersionVector ------------------------------------------------------------

VersionVector::VersionVector(
    std::initializer_list<std::pair<const ReplicaId, std::uint64_t>> init) {
    for (const auto& [replica, value] : init) set(replica, value);
}

auto VersionVector::get(const ReplicaId& replica) const -> std::uint64_t {
    auto it = entries_.find(replica);
    return it != entries_.end() ? it->second : 0;
}

void VersionVector::set(const ReplicaId& replica, std::uint64_t value) {
    if (value == 0) {
        entries_.erase(replica);
        return;
    }
    entries_[replica] = value;
}

auto VersionVector::increment(const ReplicaId& replica) -> std::uint64_t {
    return ++entries_[replica];
}

void VersionVector::merge(const VersionVector& other) {
    for (const auto& [replica, value] : other.entries_) {
        auto& mine = entries_[replica];
        mine = std::max(mine, value);
    }
}

auto VersionVector::dominates(const VersionVector& other) const -> bool {
    return std::ranges::all_of(other.entries_, [this](const auto& entry) {
        return get(entry.first) >= entry.second;
    });
}

auto VersionVector::strictly_dominates(const VersionVector& other) const -> bool {
    return dominates(other) && *this != other;
}

auto VersionVector::concurrent_with(const VersionVector& other) const -> bool {
    return !dominates(other) && !other.dominates(*this);
}

}  // namespace crdt_kit
