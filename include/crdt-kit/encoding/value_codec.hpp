#pragma once

// Element codecs: how a CRDT's payload type T is written into a payload.
//
// Specialize ValueCodec<T> for application types:
//
//   template <>
//   struct crdt_kit::encoding::ValueCodec<Point> {
//       static void write(Serializer& s, const Point& p) { ... }
//       static auto read(Deserializer& d) -> Point { ... }
//   };

#include <crdt-kit/types.hpp>
#include <crdt-kit/encoding/deserializer.hpp>
#include <crdt-kit/encoding/serializer.hpp>

#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace crdt_kit::encoding {

template <typename T>
struct ValueCodec;

/// A type that has a ValueCodec specialization.
template <typename T>
concept Encodable = requires(Serializer& s, Deserializer& d, const T& v) {
    ValueCodec<T>::write(s, v);
    { ValueCodec<T>::read(d) } -> std::same_as<T>;
};

template <>
struct ValueCodec<bool> {
    static void write(Serializer& s, bool v) { s.write_bool(v); }
    static auto read(Deserializer& d) -> bool { return d.read_bool(); }
};

template <>
struct ValueCodec<char32_t> {
    static void write(Serializer& s, char32_t v) { s.write_uleb128(v); }
    static auto read(Deserializer& d) -> char32_t {
        auto v = d.read_uleb128();
        if (v > 0x10FFFF) d.malformed("code point out of range");
        return static_cast<char32_t>(v);
    }
};

template <std::unsigned_integral T>
    requires (!std::same_as<T, bool>)
struct ValueCodec<T> {
    static void write(Serializer& s, T v) { s.write_uleb128(v); }
    static auto read(Deserializer& d) -> T { return d.read_integer<T>(); }
};

template <std::signed_integral T>
struct ValueCodec<T> {
    static void write(Serializer& s, T v) { s.write_sleb128(v); }
    static auto read(Deserializer& d) -> T { return d.read_integer<T>(); }
};

template <>
struct ValueCodec<double> {
    static void write(Serializer& s, double v) { s.write_f64(v); }
    static auto read(Deserializer& d) -> double { return d.read_f64(); }
};

template <>
struct ValueCodec<std::string> {
    static void write(Serializer& s, const std::string& v) { s.write_string(v); }
    static auto read(Deserializer& d) -> std::string { return d.read_string(); }
};

template <>
struct ValueCodec<Bytes> {
    static void write(Serializer& s, const Bytes& v) { s.write_length_prefixed(v); }
    static auto read(Deserializer& d) -> Bytes { return d.read_length_prefixed(); }
};

template <>
struct ValueCodec<ReplicaId> {
    static void write(Serializer& s, const ReplicaId& v) { s.write_replica_id(v); }
    static auto read(Deserializer& d) -> ReplicaId { return d.read_replica_id(); }
};

template <typename T>
void write_value(Serializer& s, const T& v) {
    ValueCodec<T>::write(s, v);
}

template <typename T>
auto read_value(Deserializer& d) -> T {
    return ValueCodec<T>::read(d);
}

}  // namespace crdt_kit::encoding
