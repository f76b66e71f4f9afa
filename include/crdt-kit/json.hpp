/// @file json.hpp
/// @brief nlohmann/json interoperability for crdt-kit.
///
/// ADL to_json/from_json for the identity types and every CRDT type. The
/// JSON form keeps all merge metadata (tags, tombstones, version stamps),
/// so a replica read back from JSON merges exactly like the original.
///
/// from_json throws nlohmann::json::exception on structurally wrong JSON
/// and DecodeError when the content violates a type's invariants.

#pragma once

#include <crdt-kit/clock.hpp>
#include <crdt-kit/detail/state_access.hpp>
#include <crdt-kit/error.hpp>
#include <crdt-kit/gcounter.hpp>
#include <crdt-kit/gset.hpp>
#include <crdt-kit/lww_register.hpp>
#include <crdt-kit/mv_register.hpp>
#include <crdt-kit/or_set.hpp>
#include <crdt-kit/pncounter.hpp>
#include <crdt-kit/rga.hpp>
#include <crdt-kit/text.hpp>
#include <crdt-kit/twop_set.hpp>
#include <crdt-kit/types.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace crdt_kit {

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const ReplicaId& id);
void from_json(const nlohmann::json& j, ReplicaId& id);

void to_json(nlohmann::json& j, const Tag& tag);
void from_json(const nlohmann::json& j, Tag& tag);

void to_json(nlohmann::json& j, const HybridTimestamp& ts);
void from_json(const nlohmann::json& j, HybridTimestamp& ts);

void to_json(nlohmann::json& j, const VersionVector& vv);
void from_json(const nlohmann::json& j, VersionVector& vv);

// -- Counters -----------------------------------------------------------------

void to_json(nlohmann::json& j, const GCounter& c);
void from_json(const nlohmann::json& j, GCounter& c);

void to_json(nlohmann::json& j, const GCounterDelta& d);
void from_json(const nlohmann::json& j, GCounterDelta& d);

void to_json(nlohmann::json& j, const PNCounter& c);
void from_json(const nlohmann::json& j, PNCounter& c);

void to_json(nlohmann::json& j, const PNCounterDelta& d);
void from_json(const nlohmann::json& j, PNCounterDelta& d);

// -- Text ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const TextCrdt& t);
void from_json(const nlohmann::json& j, TextCrdt& t);

// -- ORSet summary ------------------------------------------------------------

void to_json(nlohmann::json& j, const ORSetSummary& s);
void from_json(const nlohmann::json& j, ORSetSummary& s);

namespace detail {

/// Throws DecodeError(type_mismatch) unless j["type"] == expected.
void expect_json_type(const nlohmann::json& j, std::string_view expected);

/// Throws DecodeError(malformed_payload).
[[noreturn]] void json_malformed(std::string_view what);

template <typename T>
void rga_to_json(nlohmann::json& j, const Rga<T>& rga) {
    j["replica"] = StateAccess::replica(rga);
    j["counter"] = StateAccess::counter(rga);
    auto nodes = nlohmann::json::array();
    for (const auto& [tag, node] : StateAccess::nodes(rga)) {
        auto n = nlohmann::json{{"id", tag}, {"value", node.value}, {"deleted", node.deleted}};
        n["parent"] = node.parent ? nlohmann::json(*node.parent) : nlohmann::json(nullptr);
        nodes.push_back(std::move(n));
    }
    j["nodes"] = std::move(nodes);
}

template <typename T>
void rga_from_json(const nlohmann::json& j, Rga<T>& rga) {
    auto result = Rga<T>{j.at("replica").get<ReplicaId>()};
    auto& counter = StateAccess::counter(result);
    auto& nodes = StateAccess::nodes(result);
    counter = j.at("counter").get<std::uint64_t>();

    for (const auto& n : j.at("nodes")) {
        auto tag = n.at("id").get<Tag>();
        auto parent = std::optional<Tag>{};
        if (!n.at("parent").is_null()) parent = n.at("parent").get<Tag>();
        if (tag.counter == 0 || tag.counter > counter) json_malformed("node counter outside the sequence clock");
        if (parent && parent->counter >= tag.counter) json_malformed("node anchored on a later node");

        auto node = typename Rga<T>::Node{
            .parent = std::move(parent),
            .value = n.at("value").get<T>(),
            .deleted = n.at("deleted").get<bool>(),
        };
        if (!nodes.emplace(std::move(tag), std::move(node)).second) json_malformed("duplicate node id");
    }
    for (const auto& [tag, node] : nodes) {
        if (node.parent && !nodes.contains(*node.parent)) json_malformed("node anchored on a missing node");
    }
    StateAccess::rebuild(result);
    rga = std::move(result);
}

}  // namespace detail

// -- Sets ---------------------------------------------------------------------

template <typename T>
void to_json(nlohmann::json& j, const GSet<T>& s) {
    j = nlohmann::json{{"type", "gset"}, {"replica", s.replica()}, {"elements", s.value()}};
}

template <typename T>
void from_json(const nlohmann::json& j, GSet<T>& s) {
    detail::expect_json_type(j, "gset");
    auto result = GSet<T>{j.at("replica").get<ReplicaId>()};
    for (const auto& e : j.at("elements")) result.insert(e.get<T>());
    s = std::move(result);
}

template <typename T>
void to_json(nlohmann::json& j, const TwoPSet<T>& s) {
    j = nlohmann::json{
        {"type", "twop_set"},
        {"replica", s.replica()},
        {"added", s.added().value()},
        {"removed", s.removed().value()},
    };
}

template <typename T>
void from_json(const nlohmann::json& j, TwoPSet<T>& s) {
    using detail::StateAccess;
    detail::expect_json_type(j, "twop_set");
    auto replica = j.at("replica").get<ReplicaId>();
    auto result = TwoPSet<T>{replica};
    auto& added = StateAccess::elements(StateAccess::added(result));
    auto& removed = StateAccess::elements(StateAccess::removed(result));
    added = j.at("added").get<std::set<T>>();
    removed = j.at("removed").get<std::set<T>>();
    if (!std::ranges::includes(added, removed)) {
        detail::json_malformed("removed element was never added");
    }
    s = std::move(result);
}

template <typename T>
void to_json(nlohmann::json& j, const ORSetDelta<T>& d) {
    auto additions = nlohmann::json::array();
    for (const auto& [value, tags] : d.additions) {
        additions.push_back(nlohmann::json{{"value", value}, {"tags", tags}});
    }
    j = nlohmann::json{{"additions", std::move(additions)}, {"tombstones", d.tombstones}};
}

template <typename T>
void from_json(const nlohmann::json& j, ORSetDelta<T>& d) {
    auto result = ORSetDelta<T>{};
    for (const auto& a : j.at("additions")) {
        auto tags = a.at("tags").get<std::set<Tag>>();
        if (tags.empty()) detail::json_malformed("element without add-tags");
        if (!result.additions.emplace(a.at("value").get<T>(), std::move(tags)).second) {
            detail::json_malformed("duplicate set element");
        }
    }
    result.tombstones = j.at("tombstones").get<std::set<Tag>>();
    d = std::move(result);
}

template <typename T>
void to_json(nlohmann::json& j, const ORSet<T>& s) {
    using detail::StateAccess;
    auto elements = nlohmann::json::array();
    for (const auto& [value, tags] : StateAccess::elements(s)) {
        elements.push_back(nlohmann::json{{"value", value}, {"tags", tags}});
    }
    j = nlohmann::json{
        {"type", "or_set"},
        {"replica", s.replica()},
        {"counter", StateAccess::counter(s)},
        {"elements", std::move(elements)},
        {"tombstones", s.tombstones()},
    };
}

template <typename T>
void from_json(const nlohmann::json& j, ORSet<T>& s) {
    using detail::StateAccess;
    detail::expect_json_type(j, "or_set");
    auto result = ORSet<T>{j.at("replica").get<ReplicaId>()};
    auto& counter = StateAccess::counter(result);
    auto& elements = StateAccess::elements(result);
    auto& tombstones = StateAccess::tombstones(result);

    counter = j.at("counter").get<std::uint64_t>();
    tombstones = j.at("tombstones").get<std::set<Tag>>();
    for (const auto& e : j.at("elements")) {
        auto tags = e.at("tags").get<std::set<Tag>>();
        if (tags.empty()) detail::json_malformed("element without live tags");
        for (const auto& tag : tags) {
            if (tombstones.contains(tag)) detail::json_malformed("live tag is tombstoned");
            if (!StateAccess::minted_in_range(result, tag)) {
                detail::json_malformed("tag minted ahead of counter");
            }
        }
        if (!elements.emplace(e.at("value").get<T>(), std::move(tags)).second) {
            detail::json_malformed("duplicate set element");
        }
    }
    for (const auto& tag : tombstones) {
        if (!StateAccess::minted_in_range(result, tag)) {
            detail::json_malformed("tombstone minted ahead of counter");
        }
    }
    if (!StateAccess::reindex(result)) detail::json_malformed("tag shared by two elements");
    s = std::move(result);
}

// -- Registers ----------------------------------------------------------------

template <typename T>
void to_json(nlohmann::json& j, const LWWRegister<T>& r) {
    j = nlohmann::json{{"type", "lww_register"}, {"replica", r.replica()}, {"entry", nullptr}};
    if (const auto& e = r.entry()) {
        j["entry"] = nlohmann::json{
            {"value", e->value}, {"timestamp", e->timestamp}, {"writer", e->writer}};
    }
}

template <typename T>
void from_json(const nlohmann::json& j, LWWRegister<T>& r) {
    detail::expect_json_type(j, "lww_register");
    auto result = LWWRegister<T>{j.at("replica").get<ReplicaId>()};
    const auto& e = j.at("entry");
    if (!e.is_null()) {
        detail::StateAccess::entry(result) = typename LWWRegister<T>::Entry{
            .value = e.at("value").get<T>(),
            .timestamp = e.at("timestamp").get<HybridTimestamp>(),
            .writer = e.at("writer").get<ReplicaId>(),
        };
    }
    r = std::move(result);
}

template <typename T>
void to_json(nlohmann::json& j, const MVRegister<T>& r) {
    auto entries = nlohmann::json::array();
    for (const auto& e : r.entries()) {
        entries.push_back(nlohmann::json{{"value", e.value}, {"stamp", e.stamp}});
    }
    j = nlohmann::json{
        {"type", "mv_register"},
        {"replica", r.replica()},
        {"version", r.version()},
        {"entries", std::move(entries)},
    };
}

template <typename T>
void from_json(const nlohmann::json& j, MVRegister<T>& r) {
    using detail::StateAccess;
    detail::expect_json_type(j, "mv_register");
    auto result = MVRegister<T>{j.at("replica").get<ReplicaId>()};
    auto& version = StateAccess::version(result);
    auto& entries = StateAccess::entries(result);

    version = j.at("version").get<VersionVector>();
    for (const auto& e : j.at("entries")) {
        auto stamp = e.at("stamp").get<VersionVector>();
        if (!version.dominates(stamp)) detail::json_malformed("entry stamp ahead of register version");
        if (!entries.empty() && !(entries.back().stamp < stamp)) {
            detail::json_malformed("entries out of order");
        }
        for (const auto& prior : entries) {
            if (!prior.stamp.concurrent_with(stamp)) detail::json_malformed("entry is causally dominated");
        }
        entries.push_back(typename MVRegister<T>::Entry{
            .value = e.at("value").get<T>(), .stamp = std::move(stamp)});
    }
    r = std::move(result);
}

// -- Sequences ----------------------------------------------------------------

template <typename T>
void to_json(nlohmann::json& j, const Rga<T>& rga) {
    j = nlohmann::json{{"type", "rga"}};
    detail::rga_to_json(j, rga);
}

template <typename T>
void from_json(const nlohmann::json& j, Rga<T>& rga) {
    detail::expect_json_type(j, "rga");
    detail::rga_from_json(j, rga);
}

}  // namespace crdt_kit
