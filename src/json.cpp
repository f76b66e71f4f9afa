#include <crdt-kit/json.hpp>

#include <stdexcept>
#include <string>

namespace crdt_kit {

namespace detail {

void expect_json_type(const nlohmann::json& j, std::string_view expected) {
    const auto found = j.at("type").get<std::string>();
    if (found != expected) {
        throw DecodeError{ErrorKind::type_mismatch,
            "expected " + std::string{expected} + ", found " + found};
    }
}

void json_malformed(std::string_view what) {
    throw DecodeError{ErrorKind::malformed_payload, std::string{what}};
}

}  // namespace detail

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const ReplicaId& id) {
    j = id.to_hex();
}

void from_json(const nlohmann::json& j, ReplicaId& id) {
    try {
        id = ReplicaId::from_hex(j.get<std::string>());
    } catch (const std::invalid_argument& e) {
        detail::json_malformed(e.what());
    }
}

void to_json(nlohmann::json& j, const Tag& tag) {
    j = nlohmann::json{{"counter", tag.counter}, {"replica", tag.replica}};
}

void from_json(const nlohmann::json& j, Tag& tag) {
    tag = Tag{j.at("counter").get<std::uint64_t>(), j.at("replica").get<ReplicaId>()};
}

void to_json(nlohmann::json& j, const HybridTimestamp& ts) {
    j = nlohmann::json{{"physical", ts.physical}, {"logical", ts.logical}};
}

void from_json(const nlohmann::json& j, HybridTimestamp& ts) {
    ts.physical = j.at("physical").get<std::uint64_t>();
    ts.logical = j.at("logical").get<std::uint32_t>();
}

// Keyed by hex replica id: {"616c696365": 3}
void to_json(nlohmann::json& j, const VersionVector& vv) {
    j = nlohmann::json::object();
    for (const auto& [replica, counter] : vv) {
        j[replica.to_hex()] = counter;
    }
}

void from_json(const nlohmann::json& j, VersionVector& vv) {
    auto result = VersionVector{};
    for (const auto& [key, value] : j.items()) {
        const auto counter = value.get<std::uint64_t>();
        if (counter == 0) detail::json_malformed("zero version vector entry");
        result.set(nlohmann::json(key).get<ReplicaId>(), counter);
    }
    vv = std::move(result);
}

// -- Counters -----------------------------------------------------------------

void to_json(nlohmann::json& j, const GCounter& c) {
    j = nlohmann::json{{"type", "gcounter"}, {"replica", c.replica()}, {"counts", c.counts()}};
}

void from_json(const nlohmann::json& j, GCounter& c) {
    detail::expect_json_type(j, "gcounter");
    auto result = GCounter{j.at("replica").get<ReplicaId>()};
    detail::StateAccess::counts(result) = j.at("counts").get<VersionVector>();
    c = std::move(result);
}

void to_json(nlohmann::json& j, const GCounterDelta& d) {
    j = nlohmann::json{{"counts", d.counts}};
}

void from_json(const nlohmann::json& j, GCounterDelta& d) {
    d.counts = j.at("counts").get<VersionVector>();
}

void to_json(nlohmann::json& j, const PNCounter& c) {
    j = nlohmann::json{
        {"type", "pncounter"},
        {"replica", c.replica()},
        {"increments", c.increments().counts()},
        {"decrements", c.decrements().counts()},
    };
}

void from_json(const nlohmann::json& j, PNCounter& c) {
    using detail::StateAccess;
    detail::expect_json_type(j, "pncounter");
    auto result = PNCounter{j.at("replica").get<ReplicaId>()};
    StateAccess::counts(StateAccess::increments(result)) = j.at("increments").get<VersionVector>();
    StateAccess::counts(StateAccess::decrements(result)) = j.at("decrements").get<VersionVector>();
    c = std::move(result);
}

void to_json(nlohmann::json& j, const PNCounterDelta& d) {
    j = nlohmann::json{{"increments", d.increments}, {"decrements", d.decrements}};
}

void from_json(const nlohmann::json& j, PNCounterDelta& d) {
    d.increments = j.at("increments").get<GCounterDelta>();
    d.decrements = j.at("decrements").get<GCounterDelta>();
}

// -- Text ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const TextCrdt& t) {
    j = nlohmann::json{{"type", "text"}, {"text", t.to_string()}};
    detail::rga_to_json(j, t.chars());
}

void from_json(const nlohmann::json& j, TextCrdt& t) {
    detail::expect_json_type(j, "text");
    auto result = TextCrdt{};
    detail::rga_from_json(j, detail::StateAccess::chars(result));
    t = std::move(result);
}

void to_json(nlohmann::json& j, const ORSetSummary& s) {
    j = nlohmann::json{{"adds", s.adds}, {"tombstones", s.tombstones}};
}

void from_json(const nlohmann::json& j, ORSetSummary& s) {
    s.adds = j.at("adds").get<std::set<Tag>>();
    s.tombstones = j.at("tombstones").get<std::set<Tag>>();
}

}  // namespace crdt_kit
