#include <crdt-kit/lww_register.hpp>
#include <crdt-kit/error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

using namespace crdt_kit;

static_assert(Crdt<LWWRegister<std::string>>);

TEST(LWWRegister, starts_empty) {
    auto r = LWWRegister<std::string>{"a"};
    EXPECT_FALSE(r.value().has_value());
    EXPECT_FALSE(r.writer().has_value());
    EXPECT_EQ(r.timestamp(), HybridTimestamp{});
}

TEST(LWWRegister, later_timestamp_wins) {
    auto a = LWWRegister<std::string>{"a", "old", {100, 0}};
    auto b = LWWRegister<std::string>{"b", "new", {200, 0}};

    a.merge(b);
    EXPECT_EQ(a.value(), "new");
    EXPECT_EQ(a.writer(), ReplicaId{"b"});

    b.merge(LWWRegister<std::string>{"c", "older", {50, 0}});
    EXPECT_EQ(b.value(), "new");
}

TEST(LWWRegister, equal_timestamps_break_ties_by_replica) {
    auto a = LWWRegister<std::string>{"a", "from a", {100, 0}};
    auto b = LWWRegister<std::string>{"b", "from b", {100, 0}};

    auto ab = a;
    ab.merge(b);
    auto ba = b;
    ba.merge(a);
    EXPECT_EQ(ab, ba);
    EXPECT_EQ(ab.value(), "from b");
}

TEST(LWWRegister, logical_component_orders_same_millisecond_writes) {
    auto a = LWWRegister<int>{"a", 1, {100, 1}};
    auto b = LWWRegister<int>{"b", 2, {100, 0}};
    a.merge(b);
    EXPECT_EQ(a.value(), 1);
}

TEST(LWWRegister, empty_register_loses_to_written_one) {
    auto empty = LWWRegister<int>{"z"};
    auto written = LWWRegister<int>{"a", 7, {1, 0}};

    empty.merge(written);
    EXPECT_EQ(empty.value(), 7);
    written.merge(LWWRegister<int>{"z"});
    EXPECT_EQ(written.value(), 7);
}

TEST(LWWRegister, set_with_explicit_timestamp_is_ignored_when_stale) {
    auto r = LWWRegister<int>{"a"};
    EXPECT_TRUE(r.set(1, {100, 0}));
    EXPECT_FALSE(r.set(2, {99, 0}));
    EXPECT_EQ(r.value(), 1);
    EXPECT_TRUE(r.set(3, {101, 0}));
    EXPECT_EQ(r.value(), 3);
}

TEST(LWWRegister, set_with_clock_beats_merged_future_write) {
    auto now = std::uint64_t{1000};
    auto clock = HybridClock{[&] { return now; }};

    auto local = LWWRegister<std::string>{"a"};
    local.merge(LWWRegister<std::string>{"b", "from the future", {5000, 3}});

    const auto ts = local.set("local edit", clock);
    EXPECT_EQ(ts, (HybridTimestamp{5000, 4}));
    EXPECT_EQ(local.value(), "local edit");
    EXPECT_EQ(local.writer(), ReplicaId{"a"});
}

TEST(LWWRegister, set_with_clock_survives_peer_at_saturated_logical) {
    auto clock = HybridClock{[] { return std::uint64_t{100}; }};
    const auto peer = LWWRegister<int>{"z", 1, {100, std::numeric_limits<std::uint32_t>::max()}};

    auto local = LWWRegister<int>{"a"};
    local.merge(peer);
    const auto ts = local.set(2, clock);
    EXPECT_EQ(ts, (HybridTimestamp{101, 0}));

    local.merge(peer);
    EXPECT_EQ(local.value(), 2);
    EXPECT_EQ(local.writer(), ReplicaId{"a"});
}

TEST(LWWRegister, set_with_clock_on_empty_register_uses_now) {
    auto clock = HybridClock{[] { return std::uint64_t{42}; }};
    auto r = LWWRegister<int>{"a"};
    EXPECT_EQ(r.set(9, clock), (HybridTimestamp{42, 0}));
}

TEST(LWWRegister, equality_ignores_owner) {
    auto a = LWWRegister<int>{"a"};
    auto b = LWWRegister<int>{"b"};
    EXPECT_EQ(a, b);
}

TEST(LWWRegister, decode_round_trips) {
    auto r = LWWRegister<std::string>{"a", "hello", {123, 4}};
    auto decoded = LWWRegister<std::string>::decode(r.encode());
    EXPECT_EQ(decoded, r);
    EXPECT_EQ(decoded.timestamp(), (HybridTimestamp{123, 4}));

    auto empty = LWWRegister<std::string>{"b"};
    EXPECT_EQ(LWWRegister<std::string>::decode(empty.encode()), empty);
}

TEST(LWWRegister, decode_rejects_other_types) {
    auto r = LWWRegister<std::string>{"a", "hello", {1, 0}};
    EXPECT_THROW(LWWRegister<double>::decode(r.encode()), DecodeError);
}
