#include <crdt-kit/rga.hpp>
#include <crdt-kit/error.hpp>
#include <crdt-kit/encoding/serializer.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace crdt_kit;

static_assert(Crdt<Rga<int>>);

namespace {

auto as_string(const Rga<char>& rga) -> std::string {
    auto chars = rga.to_vector();
    return {chars.begin(), chars.end()};
}

void append(Rga<char>& rga, std::string_view text) {
    for (auto c : text) rga.push_back(c);
}

}  // namespace

TEST(Rga, insert_at_positions) {
    auto r = Rga<char>{"a"};
    r.insert(0, 'b');
    r.insert(0, 'a');
    r.insert(2, 'd');
    r.insert(2, 'c');
    EXPECT_EQ(as_string(r), "abcd");
    EXPECT_EQ(r.size(), 4u);
}

TEST(Rga, insert_past_end_throws) {
    auto r = Rga<char>{"a"};
    r.insert(0, 'x');
    EXPECT_THROW(r.insert(2, 'y'), std::out_of_range);
    EXPECT_NO_THROW(r.insert(1, 'y'));
}

TEST(Rga, node_ids_follow_lamport_counter) {
    auto a = Rga<char>{"a"};
    EXPECT_EQ(a.insert(0, 'x'), (Tag{1, "a"}));
    auto b = Rga<char>{"b"};
    b.merge(a);
    EXPECT_EQ(b.insert(1, 'y'), (Tag{2, "b"}));
}

TEST(Rga, remove_tombstones_and_returns_value) {
    auto r = Rga<char>{"a"};
    append(r, "abc");
    EXPECT_EQ(r.remove(1), 'b');
    EXPECT_EQ(as_string(r), "ac");
    EXPECT_EQ(r.node_count(), 3u);
    EXPECT_EQ(r.tombstone_count(), 1u);
    EXPECT_FALSE(r.remove(5).has_value());
}

TEST(Rga, get_skips_tombstones) {
    auto r = Rga<char>{"a"};
    append(r, "abc");
    r.remove(0);
    EXPECT_EQ(r.get(0), 'b');
    EXPECT_EQ(r.get(1), 'c');
    EXPECT_FALSE(r.get(2).has_value());
}

TEST(Rga, concurrent_inserts_at_head_order_by_descending_tag) {
    auto a = Rga<char>{"a"};
    auto b = Rga<char>{"b"};
    a.insert(0, 'x');
    b.insert(0, 'y');

    auto ab = a;
    ab.merge(b);
    auto ba = b;
    ba.merge(a);
    EXPECT_EQ(ab, ba);
    EXPECT_EQ(as_string(ab), "yx");
    EXPECT_EQ(as_string(ba), "yx");
}

TEST(Rga, concurrent_runs_do_not_interleave) {
    auto base = Rga<char>{"a"};
    append(base, "[]");
    auto a = base;
    auto b = Rga<char>{"b"};
    b.merge(base);

    a.insert(1, '1');
    a.insert(2, '2');
    b.insert(1, 'x');
    b.insert(2, 'y');

    a.merge(b);
    const auto merged = as_string(a);
    EXPECT_TRUE(merged == "[12xy]" || merged == "[xy12]") << merged;
}

TEST(Rga, insert_anchored_on_removed_element_keeps_its_place) {
    auto a = Rga<char>{"a"};
    append(a, "abc");
    auto b = Rga<char>{"b"};
    b.merge(a);

    a.remove(1);
    b.insert(2, 'X');

    a.merge(b);
    b.merge(a);
    EXPECT_EQ(as_string(a), "aXc");
    EXPECT_EQ(a, b);
}

TEST(Rga, concurrent_removes_of_same_element) {
    auto a = Rga<char>{"a"};
    append(a, "ab");
    auto b = a;
    a.remove(0);
    b.remove(0);
    a.merge(b);
    EXPECT_EQ(as_string(a), "b");
    EXPECT_EQ(a.tombstone_count(), 1u);
}

TEST(Rga, local_order_matches_rebuilt_order) {
    auto a = Rga<int>{"a"};
    a.insert(0, 1);
    a.insert(1, 2);
    a.insert(1, 3);
    a.insert(0, 4);
    a.remove(2);
    a.insert(2, 5);

    auto rebuilt = Rga<int>::decode(a.encode());
    EXPECT_EQ(rebuilt.to_vector(), a.to_vector());
    EXPECT_EQ(a.to_vector(), (std::vector<int>{4, 1, 5, 2}));
}

TEST(Rga, decode_round_trips_tombstones) {
    auto r = Rga<char>{"a"};
    append(r, "hello");
    r.remove(0);
    auto decoded = Rga<char>::decode(r.encode());
    EXPECT_EQ(decoded, r);
    EXPECT_EQ(decoded.tombstone_count(), 1u);
    EXPECT_EQ(decoded.insert(0, 'j'), (Tag{6, "a"}));
}

TEST(Rga, decode_rejects_missing_anchor) {
    auto payload = encoding::Serializer{};
    payload.write_replica_id("a");
    payload.write_uleb128(5);       // counter
    payload.write_uleb128(1);       // one node
    payload.write_tag(Tag{5, "a"});
    payload.write_bool(true);
    payload.write_tag(Tag{4, "a"});  // never sent
    encoding::write_value(payload, 'x');
    payload.write_bool(false);
    const auto bytes = encode_envelope(CrdtType::rga, payload.data());

    EXPECT_THROW(Rga<char>::decode(bytes), DecodeError);
}
