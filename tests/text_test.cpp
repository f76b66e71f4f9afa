#include <crdt-kit/text.hpp>
#include <crdt-kit/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace crdt_kit;

static_assert(Crdt<TextCrdt>);

TEST(TextCrdt, insert_str_and_to_string) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "Hello");
    t.insert_str(5, " world");
    EXPECT_EQ(t.to_string(), "Hello world");
    EXPECT_EQ(t.size(), 11u);
}

TEST(TextCrdt, insert_str_in_the_middle) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "Hd");
    t.insert_str(1, "ello worl");
    EXPECT_EQ(t.to_string(), "Hello world");
}

TEST(TextCrdt, insert_single_code_point) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "ac");
    t.insert(1, U'b');
    EXPECT_EQ(t.to_string(), "abc");
}

TEST(TextCrdt, sizes_count_code_points) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "h\xC3\xA9llo \xF0\x9F\x8C\x8D");  // "héllo 🌍"
    EXPECT_EQ(t.size(), 7u);
    EXPECT_EQ(t.remove(1), U'é');
    EXPECT_EQ(t.to_string(), "hllo \xF0\x9F\x8C\x8D");
}

TEST(TextCrdt, malformed_utf8_becomes_replacement_character) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "a\xFF" "b\xC3");
    EXPECT_EQ(t.size(), 4u);
    EXPECT_EQ(t.to_string(), "a\xEF\xBF\xBD" "b\xEF\xBF\xBD");
}

TEST(TextCrdt, overlong_encoding_is_rejected) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "\xC0\xAF");
    EXPECT_EQ(t.to_string(), "\xEF\xBF\xBD");
}

TEST(TextCrdt, remove_range) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "Hello cruel world");
    t.remove_range(5, 6);
    EXPECT_EQ(t.to_string(), "Hello world");
    EXPECT_EQ(t.chars().tombstone_count(), 6u);
}

TEST(TextCrdt, remove_range_past_end_throws) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "abc");
    EXPECT_THROW(t.remove_range(2, 2), std::out_of_range);
    EXPECT_THROW(t.remove_range(4, 0), std::out_of_range);
    EXPECT_EQ(t.to_string(), "abc");
    EXPECT_NO_THROW(t.remove_range(3, 0));
}

TEST(TextCrdt, insert_past_end_throws) {
    auto t = TextCrdt{"a"};
    EXPECT_THROW(t.insert_str(1, "x"), std::out_of_range);
    EXPECT_THROW(t.insert(1, U'x'), std::out_of_range);
}

TEST(TextCrdt, remove_out_of_bounds_returns_nullopt) {
    auto t = TextCrdt{"a"};
    EXPECT_FALSE(t.remove(0).has_value());
}

TEST(TextCrdt, fork_shares_history_with_new_identity) {
    auto a = TextCrdt{"a"};
    a.insert_str(0, "abc");
    auto b = a.fork("b");

    EXPECT_EQ(b.replica(), ReplicaId{"b"});
    EXPECT_EQ(b.to_string(), "abc");
    EXPECT_EQ(a, b);

    b.insert(3, U'd');
    EXPECT_EQ(b.chars().nodes().rbegin()->first.replica, ReplicaId{"b"});
}

TEST(TextCrdt, concurrent_edits_converge) {
    auto a = TextCrdt{"a"};
    a.insert_str(0, "The cat");
    auto b = a.fork("b");

    a.insert_str(7, "!");
    b.remove_range(4, 3);
    b.insert_str(4, "dog");

    auto ab = a;
    ab.merge(b);
    auto ba = b;
    ba.merge(a);
    EXPECT_EQ(ab, ba);
    EXPECT_EQ(ab.to_string(), "The dog!");
}

TEST(TextCrdt, decode_round_trips) {
    auto t = TextCrdt{"a"};
    t.insert_str(0, "na\xC3\xAFve");
    t.remove(0);
    auto decoded = TextCrdt::decode(t.encode());
    EXPECT_EQ(decoded, t);
    EXPECT_EQ(decoded.to_string(), "a\xC3\xAFve");
    EXPECT_EQ(decoded.replica(), ReplicaId{"a"});
}

TEST(TextCrdt, decode_rejects_plain_rga) {
    auto r = Rga<char32_t>{"a"};
    r.insert(0, U'x');
    EXPECT_THROW(TextCrdt::decode(r.encode()), DecodeError);
}
