#include <crdt-kit/gset.hpp>
#include <crdt-kit/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace crdt_kit;

static_assert(Crdt<GSet<std::string>>);

TEST(GSet, insert_reports_new_elements) {
    auto s = GSet<std::string>{"a"};
    EXPECT_TRUE(s.insert("x"));
    EXPECT_FALSE(s.insert("x"));
    EXPECT_TRUE(s.contains("x"));
    EXPECT_FALSE(s.contains("y"));
    EXPECT_EQ(s.size(), 1u);
}

TEST(GSet, iterates_in_element_order) {
    auto s = GSet<int>{"a"};
    s.insert(3);
    s.insert(1);
    s.insert(2);
    EXPECT_EQ((std::vector<int>{s.begin(), s.end()}), (std::vector<int>{1, 2, 3}));
}

TEST(GSet, merge_is_union) {
    auto a = GSet<int>{"a"};
    a.insert(1);
    a.insert(2);
    auto b = GSet<int>{"b"};
    b.insert(2);
    b.insert(3);

    a.merge(b);
    EXPECT_EQ(a.value(), (std::set<int>{1, 2, 3}));
    b.merge(a);
    EXPECT_EQ(a, b);
}

TEST(GSet, decode_round_trips) {
    auto s = GSet<std::string>{"a"};
    s.insert("apple");
    s.insert("pear");
    auto decoded = GSet<std::string>::decode(s.encode());
    EXPECT_EQ(decoded, s);
    EXPECT_EQ(decoded.replica(), ReplicaId{"a"});
}

TEST(GSet, decode_rejects_wrong_element_type) {
    auto s = GSet<std::string>{"a"};
    s.insert("apple");
    EXPECT_THROW(GSet<std::int64_t>::decode(s.encode()), DecodeError);
}
