#include <crdt-kit/parallel.hpp>
#include <crdt-kit/gcounter.hpp>
#include <crdt-kit/or_set.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace crdt_kit;

namespace {

auto many_counters(int n) -> std::vector<GCounter> {
    auto counters = std::vector<GCounter>{};
    for (int i = 0; i < n; ++i) {
        auto c = GCounter{"replica-" + std::to_string(i)};
        c.increment(static_cast<std::uint64_t>(i + 1));
        counters.push_back(std::move(c));
    }
    return counters;
}

}  // namespace

TEST(MergeAll, empty_input_gives_empty_state) {
    const auto none = std::vector<GCounter>{};
    EXPECT_EQ(merge_all<GCounter>(none).value(), 0u);
    EXPECT_EQ(merge_all<GCounter>(none, global_executor()).value(), 0u);
}

TEST(MergeAll, sequential_sums_counters) {
    const auto counters = many_counters(10);
    EXPECT_EQ(merge_all<GCounter>(counters).value(), 55u);
}

TEST(MergeAll, parallel_matches_sequential) {
    const auto counters = many_counters(500);
    auto executor = tf::Executor{4};
    const auto parallel = merge_all<GCounter>(counters, executor);
    const auto sequential = merge_all<GCounter>(counters);
    EXPECT_EQ(parallel, sequential);
    EXPECT_EQ(parallel.value(), 500u * 501u / 2u);
}

TEST(MergeAll, parallel_or_set_keeps_add_wins) {
    auto replicas = std::vector<ORSet<std::string>>{};
    for (int i = 0; i < 64; ++i) {
        auto s = ORSet<std::string>{"r" + std::to_string(i)};
        s.add("item-" + std::to_string(i % 8));
        if (i % 2 == 0) s.remove("item-" + std::to_string(i % 8));
        replicas.push_back(std::move(s));
    }

    const auto combined = merge_all<ORSet<std::string>>(replicas, global_executor());
    EXPECT_EQ(combined, merge_all<ORSet<std::string>>(replicas));
    // Items added on odd replicas were never removed there.
    EXPECT_EQ(combined.size(), 4u);
    EXPECT_TRUE(combined.contains("item-1"));
    EXPECT_FALSE(combined.contains("item-0"));
}

TEST(MergeAll, sequential_result_keeps_first_owner) {
    const auto counters = many_counters(3);
    EXPECT_EQ(merge_all<GCounter>(counters).replica(), ReplicaId{"replica-0"});
}
