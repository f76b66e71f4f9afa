#include <crdt-kit/clock.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace crdt_kit;

namespace {

// A physical clock the test moves by hand.
struct ManualTime {
    std::uint64_t ms{0};
    auto source() -> TimeSource {
        return [this] { return ms; };
    }
};

}  // namespace

TEST(HybridTimestamp, orders_physical_then_logical) {
    EXPECT_LT((HybridTimestamp{1, 9}), (HybridTimestamp{2, 0}));
    EXPECT_LT((HybridTimestamp{5, 0}), (HybridTimestamp{5, 1}));
    EXPECT_EQ((HybridTimestamp{5, 1}), (HybridTimestamp{5, 1}));
}

TEST(HybridClock, now_follows_physical_time) {
    auto time = ManualTime{.ms = 1000};
    auto clock = HybridClock{time.source()};

    EXPECT_EQ(clock.now(), (HybridTimestamp{1000, 0}));
    time.ms = 2000;
    EXPECT_EQ(clock.now(), (HybridTimestamp{2000, 0}));
}

TEST(HybridClock, now_bumps_logical_within_same_millisecond) {
    auto time = ManualTime{.ms = 5000};
    auto clock = HybridClock{time.source()};

    EXPECT_EQ(clock.now(), (HybridTimestamp{5000, 0}));
    EXPECT_EQ(clock.now(), (HybridTimestamp{5000, 1}));
    EXPECT_EQ(clock.now(), (HybridTimestamp{5000, 2}));
}

TEST(HybridClock, now_is_monotonic_when_physical_goes_backward) {
    auto time = ManualTime{.ms = 5000};
    auto clock = HybridClock{time.source()};

    auto t1 = clock.now();
    time.ms = 3000;
    auto t2 = clock.now();
    EXPECT_LT(t1, t2);
    EXPECT_EQ(t2, (HybridTimestamp{5000, 1}));
}

TEST(HybridClock, receive_from_clock_ahead_carries_remote_logical) {
    auto time = ManualTime{.ms = 5000};
    auto clock = HybridClock{time.source()};

    auto t = clock.receive(HybridTimestamp{9000, 3});
    EXPECT_EQ(t, (HybridTimestamp{9000, 4}));
    EXPECT_EQ(clock.last(), t);
}

TEST(HybridClock, receive_with_equal_physicals_takes_max_logical) {
    auto time = ManualTime{.ms = 100};
    auto clock = HybridClock{time.source()};

    clock.now();  // {100, 0}
    clock.now();  // {100, 1}
    auto t = clock.receive(HybridTimestamp{100, 7});
    EXPECT_EQ(t, (HybridTimestamp{100, 8}));
}

TEST(HybridClock, receive_resets_logical_when_physical_is_ahead) {
    auto time = ManualTime{.ms = 10'000};
    auto clock = HybridClock{time.source()};

    auto t = clock.receive(HybridTimestamp{9000, 42});
    EXPECT_EQ(t, (HybridTimestamp{10'000, 0}));
}

TEST(HybridClock, receive_is_strictly_after_local_and_remote) {
    auto time = ManualTime{.ms = 100};
    auto clock = HybridClock{time.source()};

    auto local = clock.now();
    auto remote = HybridTimestamp{50, 3};
    auto t = clock.receive(remote);
    EXPECT_GT(t, local);
    EXPECT_GT(t, remote);
}

TEST(HybridClock, receive_carries_saturated_logical_into_physical) {
    auto time = ManualTime{.ms = 100};
    auto clock = HybridClock{time.source()};

    const auto remote = HybridTimestamp{100, std::numeric_limits<std::uint32_t>::max()};
    auto t = clock.receive(remote);
    EXPECT_EQ(t, (HybridTimestamp{101, 0}));
    EXPECT_GT(t, remote);
}

TEST(HybridClock, now_carries_saturated_logical_into_physical) {
    auto time = ManualTime{.ms = 100};
    auto clock = HybridClock{time.source()};

    const auto saturated = clock.receive(
        HybridTimestamp{100, std::numeric_limits<std::uint32_t>::max() - 1});
    EXPECT_EQ(saturated, (HybridTimestamp{100, std::numeric_limits<std::uint32_t>::max()}));

    auto t = clock.now();
    EXPECT_EQ(t, (HybridTimestamp{101, 0}));
    EXPECT_EQ(clock.now(), (HybridTimestamp{101, 1}));
}

TEST(HybridClock, default_clock_reads_system_time) {
    auto clock = HybridClock{};
    auto t = clock.now();
    EXPECT_GT(t.physical, 0u);
    EXPECT_GE(system_time_ms(), t.physical);
}
