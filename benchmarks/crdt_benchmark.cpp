// crdt-kit benchmarks: measures throughput of local updates, merges,
// delta extraction and the binary codec.

#include <crdt-kit/crdt_kit.hpp>
#include <crdt-kit/parallel.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace crdt_kit;

static auto replica_name(std::int64_t i) -> ReplicaId {
    return ReplicaId{"replica-" + std::to_string(i)};
}

// =============================================================================
// Counters
// =============================================================================

static void bm_gcounter_increment(benchmark::State& state) {
    auto c = GCounter{"bench"};
    for (auto _ : state) {
        c.increment();
    }
    benchmark::DoNotOptimize(c.value());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_gcounter_increment);

static void bm_gcounter_merge(benchmark::State& state) {
    const auto n = state.range(0);
    auto a = GCounter{"a"};
    auto b = GCounter{"b"};
    for (std::int64_t i = 0; i < n; ++i) {
        auto r = GCounter{replica_name(i)};
        r.increment(static_cast<std::uint64_t>(i + 1));
        (i % 2 == 0 ? a : b).merge(r);
    }
    for (auto _ : state) {
        auto m = a;
        m.merge(b);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_gcounter_merge)->Range(8, 4096);

static void bm_pncounter_delta(benchmark::State& state) {
    const auto n = state.range(0);
    auto full = PNCounter{"hub"};
    for (std::int64_t i = 0; i < n; ++i) {
        auto r = PNCounter{replica_name(i)};
        r.increment(3);
        r.decrement(1);
        full.merge(r);
    }
    auto peer = PNCounter{"peer"};
    peer.merge(full);
    full.increment();
    const auto since = peer.summary();

    for (auto _ : state) {
        auto d = full.delta(since);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pncounter_delta)->Range(8, 4096);

// =============================================================================
// Sets
// =============================================================================

static void bm_or_set_add(benchmark::State& state) {
    auto s = ORSet<std::int64_t>{"bench"};
    std::int64_t i = 0;
    for (auto _ : state) {
        s.add(i++ % 1024);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_or_set_add);

static void bm_or_set_merge(benchmark::State& state) {
    const auto n = state.range(0);
    auto a = ORSet<std::int64_t>{"a"};
    auto b = ORSet<std::int64_t>{"b"};
    for (std::int64_t i = 0; i < n; ++i) {
        a.add(i);
        b.add(i + n / 2);
    }
    for (std::int64_t i = 0; i < n; i += 4) b.remove(i + n / 2);

    for (auto _ : state) {
        auto m = a;
        m.merge(b);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_or_set_merge)->Range(8, 4096);

// =============================================================================
// Sequences
// =============================================================================

static void bm_text_append(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto t = TextCrdt{"bench"};
        for (std::size_t i = 0; i < n; ++i) t.insert(t.size(), U'x');
        benchmark::DoNotOptimize(t);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_text_append)->Range(64, 4096);

static void bm_text_concurrent_merge(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto base = TextCrdt{"base"};
    base.insert_str(0, std::string(n, 'a'));
    auto left = base.fork("left");
    auto right = base.fork("right");
    for (std::size_t i = 0; i < n; i += 8) {
        left.insert(i, U'L');
        right.remove(i % right.size());
    }

    for (auto _ : state) {
        auto m = left;
        m.merge(right);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_text_concurrent_merge)->Range(64, 4096);

// =============================================================================
// Codec
// =============================================================================

static void bm_text_encode(benchmark::State& state) {
    auto t = TextCrdt{"bench"};
    t.insert_str(0, std::string(static_cast<std::size_t>(state.range(0)), 'z'));
    for (auto _ : state) {
        auto bytes = t.encode();
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_text_encode)->Range(64, 4096);

static void bm_text_decode(benchmark::State& state) {
    auto t = TextCrdt{"bench"};
    t.insert_str(0, std::string(static_cast<std::size_t>(state.range(0)), 'z'));
    const auto bytes = t.encode();
    for (auto _ : state) {
        auto decoded = TextCrdt::decode(bytes);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_text_decode)->Range(64, 4096);

// =============================================================================
// Parallel merge: sequential fold vs Taskflow reduction
// =============================================================================

static auto make_replicas(std::int64_t n) -> std::vector<ORSet<std::int64_t>> {
    auto replicas = std::vector<ORSet<std::int64_t>>{};
    replicas.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        auto& r = replicas.emplace_back(replica_name(i));
        for (std::int64_t k = 0; k < 32; ++k) r.add(i * 32 + k);
    }
    return replicas;
}

static void bm_merge_all_sequential(benchmark::State& state) {
    const auto replicas = make_replicas(state.range(0));
    for (auto _ : state) {
        auto m = merge_all<ORSet<std::int64_t>>(replicas);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_merge_all_sequential)->Range(8, 512);

static void bm_merge_all_parallel(benchmark::State& state) {
    const auto replicas = make_replicas(state.range(0));
    for (auto _ : state) {
        auto m = merge_all<ORSet<std::int64_t>>(replicas, global_executor());
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_merge_all_parallel)->Range(8, 512);
