/// @file bench_ordered_map.cpp
/// @brief Performance benchmarks for ordmap::OrderedMap.
///
/// Measured operations:
///   - Insertion (string and integer keys)
///   - Lookup (hit / miss)
///   - Erase churn (amortized compaction on erase)
///   - Ordered reads (keys(), iterators, for_each) with and without stale keys
///   - Derived operations (equals, transpose, clone)
///   - Arena (monotonic_buffer_resource) vs default allocation

#include <ordmap/ordmap.hpp>

#include <benchmark/benchmark.h>

#include <memory_resource>
#include <random>
#include <string>
#include <vector>

using namespace ordmap;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Keys "key_0" .. "key_{n-1}".
static std::vector<std::string> generate_keys(int64_t n) {
    std::vector<std::string> keys;
    keys.reserve(static_cast<size_t>(n));
    for (int64_t i = 0; i < n; ++i) keys.push_back("key_" + std::to_string(i));
    return keys;
}

static OrderedMap<int64_t> generate_map(int64_t n) {
    OrderedMap<int64_t> m;
    for (int64_t i = 0; i < n; ++i) m.set("key_" + std::to_string(i), i);
    return m;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Insertion
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_SetStringKeys(benchmark::State& state) {
    auto keys = generate_keys(state.range(0));
    for (auto _ : state) {
        OrderedMap<int64_t> m;
        int64_t i = 0;
        for (const auto& k : keys) m.set(k, i++);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SetStringKeys)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_SetIntegerKeys(benchmark::State& state) {
    const int64_t n = state.range(0);
    for (auto _ : state) {
        OrderedMap<int64_t> m;
        for (int64_t i = 0; i < n; ++i) m.set(i, i);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_SetIntegerKeys)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_SetArena(benchmark::State& state) {
    auto keys = generate_keys(state.range(0));
    for (auto _ : state) {
        std::pmr::monotonic_buffer_resource arena;
        OrderedMap<int64_t> m(&arena);
        int64_t i = 0;
        for (const auto& k : keys) m.set(k, i++);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SetArena)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Overwrite(benchmark::State& state) {
    auto keys = generate_keys(state.range(0));
    auto m = generate_map(state.range(0));
    int64_t v = 0;
    for (auto _ : state) {
        for (const auto& k : keys) m.set(k, ++v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Overwrite)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_FindHit(benchmark::State& state) {
    auto keys = generate_keys(state.range(0));
    auto m = generate_map(state.range(0));
    for (auto _ : state) {
        for (const auto& k : keys) benchmark::DoNotOptimize(m.find(k));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_FindHit)->Arg(10)->Arg(100)->Arg(1000);

static void BM_FindMiss(benchmark::State& state) {
    auto m = generate_map(state.range(0));
    const std::string missing = "not_a_key";
    for (auto _ : state) {
        benchmark::DoNotOptimize(m.find(missing));
    }
}
BENCHMARK(BM_FindMiss)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Erase churn
// ═══════════════════════════════════════════════════════════════════════════════

/// Erase and re-add random keys; compaction cost is amortized over erases.
static void BM_EraseChurn(benchmark::State& state) {
    const int64_t n = state.range(0);
    auto keys = generate_keys(n);
    auto m = generate_map(n);
    std::mt19937 rng(42);
    std::uniform_int_distribution<int64_t> dist(0, n - 1);
    for (auto _ : state) {
        const auto& k = keys[static_cast<size_t>(dist(rng))];
        m.erase(k);
        m.set(k, 0);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EraseChurn)->Arg(100)->Arg(10000);

static void BM_EraseAll(benchmark::State& state) {
    auto keys = generate_keys(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        auto m = generate_map(state.range(0));
        state.ResumeTiming();
        for (const auto& k : keys) m.erase(k);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EraseAll)->Arg(1000)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// Ordered reads
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Keys(benchmark::State& state) {
    auto m = generate_map(state.range(0));
    for (auto _ : state) {
        auto keys = m.keys();
        benchmark::DoNotOptimize(keys);
    }
}
BENCHMARK(BM_Keys)->Arg(100)->Arg(10000);

static void BM_EntryIterator(benchmark::State& state) {
    auto m = generate_map(state.range(0));
    for (auto _ : state) {
        int64_t sum = 0;
        for (const auto& entry : m.entry_iterator()) sum += entry.second;
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EntryIterator)->Arg(100)->Arg(10000);

static void BM_ForEach(benchmark::State& state) {
    auto m = generate_map(state.range(0));
    for (auto _ : state) {
        int64_t sum = 0;
        m.for_each([&sum](int64_t& v, const std::string&, OrderedMap<int64_t>&) { sum += v; });
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ForEach)->Arg(100)->Arg(10000);

/// Compaction of a ledger full of re-inserted duplicates (dedup pass).
static void BM_CompactDuplicates(benchmark::State& state) {
    const int64_t n = state.range(0);
    auto keys = generate_keys(n);
    for (auto _ : state) {
        state.PauseTiming();
        auto m = generate_map(n);
        for (const auto& k : keys) {
            m.erase(k);
            m.set(k, 1);
        }
        state.ResumeTiming();
        m.compact();
        benchmark::DoNotOptimize(m.ledger().size());
    }
}
BENCHMARK(BM_CompactDuplicates)->Arg(1000)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// Derived operations
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Equals(benchmark::State& state) {
    auto a = generate_map(state.range(0));
    auto b = a.clone();
    for (auto _ : state) {
        benchmark::DoNotOptimize(a.equals(b));
    }
}
BENCHMARK(BM_Equals)->Arg(100)->Arg(10000);

static void BM_Transpose(benchmark::State& state) {
    auto m = generate_map(state.range(0));
    for (auto _ : state) {
        auto t = m.transpose();
        benchmark::DoNotOptimize(t);
    }
}
BENCHMARK(BM_Transpose)->Arg(1000);

static void BM_Clone(benchmark::State& state) {
    auto m = generate_map(state.range(0));
    for (auto _ : state) {
        auto c = m.clone();
        benchmark::DoNotOptimize(c);
    }
}
BENCHMARK(BM_Clone)->Arg(1000)->Arg(10000);
