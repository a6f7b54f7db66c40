/// @file bench_vs_boost.cpp
/// @brief Head-to-head comparison: ordmap::OrderedMap vs an insertion-ordered
///        Boost.MultiIndex container (sequenced + hashed_unique index).
///
/// Both containers hold the same keys and run equivalent operations. Each
/// scenario has an *_Ordmap and a *_MultiIndex variant:
///   1. Insert n keys
///   2. Lookup by key
///   3. Erase / re-insert churn
///   4. Ordered traversal
///   5. Full copy
///
/// Boost.MultiIndex erases from its sequenced index eagerly; OrderedMap
/// leaves stale ledger entries and compacts in bulk.

#include <benchmark/benchmark.h>

// ─── ordmap headers ─────────────────────────────────────────────────────────
#include <ordmap/ordmap.hpp>

// ─── Boost.MultiIndex headers ───────────────────────────────────────────────
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>

#include <random>
#include <string>
#include <utility>
#include <vector>

namespace bmi = boost::multi_index;

// ═══════════════════════════════════════════════════════════════════════════════
// Shared test data and the Boost container
// ═══════════════════════════════════════════════════════════════════════════════

namespace testdata {

inline std::vector<std::string> keys(int64_t n) {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(n));
    for (int64_t i = 0; i < n; ++i) out.push_back("key_" + std::to_string(i));
    return out;
}

} // namespace testdata

struct Entry {
    std::string key;
    int64_t value;
};

struct by_key {};

using MultiIndexMap = bmi::multi_index_container<
    Entry,
    bmi::indexed_by<
        bmi::sequenced<>,
        bmi::hashed_unique<bmi::tag<by_key>,
                           bmi::member<Entry, std::string, &Entry::key>>>>;

/// Insert-or-overwrite with OrderedMap::set semantics.
static void multi_index_set(MultiIndexMap& m, const std::string& key, int64_t value) {
    auto& index = m.get<by_key>();
    auto it = index.find(key);
    if (it != index.end()) {
        index.modify(it, [value](Entry& e) { e.value = value; });
    } else {
        m.push_back(Entry{key, value});
    }
}

static ordmap::OrderedMap<int64_t> build_ordmap(const std::vector<std::string>& keys) {
    ordmap::OrderedMap<int64_t> m;
    int64_t i = 0;
    for (const auto& k : keys) m.set(k, i++);
    return m;
}

static MultiIndexMap build_multi_index(const std::vector<std::string>& keys) {
    MultiIndexMap m;
    int64_t i = 0;
    for (const auto& k : keys) multi_index_set(m, k, i++);
    return m;
}

// ═══════════════════════════════════════════════════════════════════════════════
// 1. INSERT
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Insert_Ordmap(benchmark::State& state) {
    auto keys = testdata::keys(state.range(0));
    for (auto _ : state) {
        auto m = build_ordmap(keys);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Insert_Ordmap)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Insert_MultiIndex(benchmark::State& state) {
    auto keys = testdata::keys(state.range(0));
    for (auto _ : state) {
        auto m = build_multi_index(keys);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Insert_MultiIndex)->Arg(100)->Arg(1000)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// 2. LOOKUP
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Lookup_Ordmap(benchmark::State& state) {
    auto keys = testdata::keys(state.range(0));
    auto m = build_ordmap(keys);
    size_t idx = 0;
    for (auto _ : state) {
        auto* p = m.find(keys[idx % keys.size()]);
        benchmark::DoNotOptimize(p);
        ++idx;
    }
    state.counters["keys"] = static_cast<double>(keys.size());
}
BENCHMARK(BM_Lookup_Ordmap)->Arg(10)->Arg(100)->Arg(1000);

static void BM_Lookup_MultiIndex(benchmark::State& state) {
    auto keys = testdata::keys(state.range(0));
    auto m = build_multi_index(keys);
    const auto& index = m.get<by_key>();
    size_t idx = 0;
    for (auto _ : state) {
        auto it = index.find(keys[idx % keys.size()]);
        benchmark::DoNotOptimize(it);
        ++idx;
    }
    state.counters["keys"] = static_cast<double>(keys.size());
}
BENCHMARK(BM_Lookup_MultiIndex)->Arg(10)->Arg(100)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// 3. ERASE / RE-INSERT CHURN
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Churn_Ordmap(benchmark::State& state) {
    auto keys = testdata::keys(state.range(0));
    auto m = build_ordmap(keys);
    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> dist(0, keys.size() - 1);
    for (auto _ : state) {
        const auto& k = keys[dist(rng)];
        m.erase(k);
        m.set(k, 0);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Churn_Ordmap)->Arg(100)->Arg(10000);

static void BM_Churn_MultiIndex(benchmark::State& state) {
    auto keys = testdata::keys(state.range(0));
    auto m = build_multi_index(keys);
    auto& index = m.get<by_key>();
    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> dist(0, keys.size() - 1);
    for (auto _ : state) {
        const auto& k = keys[dist(rng)];
        index.erase(k);
        multi_index_set(m, k, 0);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Churn_MultiIndex)->Arg(100)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// 4. ORDERED TRAVERSAL
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Traverse_Ordmap(benchmark::State& state) {
    auto m = build_ordmap(testdata::keys(state.range(0)));
    for (auto _ : state) {
        int64_t sum = 0;
        for (const auto& entry : m.entry_iterator()) sum += entry.second;
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Traverse_Ordmap)->Arg(100)->Arg(10000);

static void BM_Traverse_MultiIndex(benchmark::State& state) {
    auto m = build_multi_index(testdata::keys(state.range(0)));
    for (auto _ : state) {
        int64_t sum = 0;
        for (const auto& entry : m) sum += entry.value;
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Traverse_MultiIndex)->Arg(100)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// 5. COPY
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Copy_Ordmap(benchmark::State& state) {
    auto m = build_ordmap(testdata::keys(state.range(0)));
    for (auto _ : state) {
        auto c = m.clone();
        benchmark::DoNotOptimize(c);
    }
}
BENCHMARK(BM_Copy_Ordmap)->Arg(1000);

static void BM_Copy_MultiIndex(benchmark::State& state) {
    auto m = build_multi_index(testdata::keys(state.range(0)));
    for (auto _ : state) {
        MultiIndexMap c(m);
        benchmark::DoNotOptimize(c);
    }
}
BENCHMARK(BM_Copy_MultiIndex)->Arg(1000);
