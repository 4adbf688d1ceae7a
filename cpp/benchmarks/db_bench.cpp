#include <benchmark/benchmark.h>

#include <memory>
#include <vector>

#include "kairos/db/db.hpp"

using namespace kairos::db;
using namespace kairos::core;

namespace {

constexpr ScopeId kScope{1};

TemporalFact make_bench_fact(u64 entity, Timestamp start) {
    TemporalFact f;
    f.owner = OwnerRef{EntityKind::Event, EntityId{entity}};
    f.scope = kScope;
    f.start = start;
    return f;
}

std::unique_ptr<SqliteFactStore> open_store() {
    std::unique_ptr<SqliteFactStore> store;
    DbConfig cfg{};
    if (!is_ok(SqliteFactStore::open(cfg, &store))) {
        return nullptr;
    }
    return store;
}

// Opens an in-memory store holding `n` facts one minute apart.
std::unique_ptr<SqliteFactStore> seeded_store(u64 n) {
    auto store = open_store();
    if (!store || !is_ok(store->scope_ensure(kScope))) {
        return nullptr;
    }
    ScopedTxn txn(*store);
    if (!is_ok(txn.begin())) {
        return nullptr;
    }
    for (u64 i = 0; i < n; ++i) {
        FactId id{};
        if (!is_ok(store->fact_insert(make_bench_fact(i + 1, static_cast<Timestamp>(i) * 60), &id))) {
            return nullptr;
        }
    }
    if (!is_ok(txn.commit())) {
        return nullptr;
    }
    return store;
}

} // namespace

//=============================================================================
// Lifecycle
//=============================================================================

static void BM_StoreOpen(benchmark::State& state) {
    for (auto _ : state) {
        auto store = open_store();
        benchmark::DoNotOptimize(store.get());
    }
}
BENCHMARK(BM_StoreOpen);

//=============================================================================
// Writes
//=============================================================================

static void BM_FactInsert(benchmark::State& state) {
    auto store = open_store();
    if (!store || !is_ok(store->scope_ensure(kScope))) {
        state.SkipWithError("store setup failed");
        return;
    }
    u64 next = 1;
    for (auto _ : state) {
        FactId id{};
        Status s = store->fact_insert(make_bench_fact(next, static_cast<Timestamp>(next) * 60), &id);
        ++next;
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FactInsert);

static void BM_FactSetRelation(benchmark::State& state) {
    auto store = seeded_store(2);
    if (!store) {
        state.SkipWithError("store setup failed");
        return;
    }
    const Relation rel{RelationType::Precedes, FactId{2}, 0.8f};
    for (auto _ : state) {
        Status s = store->fact_set_relation(FactId{1}, rel);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FactSetRelation);

//=============================================================================
// Reads
//=============================================================================

static void BM_FactGet(benchmark::State& state) {
    auto store = seeded_store(1000);
    if (!store) {
        state.SkipWithError("store setup failed");
        return;
    }
    u64 id = 1;
    for (auto _ : state) {
        TemporalFact f;
        Status s = store->fact_get(FactId{id}, &f);
        id = id % 1000 + 1;
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FactGet);

static void BM_FactListScope(benchmark::State& state) {
    auto store = seeded_store(static_cast<u64>(state.range(0)));
    if (!store) {
        state.SkipWithError("store setup failed");
        return;
    }
    FactFilter filter{};
    filter.scope = kScope;
    for (auto _ : state) {
        std::vector<TemporalFact> out;
        Status s = store->fact_list(filter, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_FactListScope)->Arg(10)->Arg(100)->Arg(1000);

static void BM_FactListTimeframe(benchmark::State& state) {
    auto store = seeded_store(1000);
    if (!store) {
        state.SkipWithError("store setup failed");
        return;
    }
    FactFilter filter{};
    filter.scope = kScope;
    filter.frame_start = 100 * 60;
    filter.frame_end = 200 * 60;
    for (auto _ : state) {
        std::vector<TemporalFact> out;
        Status s = store->fact_list(filter, &out);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FactListTimeframe);
