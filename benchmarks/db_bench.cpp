#include <benchmark/benchmark.h>
#include "rid/db/db.hpp"
#include "rid/db/queries.hpp"

using namespace rid::db;
using namespace rid::core;

namespace {

DbHandle open_bench_db() {
    DbConfig cfg{};
    DbHandle handle{};
    db_open(cfg, &handle);
    db_exec(handle, "CREATE TABLE resources (id VARCHAR(30) NOT NULL)");
    return handle;
}

} // namespace

//=============================================================================
// Column Codec Benchmarks
//=============================================================================

static void BM_ResourceIdPut(benchmark::State& state) {
    DbHandle handle = open_bench_db();
    UlidGenerator gen;

    for (auto _ : state) {
        state.PauseTiming();
        ResourceId id;
        resource_id_new("ACCT", gen, &id);
        state.ResumeTiming();

        Status s = db_resource_id_put(handle, "resources", "id", id, nullptr);
        benchmark::DoNotOptimize(s);
    }

    db_close(handle);
}
BENCHMARK(BM_ResourceIdPut);

static void BM_ResourceIdGet(benchmark::State& state) {
    DbHandle handle = open_bench_db();
    ResourceId id;
    resource_id_new("ACCT", &id);
    i64 rowid = 0;
    db_resource_id_put(handle, "resources", "id", id, &rowid);

    for (auto _ : state) {
        ResourceId out;
        Status s = db_resource_id_get(handle, "resources", "id", rowid, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }

    db_close(handle);
}
BENCHMARK(BM_ResourceIdGet);

static void BM_ResourceIdScan(benchmark::State& state) {
    DbHandle handle = open_bench_db();
    UlidGenerator gen;
    for (int64_t i = 0; i < state.range(0); ++i) {
        ResourceId id;
        resource_id_new("ACCT", gen, &id);
        db_resource_id_put(handle, "resources", "id", id, nullptr);
    }

    for (auto _ : state) {
        ScanSummary summary{};
        Status s = db_resource_id_scan(handle, "resources", "id", nullptr, nullptr, &summary);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(summary);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));

    db_close(handle);
}
BENCHMARK(BM_ResourceIdScan)->Arg(100)->Arg(1000);
