#include <benchmark/benchmark.h>
#include "rid/core/ulid.hpp"

using namespace rid::core;

static void BM_UlidGenerate(benchmark::State& state) {
    for (auto _ : state) {
        Ulid u{};
        Status s = ulid_generate(&u);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(u);
    }
}
BENCHMARK(BM_UlidGenerate);

static void BM_UlidGeneratorNext(benchmark::State& state) {
    UlidGenerator gen;
    for (auto _ : state) {
        Ulid u{};
        Status s = gen.next(&u);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(u);
    }
}
BENCHMARK(BM_UlidGeneratorNext);

static void BM_UlidParse(benchmark::State& state) {
    for (auto _ : state) {
        Ulid u{};
        Status s = ulid_parse("01ARZ3NDEKTSV4RRFFQ69G5FAV", &u);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(u);
    }
}
BENCHMARK(BM_UlidParse);

static void BM_UlidRender(benchmark::State& state) {
    Ulid u{};
    ulid_generate(&u);
    for (auto _ : state) {
        UlidText t{};
        ulid_render(u, &t);
        benchmark::DoNotOptimize(t);
    }
}
BENCHMARK(BM_UlidRender);
