#include <benchmark/benchmark.h>
#include "cmdreg/CommandTable.hpp"
#include <string>

static void BM_TablePut_SingleThread(benchmark::State& state) {
    cmdreg::CommandTable table("bench_put");
    int i = 0;
    for (auto _ : state) {
        table.put("cmd", cmdreg::CommandRef(std::to_string(i++)));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TablePut_SingleThread);

static void BM_TableGet_SingleThread(benchmark::State& state) {
    cmdreg::CommandTable table("bench_get");
    table.put("cmd", cmdreg::CommandRef("H"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.get("cmd"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TableGet_SingleThread);

static void BM_TableSnapshot(benchmark::State& state) {
    cmdreg::CommandTable table("bench_snapshot");
    for (int i = 0; i < state.range(0); ++i) {
        table.put("cmd" + std::to_string(i), cmdreg::CommandRef("H"));
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.snapshot());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_TableSnapshot)->Arg(16)->Arg(256);

static void BM_TableGet_Contended(benchmark::State& state) {
    static cmdreg::CommandTable table("bench_readers");
    if (state.thread_index() == 0) table.put("cmd", cmdreg::CommandRef("H"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.get("cmd"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TableGet_Contended)->Threads(1)->Threads(4)->Threads(8);

static void BM_TablePut_DistinctKeys(benchmark::State& state) {
    static cmdreg::CommandTable table("bench_writers");
    const std::string key = "cmd_" + std::to_string(state.thread_index());
    for (auto _ : state) {
        table.put(key, cmdreg::CommandRef("H"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TablePut_DistinctKeys)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
