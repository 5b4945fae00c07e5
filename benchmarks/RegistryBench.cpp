#include <benchmark/benchmark.h>
#include "cmdreg/CommandStorage.hpp"
#include "cmdreg/Registry.hpp"
#include "cmdreg/RegistryOwner.hpp"
#include "cmdreg/util/Logger.hpp"
#include <string>

static cmdreg::TableOptions unnamed() {
    cmdreg::TableOptions o;
    o.globallyNamed = false;
    return o;
}

static void BM_AddNested_SingleThread(benchmark::State& state) {
    cmdreg::util::logger().setLevel(cmdreg::util::LogLevel::Error);
    cmdreg::CommandTable table("bench_add", unnamed());
    const int width = static_cast<int>(state.range(0));
    int i = 0;
    for (auto _ : state) {
        auto st = cmdreg::registry::add({"mod", "sub" + std::to_string(i++ % width)},
                                        cmdreg::CommandRef("H"), table);
        benchmark::DoNotOptimize(st);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_AddNested_SingleThread)->Arg(8)->Arg(64)->Arg(512);

static void BM_AddRemoveDeep(benchmark::State& state) {
    cmdreg::util::logger().setLevel(cmdreg::util::LogLevel::Error);
    cmdreg::CommandTable table("bench_deep", unnamed());
    const cmdreg::Path p{"a", "b", "c", "d", "e", "f"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(cmdreg::registry::add(p, cmdreg::CommandRef("H"), table));
        benchmark::DoNotOptimize(cmdreg::registry::remove(p, table));
    }
    state.SetItemsProcessed(state.iterations() * 2);
}

BENCHMARK(BM_AddRemoveDeep);

static void BM_Lookup(benchmark::State& state) {
    cmdreg::util::logger().setLevel(cmdreg::util::LogLevel::Error);
    cmdreg::CommandTable table("bench_lookup", unnamed());
    for (int i = 0; i < 64; ++i) {
        cmdreg::registry::add({"mod", "sub" + std::to_string(i)}, cmdreg::CommandRef("H"), table);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(cmdreg::registry::lookup("mod", table));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Lookup);

static void BM_AddSharedKey_Contended(benchmark::State& state) {
    static auto owner = [] {
        cmdreg::util::logger().setLevel(cmdreg::util::LogLevel::Error);
        return cmdreg::RegistryOwner::start("bench_contended", unnamed());
    }();
    const auto policy = state.range(0) ? cmdreg::WriterPolicy::PerKeyLock
                                       : cmdreg::WriterPolicy::Unsynchronized;
    cmdreg::TableStorage storage(owner->getTableHandle(), policy);

    const std::string prefix = "t" + std::to_string(state.thread_index()) + "_";
    int i = 0;
    for (auto _ : state) {
        auto st = storage.addCommand({"shared", prefix + std::to_string(i++ % 32)}, cmdreg::CommandRef("H"));
        benchmark::DoNotOptimize(st);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_AddSharedKey_Contended)->Arg(0)->Arg(1)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
