#include <benchmark/benchmark.h>

#include <chrono>

#include "Loading.hpp"

using namespace std::chrono_literals;

using IntCache = Cache::Loading::Manager<int, int>;

static constexpr int KEY_COUNT = 1024;

static IntCache& cache()
{
    static IntCache sCache([](int aKey) { return aKey; }, Cache::Loading::Config{.expiration = 1h});
    return sCache;
}

static void BM_Hit(benchmark::State& state)
{
    auto& sCache = cache();
    int   sKey   = state.thread_index();
    for (auto _ : state) {
        benchmark::DoNotOptimize(sCache.Get(sKey % KEY_COUNT));
        sKey++;
    }
}

static void BM_Set(benchmark::State& state)
{
    auto& sCache = cache();
    int   sKey   = state.thread_index();
    for (auto _ : state) {
        sCache.Set(sKey % KEY_COUNT, sKey);
        sKey++;
    }
}

static void BM_Miss(benchmark::State& state)
{
    for (auto _ : state) {
        state.PauseTiming();
        IntCache sCache([](int aKey) { return aKey; });
        state.ResumeTiming();
        for (int i = 0; i < KEY_COUNT; i++)
            benchmark::DoNotOptimize(sCache.Get(i));
    }
    state.SetItemsProcessed(state.iterations() * KEY_COUNT);
}

BENCHMARK(BM_Hit)->Threads(1)->Threads(4)->Threads(12)->UseRealTime();
BENCHMARK(BM_Set)->Threads(1)->Threads(4)->Threads(12)->UseRealTime();
BENCHMARK(BM_Miss)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
