#include <benchmark/benchmark.h>
#include <algorithm>
#include <iostream>
#include <source_location>
#include <thread>

#include "FaultHook.hpp"
#include "HushPanic.hpp"
#include "HushRegistry.hpp"

using namespace FaultHush;

static void BM_HushUnhush(benchmark::State& state) {
    unhush_panic();

    for (auto _ : state) {
        hush_panic();
        benchmark::DoNotOptimize(is_panic_hushed());
        bool unhushed = unhush_panic();
        benchmark::DoNotOptimize(unhushed);
    }

    state.SetItemsProcessed(state.iterations() * state.threads());
}

static void BM_HushContention(benchmark::State& state) {
    unhush_panic();

    for (auto _ : state) {
        hush_panic();
        bool unhushed = unhush_panic();
        benchmark::DoNotOptimize(unhushed);
    }

    state.SetItemsProcessed(state.iterations() * state.threads());
}

static void BM_ScopedHush(benchmark::State& state) {
    for (auto _ : state) {
        auto hush = hush_this_test();
        benchmark::DoNotOptimize(hush);
    }

    state.SetItemsProcessed(state.iterations() * state.threads());
}

static void BM_InterceptHushed(benchmark::State& state) {
    const FaultReport report("benchmark", std::source_location::current(), std::this_thread::get_id());
    hush_panic();

    for (auto _ : state) {
        FaultHook::instance().report(report);
    }

    unhush_panic();
    state.SetItemsProcessed(state.iterations() * state.threads());
}

static void BM_InterceptForwarded(benchmark::State& state) {
    const FaultReport report("benchmark", std::source_location::current(), std::this_thread::get_id());
    unhush_panic();

    for (auto _ : state) {
        FaultHook::instance().report(report);
    }

    state.SetItemsProcessed(state.iterations() * state.threads());
}

BENCHMARK(BM_HushUnhush);
BENCHMARK(BM_HushContention)
    ->ThreadRange(1, static_cast<int>(std::max(2u, std::thread::hardware_concurrency())));
BENCHMARK(BM_ScopedHush);
BENCHMARK(BM_InterceptHushed)
    ->ThreadRange(1, static_cast<int>(std::max(2u, std::thread::hardware_concurrency())));
BENCHMARK(BM_InterceptForwarded);

int main(int argc, char** argv) {
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }

    // Forwarded reports go nowhere so the numbers measure the interception only.
    FaultHook::instance().set_hook([](const FaultReport&) {});
    HushRegistry::instance();

    std::cout << "=== HushRegistry Benchmark ===\n";
    std::cout << "Measures hush/unhush latency, contention and interception cost.\n\n";

    ::benchmark::RunSpecifiedBenchmarks();
    ::benchmark::Shutdown();
    return 0;
}
