#include <benchmark/benchmark.h>
#include "grace/rt/ResourceCleaner.hpp"
#include "grace/util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <string>

using namespace grace;

static void BM_ResourceCleanerRegister(benchmark::State& state) {
    const auto n = state.range(0);
    for (auto _ : state) {
        rt::ResourceCleaner cleaner;
        for (int64_t i = 0; i < n; ++i) {
            cleaner.registerWithName("r" + std::to_string(i), []{ return Status{}; });
        }
        benchmark::DoNotOptimize(cleaner.size());
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_ResourceCleanerRegister)->Arg(8)->Arg(64)->Arg(512)->Unit(benchmark::kMicrosecond);

static void BM_ResourceCleanerCleanup(benchmark::State& state) {
    const auto n = state.range(0);
    std::atomic<int64_t> ran{0};
    for (auto _ : state) {
        state.PauseTiming();
        rt::ResourceCleaner cleaner;
        for (int64_t i = 0; i < n; ++i) {
            cleaner.registerWithName("r" + std::to_string(i), [&ran, i]{
                ran.fetch_add(1, std::memory_order_relaxed);
                return i % 8 == 0 ? Status::failure("busy") : Status{};
            });
        }
        state.ResumeTiming();

        auto errs = cleaner.cleanup(rt::Deadline::after(std::chrono::seconds(5)));
        benchmark::DoNotOptimize(errs);
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_ResourceCleanerCleanup)->Arg(8)->Arg(64)->Unit(benchmark::kMicrosecond);

int main(int argc, char** argv) {
    // cleanup() logs every run; keep the benchmark output readable.
    grace::util::logger().setLevel(grace::util::LogLevel::Error);
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    benchmark::RunSpecifiedBenchmarks();
    return 0;
}
