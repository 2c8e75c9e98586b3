#include <taskalloc/algo/algo.hpp>
#include <taskalloc/core/core.hpp>
#include <taskalloc/io/io.hpp>

#include <benchmark/benchmark.h>

#include <random>

using namespace taskalloc::core;
using namespace taskalloc::algo;
using namespace taskalloc::io;

namespace {

Team bench_team(std::size_t members, std::size_t tasks) {
    std::mt19937 rng(2025);
    GenerationParams params;
    params.member_count = members;
    params.task_count = tasks;
    return generate_team(params, rng);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_Score: one member/task pair
// ---------------------------------------------------------------------------

static void BM_Score(benchmark::State& state) {
    auto team = bench_team(1, 1);
    Scorer scorer;

    for (auto _ : state) {
        benchmark::DoNotOptimize(scorer.score(team.member(0), team.task(0)));
    }
}
BENCHMARK(BM_Score);

// ---------------------------------------------------------------------------
// BM_ProcessingOrder: sort N tasks by priority then deadline
// ---------------------------------------------------------------------------

static void BM_ProcessingOrder(benchmark::State& state) {
    auto team = bench_team(1, static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto order = processing_order(team.tasks());
        benchmark::DoNotOptimize(order.data());
    }
}
BENCHMARK(BM_ProcessingOrder)->Arg(100)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_Allocate: M members x N tasks, no trace
// ---------------------------------------------------------------------------

static void BM_Allocate(benchmark::State& state) {
    auto team = bench_team(static_cast<std::size_t>(state.range(0)),
                           static_cast<std::size_t>(state.range(1)));
    GreedyAllocator allocator;

    for (auto _ : state) {
        auto result = allocator.allocate(team);
        benchmark::DoNotOptimize(result.assignments.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(1));
}
BENCHMARK(BM_Allocate)
    ->Args({10, 50})
    ->Args({50, 500})
    ->Args({200, 5000});

// ---------------------------------------------------------------------------
// BM_Allocate_MemoryTrace: same run, recording every event
// ---------------------------------------------------------------------------

static void BM_Allocate_MemoryTrace(benchmark::State& state) {
    auto team = bench_team(50, 500);
    GreedyAllocator allocator;
    MemoryTraceWriter writer;
    allocator.set_trace_writer(&writer);

    for (auto _ : state) {
        auto result = allocator.allocate(team);
        benchmark::DoNotOptimize(result.assignments.data());
        state.PauseTiming();
        writer.clear();
        state.ResumeTiming();
    }
}
BENCHMARK(BM_Allocate_MemoryTrace);

// ---------------------------------------------------------------------------
// BM_BuildReport: stats and member summaries for a finished run
// ---------------------------------------------------------------------------

static void BM_BuildReport(benchmark::State& state) {
    auto team = bench_team(50, 500);
    GreedyAllocator allocator;
    auto result = allocator.allocate(team);

    for (auto _ : state) {
        auto report = build_report(result);
        benchmark::DoNotOptimize(report.stats.efficiency);
    }
}
BENCHMARK(BM_BuildReport);

BENCHMARK_MAIN();
