// Google Benchmark: List Life generation throughput on random boards
#include <benchmark/benchmark.h>

#include <cstdint>

#include "core/rng.hpp"
#include "life/list_life.hpp"
#include "life/seed.hpp"
#include "sim/batch.hpp"

// One advance() on a settled random board of the given size and density (per mille).
static void BM_Advance(benchmark::State& state) {
    const auto w = static_cast<core::coord_t>(state.range(0));
    const auto h = static_cast<core::coord_t>(state.range(1));
    const double p = static_cast<double>(state.range(2)) / 1000.0;

    core::SplitMix64 rng(0xDEADBEEFCAFEULL);
    life::ListLife board;
    life::seed_random(board, w, h, p, rng);
    board.advance();

    std::uint64_t cells = 0;
    for (auto _ : state) {
        const auto rep = board.advance();
        cells += rep.alive;
        benchmark::DoNotOptimize(rep.transitions.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(cells));
}

// Size schemes at the default density, plus a dense tablet board.
BENCHMARK(BM_Advance)->ArgNames({"w", "h", "p_permille"})
    ->Args({40, 30, 100})
    ->Args({100, 75, 100})
    ->Args({120, 90, 100})
    ->Args({120, 90, 500})
    ->Unit(benchmark::kMicrosecond);

// Whole runs: seed, then a fixed number of generations.
static void BM_RunSingle(benchmark::State& state) {
    sim::BatchConfig cfg;
    cfg.width = 100;
    cfg.height = 75;
    cfg.density = 0.1;
    cfg.generations = static_cast<std::uint64_t>(state.range(0));
    std::uint64_t seed = 1;
    for (auto _ : state) {
        auto r = sim::run_single(cfg, seed++);
        benchmark::DoNotOptimize(r.final_alive);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_RunSingle)->ArgName("generations")->Arg(100)->Arg(1000)
    ->UseRealTime()->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
