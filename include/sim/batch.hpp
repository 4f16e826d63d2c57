// batch.hpp: many independent random boards in parallel (TBB reduction)
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_reduce.h>

#include "core/config.hpp"
#include "core/rng.hpp"
#include "life/list_life.hpp"
#include "life/seed.hpp"

namespace sim {

// ---------- Config ----------
struct BatchConfig {
    std::size_t   experiments{100};  // 0 -> 1
    core::coord_t width{100};
    core::coord_t height{75};
    double        density{life::kInitialProbability};
    std::uint64_t generations{100};
    int           threads{0};        // 0 -> tbb default
};

struct RunResult {
    core::count_t initial_alive{0};
    core::count_t final_alive{0};
    std::uint64_t generations{0};    // generations actually advanced
};

struct BatchResult {
    std::vector<RunResult> runs;     // index = experiment number
    std::uint64_t total_final_alive{0};
    std::size_t   extinct{0};        // runs that reached zero cells

    double average_final_alive() const {
        return runs.empty() ? 0.0 : static_cast<double>(total_final_alive) / static_cast<double>(runs.size());
    }
};

// One random board: seed, then advance until `generations` or extinction.
inline RunResult run_single(const BatchConfig& cfg, std::uint64_t seed) {
    RunResult r;
    core::SplitMix64 rng(seed);
    life::ListLife board;
    r.initial_alive = life::seed_random(board, cfg.width, cfg.height, cfg.density, rng);
    while (r.generations < cfg.generations && board.alive_count() > 0) {
        board.advance();
        ++r.generations;
    }
    r.final_alive = board.alive_count();
    return r;
}

// Runs J independent experiments in parallel. Per-job seeds are drawn from
// the master RNG up front, so results depend only on the master seed and not
// on scheduling. `on_done(done, total)` is invoked from worker threads.
template <class SeedRng, class ProgressCb>
inline BatchResult run_batch(const BatchConfig& cfg_in, SeedRng& master_rng, ProgressCb&& on_done) {
    const std::size_t J = (cfg_in.experiments == 0) ? 1 : cfg_in.experiments;

    std::unique_ptr<tbb::global_control> limit;
    if (cfg_in.threads > 0)
        limit = std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism,
                                                      static_cast<std::size_t>(cfg_in.threads));

    std::vector<std::uint64_t> seeds(J);
    for (std::size_t i = 0; i < J; ++i) seeds[i] = core::splitmix_hash(master_rng());

    BatchResult out;
    out.runs.resize(J);
    std::atomic<std::size_t> done{0};

    struct Totals { std::uint64_t alive{0}; std::size_t extinct{0}; };
    const Totals totals = tbb::parallel_reduce(
        tbb::blocked_range<std::size_t>(0, J),
        Totals{},
        [&](const tbb::blocked_range<std::size_t>& r, Totals acc) {
            for (std::size_t j = r.begin(); j != r.end(); ++j) {
                out.runs[j] = run_single(cfg_in, seeds[j]);
                acc.alive += out.runs[j].final_alive;
                acc.extinct += (out.runs[j].final_alive == 0);
                on_done(done.fetch_add(1, std::memory_order_relaxed) + 1, J);
            }
            return acc;
        },
        [](Totals a, const Totals& b) { a.alive += b.alive; a.extinct += b.extinct; return a; });

    out.total_final_alive = totals.alive;
    out.extinct = totals.extinct;
    return out;
}

template <class SeedRng>
inline BatchResult run_batch(const BatchConfig& cfg, SeedRng& master_rng) {
    return run_batch(cfg, master_rng, [](std::size_t, std::size_t) {});
}

} // namespace sim
