// Main entry: draw one List Life board in the terminal, or run a batch of
// random boards in parallel and report population averages.
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>

#include "app/driver.hpp"
#include "cli/cli.hpp"
#include "core/rng.hpp"
#include "io/progress.hpp"
#include "sim/batch.hpp"

static int run_batch_mode(const cli::Options& opt) {
    sim::BatchConfig cfg{ .experiments = opt.experiments,
                          .width = opt.width > 0 ? opt.width : 100,
                          .height = opt.height > 0 ? opt.height : 75,
                          .density = opt.density,
                          .generations = opt.generations,
                          .threads = opt.threads };

    core::SplitMix64 master_rng(app::resolve_seed(opt.seed));

    std::unique_ptr<io::BatchProgress> bar;
    if (opt.progress) bar = std::make_unique<io::BatchProgress>("boards", cfg.experiments);

    const sim::BatchResult res = sim::run_batch(cfg, master_rng, [&](std::size_t done, std::size_t) {
        if (bar) bar->tick(done);
    });
    if (bar) bar->complete();

    std::printf("boards: %zu  size: %dx%d  density: %.4g  generations: %llu\n",
                res.runs.size(), static_cast<int>(cfg.width), static_cast<int>(cfg.height),
                cfg.density, static_cast<unsigned long long>(cfg.generations));
    std::printf("Average cells: %.3f\n", res.average_final_alive());
    std::printf("Extinct boards: %zu\n", res.extinct);
    return 0;
}

int main(int argc, char** argv) {
    bool want_help = false; std::string help_text;
    cli::Options opt = cli::parse_args(argc, argv, want_help, help_text);
    if (want_help) {
        (opt.exit_code == 0 ? std::cout : std::cerr) << help_text;
        return opt.exit_code;
    }

    if (opt.experiments > 0) return run_batch_mode(opt);

    app::Driver driver(opt, std::cout);
    return driver.run();
}
