// cli.hpp: Command-line parsing interface (cxxopts)
#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "core/config.hpp"
#include "life/seed.hpp"

namespace cli {

struct Options {
    // Board size; 0x0 => pick a scheme from the terminal width
    core::coord_t width = 0;
    core::coord_t height = 0;
    // Fixed scheme name (phone|tablet|desktop); empty => automatic
    std::string scheme;

    // Initial live probability in [0,1]
    double density = life::kInitialProbability;
    life::Pattern pattern = life::Pattern::Random;

    // Generations to run; 0 => until interrupted
    std::uint64_t generations = 0;
    // Delay between ticks (ceil(1000/15))
    unsigned delay_ms = 67;

    // Master seed; 0 => random device
    std::uint64_t seed = 0;

    bool color = true;
    bool quiet = false;

    // Batch mode: run this many boards instead of drawing one
    std::size_t experiments = 0;
    int threads = 0;          // 0 => tbb default
    bool progress = false;

    // parser result: 0 ok, 2 invalid arguments
    int exit_code = 0;
};

// Parse "WxH" (also accepts 'X').
std::optional<std::pair<core::coord_t, core::coord_t>> parse_size(const std::string& s);

// Parse "p/q" or a decimal into a probability clamped to [0,1].
std::optional<double> parse_probability(const std::string& s);

// Parse CLI arguments with cxxopts.
// Sets want_help/help_text for --help or errors; on error exit_code is 2.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

} // namespace cli
