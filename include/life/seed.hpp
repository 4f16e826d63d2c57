// seed.hpp: initial board states (random fill, named patterns)
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/config.hpp"
#include "core/rng.hpp"
#include "life/cell.hpp"
#include "life/list_life.hpp"

namespace life {

// Default share of the seeded region that starts alive.
inline constexpr double kInitialProbability = 0.1;

// Pick K = floor(width*height*probability) distinct positions in
// [0, width*height) with Floyd's algorithm (K draws, no scans, no retries).
template <class URBG>
inline std::vector<std::uint64_t> sample_positions(std::uint64_t width, std::uint64_t height,
                                                   double probability, URBG& rng) {
    const std::uint64_t N = width * height;
    if (probability < 0.0) probability = 0.0;
    if (probability > 1.0) probability = 1.0;
    const std::uint64_t K = static_cast<std::uint64_t>(static_cast<double>(N) * probability);

    std::vector<std::uint64_t> out;
    if (K == 0) return out;
    out.reserve(K);
    if (K >= N) {
        for (std::uint64_t i = 0; i < N; ++i) out.push_back(i);
        return out;
    }
    std::unordered_set<std::uint64_t> chosen;
    chosen.reserve(K * 2);
    for (std::uint64_t j = N - K; j < N; ++j) {
        const std::uint64_t t = core::uniform_bounded(rng, j + 1);
        const std::uint64_t pick = chosen.count(t) ? j : t;
        chosen.insert(pick);
        out.push_back(pick);
    }
    return out;
}

// Add a uniform random population to `board` inside [0,width) x [0,height).
// Returns the number of cells that were newly added.
template <class URBG>
inline core::count_t seed_random(ListLife& board, core::coord_t width, core::coord_t height,
                                 double probability, URBG& rng) {
    if (width <= 0 || height <= 0) return 0;
    const auto w = static_cast<std::uint64_t>(width);
    core::count_t added = 0;
    for (std::uint64_t p : sample_positions(w, static_cast<std::uint64_t>(height), probability, rng)) {
        added += board.add_cell(static_cast<coord_t>(p % w), static_cast<coord_t>(p / w)) ? 1 : 0;
    }
    return added;
}

enum class Pattern { Random, Block, Blinker, Glider };

inline std::optional<Pattern> parse_pattern(std::string_view s) {
    if (s == "random")  return Pattern::Random;
    if (s == "block")   return Pattern::Block;
    if (s == "blinker") return Pattern::Blinker;
    if (s == "glider")  return Pattern::Glider;
    return std::nullopt;
}

// Cells of a named still/oscillator/spaceship, offset by (ox, oy).
//   block    ##      blinker  ###      glider  .#.
//            ##                                ..#
//                                              ###
// The glider as drawn travels toward +x, +y by one cell every 4 generations.
inline std::vector<Cell> pattern_cells(Pattern p, coord_t ox = 0, coord_t oy = 0) {
    std::vector<Cell> out;
    auto at = [&](coord_t x, coord_t y){ out.push_back(Cell{static_cast<coord_t>(ox + x), static_cast<coord_t>(oy + y)}); };
    switch (p) {
        case Pattern::Block:   at(0, 0); at(1, 0); at(0, 1); at(1, 1); break;
        case Pattern::Blinker: at(0, 0); at(1, 0); at(2, 0); break;
        case Pattern::Glider:  at(1, 0); at(2, 1); at(0, 2); at(1, 2); at(2, 2); break;
        case Pattern::Random:  break;
    }
    return out;
}

} // namespace life
