// neighbor_scan.hpp: alive-neighbor counting over the sparse row list
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "core/config.hpp"
#include "core/perf.hpp"
#include "life/cell.hpp"
#include "life/sparse_state.hpp"

namespace life {

// The 8 cells around (x, y), in scan order.
enum Slot : unsigned { NW = 0, N, NE, W, E, SW, S, SE };

inline constexpr std::array<std::array<int, 2>, 8> kSlotOffsets{{
    {-1, -1}, {0, -1}, {1, -1},
    {-1,  0},          {1,  0},
    {-1,  1}, {0,  1}, {1,  1},
}};

// Which of the 8 neighbors of one alive cell are still dead candidates.
// Bit s set <=> slot s has not been seen alive.
struct CandidateSet {
    std::uint8_t dead_mask{0xFF};

    inline void mark_alive(unsigned s) noexcept { dead_mask &= static_cast<std::uint8_t>(~(1u << s)); }
    inline bool is_dead(unsigned s) const noexcept { return (dead_mask >> s) & 1u; }

    // Clear the slots that fall outside the coord_t range; cells past the
    // edge of the coordinate space are permanently dead.
    inline void drop_out_of_range(coord_t x, coord_t y) noexcept {
        constexpr coord_t lo = std::numeric_limits<coord_t>::min();
        constexpr coord_t hi = std::numeric_limits<coord_t>::max();
        if (x == lo) dead_mask &= static_cast<std::uint8_t>(~((1u << NW) | (1u << W) | (1u << SW)));
        if (x == hi) dead_mask &= static_cast<std::uint8_t>(~((1u << NE) | (1u << E) | (1u << SE)));
        if (y == lo) dead_mask &= static_cast<std::uint8_t>(~((1u << NW) | (1u << N) | (1u << NE)));
        if (y == hi) dead_mask &= static_cast<std::uint8_t>(~((1u << SW) | (1u << S) | (1u << SE)));
    }

    // Slot s must be in range (see drop_out_of_range).
    inline Cell cell(unsigned s, coord_t x, coord_t y) const noexcept {
        return Cell{static_cast<coord_t>(static_cast<std::int64_t>(x) + kSlotOffsets[s][0]),
                    static_cast<coord_t>(static_cast<std::int64_t>(y) + kSlotOffsets[s][1])};
    }
};

// Scan positions into the row above (top), the current row (middle) and the
// row below (bottom). Positions refer to the current row snapshot and are
// only meaningful inside one advance pass; reset at the start of every row.
struct ScanCursors {
    std::size_t top{0};
    std::size_t middle{0};
    std::size_t bottom{0};

    inline void reset_row() noexcept { top = middle = bottom = 0; }
};

namespace detail {

// Scan an adjacent row for columns x-1, x, x+1 starting at `cursor`.
// The cursor is advanced past columns < x-1 and never moves backward, which
// is valid because cells of the current row are visited in ascending x.
PERF_ALWAYS_INLINE unsigned scan_adjacent_row(const std::vector<coord_t>& xs,
                                              std::size_t& cursor,
                                              coord_t x,
                                              unsigned first_slot,
                                              CandidateSet& cand) noexcept {
    const std::int64_t lo = static_cast<std::int64_t>(x) - 1;
    const std::int64_t hi = static_cast<std::int64_t>(x) + 1;
    const std::size_t n = xs.size();
    while (cursor < n && xs[cursor] < lo) ++cursor;
    unsigned found = 0;
    for (std::size_t k = cursor; k < n && xs[k] <= hi; ++k) {
        cand.mark_alive(first_slot + static_cast<unsigned>(xs[k] - lo));
        ++found;
    }
    return found;
}

} // namespace detail

/**
 * @brief Count the alive neighbors of the alive cell (x, y).
 * @param rows Current row snapshot.
 * @param x Column of the cell.
 * @param y Row of the cell.
 * @param row_index Position of row y inside @p rows.
 * @param cur Scan cursors for this row pass; cur.middle must hold the
 *        position of x inside its row.
 * @param cand Candidate set; every slot found alive is cleared.
 * @return Number of alive neighbors in [0, 8].
 */
PERF_ALWAYS_INLINE unsigned get_alive_neighbor_count(const std::vector<Row>& rows,
                                                     coord_t x, coord_t y,
                                                     std::size_t row_index,
                                                     ScanCursors& cur,
                                                     CandidateSet& cand) {
    CORE_ASSERT_H(row_index < rows.size() && rows[row_index].y == y,
                  "get_alive_neighbor_count: row_index does not address row y");
    const auto& mid = rows[row_index].xs;
    CORE_ASSERT_H(cur.middle < mid.size() && mid[cur.middle] == x,
                  "get_alive_neighbor_count: middle cursor does not address x");

    unsigned neighbors = 0;
    const std::int64_t wx = x, wy = y;

    // Row above: only if it is exactly y-1 (sparse rows may skip it).
    if (row_index > 0 && rows[row_index - 1].y == wy - 1)
        neighbors += detail::scan_adjacent_row(rows[row_index - 1].xs, cur.top, x, Slot::NW, cand);

    // Same row: the immediate sorted neighbors of x are its only candidates.
    if (cur.middle > 0 && mid[cur.middle - 1] == wx - 1) {
        cand.mark_alive(Slot::W);
        ++neighbors;
    }
    if (cur.middle + 1 < mid.size() && mid[cur.middle + 1] == wx + 1) {
        cand.mark_alive(Slot::E);
        ++neighbors;
    }

    // Row below: only if it is exactly y+1.
    if (row_index + 1 < rows.size() && rows[row_index + 1].y == wy + 1)
        neighbors += detail::scan_adjacent_row(rows[row_index + 1].xs, cur.bottom, x, Slot::SW, cand);

    return neighbors;
}

} // namespace life
