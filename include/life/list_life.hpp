// list_life.hpp: List Life: sparse Conway's Game of Life, one generation per advance()
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/perf.hpp"
#include "life/cell.hpp"
#include "life/neighbor_scan.hpp"
#include "life/sparse_state.hpp"

namespace life {

// Result of one generation step. `transitions` stays valid until the next
// call that mutates the board.
struct GenerationReport {
    core::count_t alive{0};
    std::span<const Transition> transitions;
};

/*
ListLife

Owns the alive-cell set and advances it by exactly one generation per call.
Only cells adjacent to alive cells are examined:
  - every alive cell counts its alive neighbors with forward-only cursors into
    the rows above and below (get_alive_neighbor_count)
  - the remaining dead neighbors are nominated in a tally; a dead cell with
    exactly 3 nominations is born
The board has no bounds; clipping is up to whoever draws it.
*/
class ListLife {
public:
    ListLife() = default;
    explicit ListLife(std::span<const Cell> seed) : state_(seed) {}

    bool add_cell(coord_t x, coord_t y) { return state_.add_cell(x, y); }
    bool remove_cell(coord_t x, coord_t y) { return state_.remove_cell(x, y); }
    [[nodiscard]] bool is_alive(coord_t x, coord_t y) const { return state_.is_alive(x, y); }

    // Manual edit: flip (x, y) and report the resulting transition.
    Transition toggle(coord_t x, coord_t y) {
        if (state_.remove_cell(x, y)) return Transition{x, y, TransitionKind::Died};
        state_.add_cell(x, y);
        return Transition{x, y, TransitionKind::Born};
    }

    // Drop every cell and restart the generation counter.
    void clear() {
        state_.clear();
        transitions_.clear();
        generation_ = 0;
    }

    PERF_HOT GenerationReport advance() {
        transitions_.clear();
        transitions_.reserve(state_.size() + state_.size() / 2);
        tally_.clear();
        survivors_.clear();
        births_.clear();

        const std::vector<Row>& rows = state_.rows();
        ScanCursors cur;
        for (std::size_t ri = 0; ri < rows.size(); ++ri) {
            const Row& row = rows[ri];
            const coord_t y = row.y;
            cur.reset_row();
            for (std::size_t ci = 0; ci < row.xs.size(); ++ci) {
                const coord_t x = row.xs[ci];
                cur.middle = ci;

                CandidateSet cand;
                const unsigned n = get_alive_neighbor_count(rows, x, y, ri, cur, cand);
                cand.drop_out_of_range(x, y);

                for (unsigned s = 0; s < 8; ++s)
                    if (cand.is_dead(s)) ++tally_[cand.cell(s, x, y)];

                if (n == 2 || n == 3) {
                    survivors_.push_back(Cell{x, y});
                    transitions_.push_back(Transition{x, y, TransitionKind::StayedAlive});
                } else {
                    transitions_.push_back(Transition{x, y, TransitionKind::Died});
                }
            }
        }

        for (const auto& [c, nominations] : tally_)
            if (nominations == 3) births_.push_back(c);
        std::sort(births_.begin(), births_.end(), RowMajorLess{});

        rebuild_next();
        for (const Cell& b : births_)
            transitions_.push_back(Transition{b.x, b.y, TransitionKind::Born});

        std::swap(state_, next_);
        ++generation_;
        CORE_ASSERT_H(state_.check_invariants(), "ListLife::advance: sparse state invariants broken");
        CORE_ASSERT_H(state_.size() == survivors_.size() + births_.size(),
                      "ListLife::advance: alive count mismatch");
        return GenerationReport{state_.size(), std::span<const Transition>(transitions_)};
    }

    [[nodiscard]] core::count_t alive_count() const noexcept { return state_.size(); }
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] const SparseState& state() const noexcept { return state_; }
    [[nodiscard]] std::span<const Transition> transitions() const noexcept { return transitions_; }

private:
    SparseState state_;
    SparseState next_;
    std::vector<Transition> transitions_;
    std::unordered_map<Cell, std::uint8_t, CellHash> tally_;
    std::vector<Cell> survivors_; // row-major by construction
    std::vector<Cell> births_;
    std::uint64_t generation_{0};

    // next_ <- merge(survivors_, births_), both row-major and disjoint.
    void rebuild_next() {
        next_.clear();
        const RowMajorLess less;
        std::size_t i = 0, j = 0;
        while (i < survivors_.size() && j < births_.size()) {
            const Cell& c = less(births_[j], survivors_[i]) ? births_[j++] : survivors_[i++];
            next_.append_cell(c.x, c.y);
        }
        for (; i < survivors_.size(); ++i) next_.append_cell(survivors_[i].x, survivors_[i].y);
        for (; j < births_.size(); ++j)    next_.append_cell(births_[j].x, births_[j].y);
    }
};

} // namespace life
