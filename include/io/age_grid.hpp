// age_grid.hpp: per-cell ages for the visible window, fed by transitions
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include "life/cell.hpp"
#include "life/list_life.hpp"

namespace io {

/*
AgeGrid: width x height signed ages, row-major.
  age == 0  never alive (empty)
  age >  0  alive for `age` consecutive generations
  age <  0  dead, was alive for -age generations
Transitions outside the window are ignored.
*/
class AgeGrid {
public:
    using age_t = std::int32_t;

    AgeGrid(life::coord_t width, life::coord_t height) : W_(width), H_(height) {
        if (width <= 0 || height <= 0)
            throw std::invalid_argument("AgeGrid: width and height must be positive");
        ages_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), 0);
    }

    life::coord_t width() const noexcept { return W_; }
    life::coord_t height() const noexcept { return H_; }

    inline bool in_bounds(life::coord_t x, life::coord_t y) const noexcept {
        return x >= 0 && x < W_ && y >= 0 && y < H_;
    }

    age_t age(life::coord_t x, life::coord_t y) const {
        return in_bounds(x, y) ? ages_[idx(x, y)] : 0;
    }

    void apply(const life::Transition& t) {
        if (!in_bounds(t.x, t.y)) return;
        age_t& a = ages_[idx(t.x, t.y)];
        switch (t.kind) {
            case life::TransitionKind::Born:        a = 1;  break;
            case life::TransitionKind::StayedAlive: ++a;    break;
            case life::TransitionKind::Died:        a = -a; break;
        }
    }

    void apply(std::span<const life::Transition> ts) {
        for (const auto& t : ts) apply(t);
    }

    void reset() { std::fill(ages_.begin(), ages_.end(), 0); }

    // Fresh window from the board: alive visible cells get age 1.
    void reset_from(const life::ListLife& board) {
        reset();
        board.state().for_each_cell([&](life::coord_t x, life::coord_t y){
            if (in_bounds(x, y)) ages_[idx(x, y)] = 1;
        });
    }

private:
    life::coord_t W_, H_;
    std::vector<age_t> ages_;

    inline std::size_t idx(life::coord_t x, life::coord_t y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(W_) + static_cast<std::size_t>(x);
    }
};

} // namespace io
