#pragma once
/*
Driver: owns one board, seeds it, and advances it on a fixed tick.

Per tick:
  - board.advance()
  - ages.apply(transitions)   (incremental redraw bookkeeping)
  - renderer.draw(...)        (unless quiet)
  - sleep(delay)

With no explicit size the board follows the terminal: the widest size scheme
that fits is used, and a terminal resize re-initialises the simulation with
the newly selected scheme.
*/

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <random>
#include <thread>

#include "app/schemes.hpp"
#include "cli/cli.hpp"
#include "core/config.hpp"
#include "core/rng.hpp"
#include "io/age_grid.hpp"
#include "io/term_render.hpp"
#include "io/term_utils.hpp"
#include "life/list_life.hpp"
#include "life/seed.hpp"

namespace app {

inline std::uint64_t resolve_seed(std::uint64_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

class Driver {
public:
    Driver(const cli::Options& opt, std::ostream& out)
    : opt_(opt), out_(out), renderer_(opt.color), rng_(resolve_seed(opt.seed)) {
        auto_size_ = (opt.width <= 0 || opt.height <= 0);
        const SizeScheme sc = auto_size_
            ? select_scheme(io::get_terminal_size().cols, opt.color ? 2 : 1)
            : SizeScheme{"custom", opt.width, opt.height};
        init(sc.columns, sc.rows);
    }

    // Fresh board of the given size, seeded per options.
    void init(core::coord_t width, core::coord_t height) {
        width_ = width;
        height_ = height;
        board_.clear();
        if (opt_.pattern == life::Pattern::Random) {
            life::seed_random(board_, width_, height_, opt_.density, rng_);
            board_.advance(); // settle before the first full draw
        } else {
            for (const auto& c : life::pattern_cells(opt_.pattern, width_ / 2 - 1, height_ / 2 - 1))
                board_.add_cell(c.x, c.y);
        }
        ages_.emplace(width_, height_);
        ages_->reset_from(board_);
        ticks_ = 0;
        if (!opt_.quiet) {
            renderer_.begin(out_);
            renderer_.draw(out_, *ages_, ticks_, board_.alive_count());
        }
    }

    // Manual edit between ticks; keeps the age grid in sync.
    life::Transition toggle(core::coord_t x, core::coord_t y) {
        const auto t = board_.toggle(x, y);
        ages_->apply(t);
        return t;
    }

    life::GenerationReport step() {
        const auto report = board_.advance();
        ages_->apply(report.transitions);
        ++ticks_;
        if (!opt_.quiet) renderer_.draw(out_, *ages_, ticks_, report.alive);
        return report;
    }

    int run() {
        io::install_signal_handlers();
        const auto delay = std::chrono::milliseconds(opt_.delay_ms);
        while (opt_.generations == 0 || ticks_ < opt_.generations) {
            if (io::interrupt_flag().load(std::memory_order_relaxed)) break;
            if (auto_size_ && io::terminal_resized_flag().exchange(false, std::memory_order_relaxed)) {
                const SizeScheme sc = select_scheme(io::get_terminal_size().cols, opt_.color ? 2 : 1);
                if (sc.columns != width_ || sc.rows != height_) init(sc.columns, sc.rows);
            }
            step();
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
        }
        out_ << "generation: " << ticks_ << "  cells: " << board_.alive_count() << "\n";
        return 0;
    }

    const life::ListLife& board() const noexcept { return board_; }
    const io::AgeGrid& ages() const noexcept { return *ages_; }
    std::uint64_t ticks() const noexcept { return ticks_; }
    core::coord_t width() const noexcept { return width_; }
    core::coord_t height() const noexcept { return height_; }

private:
    cli::Options opt_;
    std::ostream& out_;
    io::TermRenderer renderer_;
    core::SplitMix64 rng_;
    life::ListLife board_;
    std::optional<io::AgeGrid> ages_;
    bool auto_size_{false};
    core::coord_t width_{0}, height_{0};
    std::uint64_t ticks_{0};
};

} // namespace app
