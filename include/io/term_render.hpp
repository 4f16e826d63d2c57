// term_render.hpp: ANSI frame writer for an AgeGrid
#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "core/config.hpp"
#include "io/age_grid.hpp"

namespace io {

class TermRenderer {
public:
    explicit TermRenderer(bool color = true) : color_(color) {}

    bool color() const noexcept { return color_; }

    // Palette slot for an alive cell of the given age.
    static inline std::size_t palette_index(AgeGrid::age_t age) noexcept {
        return static_cast<std::size_t>(age / 16) % 16;
    }

    // Clear the screen; call once before the first frame.
    void begin(std::ostream& os) const {
        if (color_) os << core::config::clear;
    }

    // One frame: board rows followed by a status line.
    void draw(std::ostream& os, const AgeGrid& grid,
              std::uint64_t generation, core::count_t alive) const {
        std::string buf;
        const std::size_t cell_w = color_ ? 2 : 1;
        buf.reserve(static_cast<std::size_t>(grid.width()) * static_cast<std::size_t>(grid.height()) * (cell_w + 12) + 64);
        if (color_) buf += core::config::home;

        for (life::coord_t y = 0; y < grid.height(); ++y) {
            const char* last = nullptr;
            for (life::coord_t x = 0; x < grid.width(); ++x) {
                const AgeGrid::age_t a = grid.age(x, y);
                if (color_) {
                    const char* c = (a > 0) ? core::config::alive[palette_index(a)]
                                  : (a < 0) ? core::config::dead
                                            : core::config::empty;
                    if (c != last) { buf += c; last = c; }
                    buf += "  ";
                } else {
                    buf += (a > 0) ? '#' : (a < 0) ? '.' : ' ';
                }
            }
            if (color_) buf += core::config::reset;
            buf += '\n';
        }
        buf += "generation: " + std::to_string(generation) + "  cells: " + std::to_string(alive);
        if (color_) buf += "\x1b[K"; // erase stale tail of a longer previous status
        buf += '\n';
        os << buf;
        os.flush();
    }

private:
    bool color_;
};

} // namespace io
