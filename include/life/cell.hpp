// cell.hpp: cell coordinates and per-generation transition records
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "core/config.hpp"

namespace life {

using coord_t = core::coord_t;

struct Cell {
    coord_t x{0};
    coord_t y{0};

    friend constexpr bool operator==(const Cell&, const Cell&) = default;
};

// Row-major order: y first, then x. Matches the sparse state layout.
struct RowMajorLess {
    constexpr bool operator()(const Cell& a, const Cell& b) const noexcept {
        return (a.y != b.y) ? (a.y < b.y) : (a.x < b.x);
    }
};

struct CellHash {
    std::size_t operator()(const Cell& c) const noexcept {
        const std::uint64_t ux = static_cast<std::uint32_t>(c.x);
        const std::uint64_t uy = static_cast<std::uint32_t>(c.y);
        std::uint64_t z = (uy << 32) | ux;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return static_cast<std::size_t>(z ^ (z >> 31));
    }
};

enum class TransitionKind : std::uint8_t {
    Died        = 0,
    Born        = 1,
    StayedAlive = 2,
};

// One redraw instruction: cell (x, y) changed (or kept) its state.
struct Transition {
    coord_t x{0};
    coord_t y{0};
    TransitionKind kind{TransitionKind::Died};

    friend constexpr bool operator==(const Transition&, const Transition&) = default;
};

inline const char* to_string(TransitionKind k) noexcept {
    switch (k) {
        case TransitionKind::Died:        return "died";
        case TransitionKind::Born:        return "born";
        case TransitionKind::StayedAlive: return "stayed-alive";
    }
    return "?";
}

} // namespace life
