// schemes.hpp: named board sizes and terminal-width based selection
#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "core/config.hpp"

namespace app {

struct SizeScheme {
    const char*   name;
    core::coord_t columns;
    core::coord_t rows;
};

inline constexpr std::array<SizeScheme, 3> kSchemes{{
    {"phone",    40, 30},
    {"tablet",  120, 90},
    {"desktop", 100, 75},
}};

inline std::optional<SizeScheme> parse_scheme(std::string_view s) {
    for (const auto& sc : kSchemes)
        if (s == sc.name) return sc;
    return std::nullopt;
}

// Widest scheme whose columns fit the terminal, given `chars_per_cell`
// terminal columns per board cell. Falls back to the phone scheme.
inline SizeScheme select_scheme(int term_cols, int chars_per_cell = 2) {
    SizeScheme best = kSchemes[0];
    for (const auto& sc : kSchemes) {
        if (static_cast<long>(sc.columns) * chars_per_cell <= term_cols && sc.columns > best.columns)
            best = sc;
    }
    return best;
}

} // namespace app
