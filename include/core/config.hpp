// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

// Compile-time configuration for core facilities.
//
// Coordinates are signed: the board is unbounded and births may land at
// negative positions next to a seeded region. Counts are unsigned.
// Any coord_t value is a valid cell; positions past either end of the range
// do not exist and are never born.

#ifndef CORE_COORD_T
#define CORE_COORD_T std::int32_t
#endif

#ifndef CORE_COUNT_T
#define CORE_COUNT_T std::size_t
#endif

// Global hardening switch for optional runtime invariant checks.
// Set via compile flag: -DCORE_HARDENED=1
#ifndef CORE_HARDENED
#define CORE_HARDENED 0
#endif

#if CORE_HARDENED
#include <stdexcept>
#define CORE_ASSERT_H(cond, msg) do { if(!(cond)) throw std::runtime_error(msg); } while(0)
#else
#define CORE_ASSERT_H(cond, msg) do { } while(0)
#endif

namespace core {
using coord_t = CORE_COORD_T;
using count_t = CORE_COUNT_T;
using size_t  = std::size_t;
} // namespace core

// ANSI colour tokens for terminal frames.
// Keep simple pointers to string literals to avoid extra headers.
namespace core { namespace config {
inline constexpr const char* home  = "\x1b[H";        // cursor to top-left
inline constexpr const char* clear = "\x1b[2J";       // erase screen
inline constexpr const char* dead  = "\x1b[48;5;250m"; // light grey background
inline constexpr const char* empty = "\x1b[48;5;255m"; // near-white background
inline constexpr const char* reset = "\x1b[0m";       // reset

// Background shades for alive cells, light -> dark -> light, indexed by age.
inline constexpr const char* alive[16] = {
    "\x1b[48;5;147m", "\x1b[48;5;111m", "\x1b[48;5;105m", "\x1b[48;5;69m",
    "\x1b[48;5;63m",  "\x1b[48;5;27m",  "\x1b[48;5;21m",  "\x1b[48;5;20m",
    "\x1b[48;5;19m",  "\x1b[48;5;20m",  "\x1b[48;5;21m",  "\x1b[48;5;27m",
    "\x1b[48;5;63m",  "\x1b[48;5;69m",  "\x1b[48;5;105m", "\x1b[48;5;111m",
};
} }
