#pragma once

// Compiler hints for the generation hot loop.

#if defined(__GNUC__) || defined(__clang__)
#  define PERF_HOT   __attribute__((hot))
#  define PERF_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#  define PERF_HOT
#  define PERF_ALWAYS_INLINE inline
#endif
