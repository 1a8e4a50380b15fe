// src/core/debug.hpp
// Debug printing - enable with -DDEBUG
//
// TINYWS_DEBUG_PRINT compiles to nothing in release builds.
// TINYWS_WARN always prints to stderr (non-fatal abnormal conditions).
// Use `if constexpr (tinyws::debug_enabled)` for debug-only code blocks.

#pragma once

#include <cstdio>

#ifdef DEBUG
#define TINYWS_DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define TINYWS_DEBUG_PRINT(...) ((void)0)
#endif

#define TINYWS_WARN(...) do { fprintf(stderr, "[WARN] " __VA_ARGS__); fflush(stderr); } while(0)

namespace tinyws {

constexpr bool debug_enabled =
#ifdef DEBUG
    true;
#else
    false;
#endif

} // namespace tinyws
