#pragma once

/// @file config.hpp
/// @brief Configuration macros for the rdjson library.
///
/// Controls:
///   - Branch prediction and inlining hints
///   - Default recursion depth limit
///   - Object size from which key lookup goes through a hash index
///
/// Every limit can be overridden on the compiler command line (-D...).

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define RDJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define RDJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define RDJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define RDJSON_LIKELY(x)   (x)
    #define RDJSON_UNLIKELY(x) (x)
    #define RDJSON_NOINLINE    __declspec(noinline)
#else
    #define RDJSON_LIKELY(x)   (x)
    #define RDJSON_UNLIKELY(x) (x)
    #define RDJSON_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Used when ParseOptions::max_depth is left at 0.

#if !defined(RDJSON_MAX_DEPTH)
    #define RDJSON_MAX_DEPTH 512
#endif

// =====================================================================
// Object key lookup
// =====================================================================
// Objects with fewer keys are searched linearly (cache-friendly);
// larger ones get a hash index when the parser finishes them.

#if !defined(RDJSON_OBJECT_INDEX_THRESHOLD)
    #define RDJSON_OBJECT_INDEX_THRESHOLD 16
#endif
