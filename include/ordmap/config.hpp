#pragma once

/// @file config.hpp
/// @author Aleksandr Loshkarev
/// @brief Configuration macros for the ordmap library.
///
/// Controls:
///   - Branch prediction hints
///   - Ledger compaction threshold

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define ORDMAP_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define ORDMAP_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define ORDMAP_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define ORDMAP_LIKELY(x)   (x)
    #define ORDMAP_UNLIKELY(x) (x)
    #define ORDMAP_NOINLINE    __declspec(noinline)
#else
    #define ORDMAP_LIKELY(x)   (x)
    #define ORDMAP_UNLIKELY(x) (x)
    #define ORDMAP_NOINLINE
#endif

// =====================================================================
// Ledger compaction threshold
// =====================================================================
// erase() compacts the order ledger once it holds more than
// ORDMAP_COMPACTION_FACTOR entries per live key.

#if !defined(ORDMAP_COMPACTION_FACTOR)
    #define ORDMAP_COMPACTION_FACTOR 2
#endif

static_assert(ORDMAP_COMPACTION_FACTOR >= 1,
              "ORDMAP_COMPACTION_FACTOR must be at least 1");

