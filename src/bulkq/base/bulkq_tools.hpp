/*
 * bulkq_tools.hpp
 *
 * Tiny portability helpers shared by the bulkq headers.
 * - Zero dependencies, header-only, safe for inclusion from multiple TUs.
 * - One token for "force inline", the cold-path hint, exception helpers and
 *   <span> detection.
 *
 * Notes:
 * - For GCC/Clang, 'always_inline' is honored only if the function body
 *   is visible. Keep the definition in the header if you expect inlining.
 */

#ifndef BULKQ_TOOLS_HPP_
#define BULKQ_TOOLS_HPP_

#include "bulkq_config.hpp"

/* ---------------------------------------------------------------------------
 * RB_FORCEINLINE: "strong" inlining hint for headers
 * ------------------------------------------------------------------------- */
#ifndef RB_FORCEINLINE
#  if defined(_MSC_VER)
#    define RB_FORCEINLINE __forceinline
  /* Clang also defines __GNUC__ */
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define RB_FORCEINLINE inline
#  endif
#endif /* RB_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * Branch prediction hint for the cold paths (full, empty, invalid).
 * ------------------------------------------------------------------------- */
#ifndef RB_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define RB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define RB_UNLIKELY(x) (x)
#  endif
#endif /* RB_UNLIKELY */

// ============================================================================
// Exceptions helpers
// ============================================================================

// If the user forces 1 but the compiler clearly has no exceptions, fail at
// compile-time instead of pretending everything is fine.
#if BULKQ_ENABLE_EXCEPTIONS
#  if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
        !(defined(_MSC_VER) && defined(_CPPUNWIND))
#    error "BULKQ_ENABLE_EXCEPTIONS=1 but compiler appears to have exceptions disabled"
#  endif
#endif /* BULKQ_ENABLE_EXCEPTIONS */

static_assert(BULKQ_ENABLE_EXCEPTIONS == 0 || BULKQ_ENABLE_EXCEPTIONS == 1,
              "BULKQ_ENABLE_EXCEPTIONS must be 0 or 1");

// BULKQ_CATCH_ALL is only ever paired with BULKQ_RETHROW: cleanup, then
// propagate.
#if !defined(BULKQ_TRY)
#  if BULKQ_ENABLE_EXCEPTIONS
#    define BULKQ_TRY       try
#    define BULKQ_CATCH_ALL catch (...)
#    define BULKQ_RETHROW   throw
#  else
#    define BULKQ_TRY
#    define BULKQ_CATCH_ALL if constexpr (false)
#    define BULKQ_RETHROW
#  endif
#endif /* BULKQ_TRY */

// ============================================================================
// C++20 SPAN
// ============================================================================
#if defined(__has_include)
#  if __has_include(<span>) && (__cplusplus >= 202002L)
#    include <span>
#    define BULKQ_HAS_SPAN 1
#  else
#    define BULKQ_HAS_SPAN 0
#  endif
#else
#  define BULKQ_HAS_SPAN 0
#endif /* BULKQ_HAS_SPAN */

#endif /* BULKQ_TOOLS_HPP_ */
