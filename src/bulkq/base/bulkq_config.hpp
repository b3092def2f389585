/*
 * bulkq_config.hpp
 *
 * Build toggles for the bulkq headers. Every macro may be predefined by the
 * build system (CMake passes BULKQ_ENABLE_EXCEPTIONS from the option of the
 * same name).
 */

#ifndef BULKQ_CONFIG_HPP_
#define BULKQ_CONFIG_HPP_

// ============================================================================
// Exceptions configuration
// ============================================================================
//
// Single switch:
//   - BULKQ_ENABLE_EXCEPTIONS == 0 : library assumes "no exceptions" mode.
//       * allocation failure returns null,
//       * misuse at construction (zero capacity) ends in BULKQ_FAIL_FAST().
//   - BULKQ_ENABLE_EXCEPTIONS == 1 : library may use throwing paths.
//       * allocation failure throws std::bad_alloc,
//       * zero capacity throws std::invalid_argument.
//
// Default: follow the compiler (1 when exceptions are on).
//

#ifndef BULKQ_ENABLE_EXCEPTIONS
#  if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || (defined(_MSC_VER) && defined(_CPPUNWIND))
#    define BULKQ_ENABLE_EXCEPTIONS 1
#  else
#    define BULKQ_ENABLE_EXCEPTIONS 0
#  endif
#endif /* BULKQ_ENABLE_EXCEPTIONS */

// ============================================================================
// Contract checks
// ============================================================================
//
// BULKQ_ASSERT guards caller bugs (over-commit, over-consume, reading an empty
// queue through operator[]). It is loud in debug builds and vanishes with
// NDEBUG. Define it before including any bulkq header to route it elsewhere.
//

#ifndef BULKQ_ASSERT
#  if !defined(NDEBUG)
#    include <cstdlib>
#    define BULKQ_ASSERT(x) do { if (!(x)) { ::std::abort(); } } while (0)
#  else
#    define BULKQ_ASSERT(x) ((void)0)
#  endif
#endif /* BULKQ_ASSERT */

// Unconditional termination for misuse that cannot be reported otherwise
// (no-exceptions builds only).
#ifndef BULKQ_FAIL_FAST
#  include <cstdlib>
#  define BULKQ_FAIL_FAST() ::std::abort()
#endif /* BULKQ_FAIL_FAST */

#endif /* BULKQ_CONFIG_HPP_ */
