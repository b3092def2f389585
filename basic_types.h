/*
 * basic_types.h: native word aliases shared by the bulkq headers
 *
 * reg is the index/capacity type of every container in this repository.
 * It must be unsigned and at least 16 bits wide; both are checked below so
 * that unsupported targets fail at compile time.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#ifdef __cplusplus
# include <cstddef>   /* size_t */
# include <limits>
#else
# include <stddef.h>
#endif /* __cplusplus */

#ifdef __cplusplus

/* Native register-size type (matches pointer size) */
using reg = std::size_t;

static_assert(std::numeric_limits<reg>::is_integer && !std::numeric_limits<reg>::is_signed,
              "basic_types: reg must be an unsigned integer");
static_assert(std::numeric_limits<reg>::digits >= 16,
              "basic_types: reg must be at least 16 bits wide");

#else

typedef size_t reg;

#endif /* __cplusplus */

#endif /* BASIC_TYPES_H_ */
