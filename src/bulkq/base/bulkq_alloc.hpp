/*
 * bulkq_alloc.hpp
 *
 * Stateless allocators for bulkq backing stores.
 *
 * - Failure behavior is part of the type (fail_mode), so a container can
 *   tell from its allocator whether it has to check for nullptr.
 * - Over-aligned element types go through aligned ::operator new.
 */

#ifndef BULKQ_ALLOC_HPP_
#define BULKQ_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte, std::ptrdiff_t
#include <limits>      // std::numeric_limits
#include <new>         // std::nothrow, std::align_val_t, std::bad_alloc
#include <type_traits> // std::true_type

#include "bulkq_tools.hpp"

namespace bulkq::alloc {

enum class fail_mode : unsigned {
    throws,        // allocate() throws std::bad_alloc on failure (requires BULKQ_ENABLE_EXCEPTIONS != 0)
    returns_null   // allocate() returns nullptr on failure
};

namespace detail {

#if defined(__STDCPP_DEFAULT_NEW_ALIGNMENT__)
inline constexpr std::size_t kDefaultNewAlign = __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
inline constexpr std::size_t kDefaultNewAlign = alignof(std::max_align_t);
#endif

template<class T>
inline constexpr bool needs_overaligned_alloc = (alignof(T) > kDefaultNewAlign);

template<fail_mode Mode>
[[nodiscard]] inline void* fail_ptr() noexcept(Mode == fail_mode::returns_null)
{
    static_assert((Mode != fail_mode::throws) || (BULKQ_ENABLE_EXCEPTIONS != 0),
                  "fail_mode::throws requires BULKQ_ENABLE_EXCEPTIONS != 0");

    if constexpr (Mode == fail_mode::throws) {
#if (BULKQ_ENABLE_EXCEPTIONS != 0)
        throw std::bad_alloc{};
#else
        return nullptr;
#endif
    } else {
        return nullptr;
    }
}

} // namespace detail

// ============================================================================
// basic_allocator<T, Mode>
// ============================================================================

template<class T, fail_mode Mode>
class basic_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using is_always_equal                        = std::true_type;

    static constexpr fail_mode mode = Mode;

    static_assert((Mode != fail_mode::throws) || (BULKQ_ENABLE_EXCEPTIONS != 0),
                  "basic_allocator: fail_mode::throws requires exceptions");

    basic_allocator() noexcept = default;

    template<class U>
    basic_allocator(const basic_allocator<U, Mode>&) noexcept {}

    [[nodiscard]] T* allocate(size_type n) noexcept(Mode == fail_mode::returns_null)
    {
        if (RB_UNLIKELY(n == 0u)) {
            return nullptr;
        }

        if (RB_UNLIKELY(n > (std::numeric_limits<size_type>::max() / sizeof(T)))) {
            return static_cast<T*>(detail::fail_ptr<Mode>());
        }

        const size_type bytes = n * sizeof(T);

        if constexpr (!detail::needs_overaligned_alloc<T>) {
            if constexpr (Mode == fail_mode::throws) {
                return static_cast<T*>(::operator new(bytes));
            } else {
                return static_cast<T*>(::operator new(bytes, std::nothrow));
            }
        } else {
            if constexpr (Mode == fail_mode::throws) {
                return static_cast<T*>(::operator new(bytes, std::align_val_t(alignof(T))));
            } else {
                return static_cast<T*>(::operator new(bytes, std::align_val_t(alignof(T)), std::nothrow));
            }
        }
    }

    void deallocate(T* p, size_type /*n*/) noexcept
    {
        if (RB_UNLIKELY(!p)) {
            return;
        }

        if constexpr (!detail::needs_overaligned_alloc<T>) {
            ::operator delete(p);
        } else {
            ::operator delete(p, std::align_val_t(alignof(T)));
        }
    }

    template<class U>
    struct rebind {
        using other = basic_allocator<U, Mode>;
    };
};

template<class T1, fail_mode M1, class T2, fail_mode M2>
inline bool operator==(const basic_allocator<T1, M1>&,
                       const basic_allocator<T2, M2>&) noexcept
{
    return M1 == M2;
}

// ============================================================================
// Default allocator aliases
// ============================================================================

inline constexpr fail_mode kDefaultFailMode =
    (BULKQ_ENABLE_EXCEPTIONS != 0) ? fail_mode::throws : fail_mode::returns_null;

using default_alloc = basic_allocator<std::byte, kDefaultFailMode>;

} // namespace bulkq::alloc

#endif /* BULKQ_ALLOC_HPP_ */
