/*
 * bulkq_regions.hpp
 *
 * POD window type returned by the bulk expose operations
 * (expose_writable_slots / expose_readable_slots).
 *
 * A region is a borrowed view into a queue's backing store. It is valid only
 * until the next mutating call on the queue that produced it.
 */

#ifndef BULKQ_BASE_BULKQ_REGIONS_HPP_
#define BULKQ_BASE_BULKQ_REGIONS_HPP_

#include <cstddef>
#include <type_traits>

// Provides BULKQ_HAS_SPAN and includes <span> when available.
#include "bulkq_tools.hpp"

namespace bulkq::bulk {

// ---------------------------------------------------------------------------------------------
// Contiguous region: PtrT is a pointer-to-element (e.g. T*, const T*).
// An empty region may still carry a non-null ptr (the cursor position).
// ---------------------------------------------------------------------------------------------
template <class PtrT, class SizeT>
struct region {
    static_assert(std::is_pointer_v<PtrT>, "bulkq::bulk::region requires PtrT to be a pointer type");

    using pointer   = PtrT;
    using size_type = SizeT;

    PtrT  ptr{nullptr};
    SizeT count{0u};

    [[nodiscard]] constexpr bool empty() const noexcept { return count == 0u; }

    [[nodiscard]] constexpr PtrT begin() const noexcept { return ptr; }
    [[nodiscard]] constexpr PtrT end() const noexcept { return ptr + count; }

#if BULKQ_HAS_SPAN
    using span_value_type = std::remove_pointer_t<PtrT>;
    [[nodiscard]] std::span<span_value_type> span() const noexcept {
        return {ptr, static_cast<std::size_t>(count)};
    }
#endif /* BULKQ_HAS_SPAN */
};

} // namespace bulkq::bulk

#endif /* BULKQ_BASE_BULKQ_REGIONS_HPP_ */
