/*
 * queue.hpp
 *
 * Abstract bounded FIFO with bulk (window-based) transfer.
 *
 * Design goals:
 * - Infallible:  nothing blocks, nothing grows, nothing reports an error.
 *                Full/empty show up as bool / std::nullopt / empty windows.
 * - Zero-copy:   bulk transfer is split into expose (view, no mutation) and
 *                commit/consume (mutation, no data movement), so callers copy
 *                straight between their buffers and the queue storage.
 * - Uniform:     every variant (fixed today) implements the same virtual
 *                contract, callers hold a queue<T>&.
 *
 * Concurrency model:
 * - None. Single owner; wrap it yourself for producer/consumer threads.
 *
 * WINDOW LIFETIME NOTE:
 * - A window returned by expose_*() is valid only until the next mutating
 *   call on the same queue.
 * - commit_written(n) / consume_read(n) with n greater than the window just
 *   exposed is a caller bug (BULKQ_ASSERT), not a recoverable error.
 * - Items past the physical end of storage need a second expose/commit
 *   (or expose/consume) cycle. That is the expected usage pattern.
 */

#ifndef BULKQ_QUEUE_HPP_
#define BULKQ_QUEUE_HPP_

#include <algorithm> // std::copy_n
#include <cstddef>   // std::ptrdiff_t
#include <memory>    // std::uninitialized_move_n
#include <optional>
#include <type_traits>
#include <utility>   // std::move

#include "basic_types.h"           // reg
#include "base/bulkq_regions.hpp"  // ::bulkq::bulk::region
#include "base/bulkq_tools.hpp"    // RB_UNLIKELY, BULKQ_HAS_SPAN

namespace bulkq {

/* =======================================================================
 * queue<T>
 *
 * The capability every queue variant provides. T is supplied by the caller
 * and never interpreted by the queue.
 * ======================================================================= */
template <class T>
class queue {
public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type = T;
    using pointer = value_type *;
    using const_pointer = const value_type *;
    using reference = value_type &;
    using const_reference = const value_type &;

    using size_type = reg;
    using difference_type = std::ptrdiff_t;

    using window = ::bulkq::bulk::region<pointer, size_type>;

    static_assert(!std::is_const_v<value_type>,
                  "[bulkq::queue]: const T does not make sense for a writable queue.");
    static_assert(!std::is_reference_v<value_type>,
                  "[bulkq::queue]: T must be an object type.");

    virtual ~queue() = default;

    // ------------------------------------------------------------------------------------------
    // Accounting
    // ------------------------------------------------------------------------------------------

    // Items currently stored.
    [[nodiscard]] virtual size_type amount_queued() const noexcept = 0;

    // Free slots. amount_queued() + amount_free() == capacity().
    [[nodiscard]] virtual size_type amount_free() const noexcept = 0;

    [[nodiscard]] size_type capacity() const noexcept {
        return static_cast<size_type>(amount_queued() + amount_free());
    }
    [[nodiscard]] bool is_empty() const noexcept { return amount_queued() == 0u; }
    [[nodiscard]] bool is_full() const noexcept { return amount_free() == 0u; }

    // ------------------------------------------------------------------------------------------
    // Single-item operations
    // ------------------------------------------------------------------------------------------

    // Append at the tail. Returns false (item dropped) iff the queue was full.
    [[nodiscard]] virtual bool enqueue(value_type item) = 0;

    // Remove the head. std::nullopt iff the queue was empty.
    [[nodiscard]] virtual std::optional<value_type> dequeue() = 0;

    // ------------------------------------------------------------------------------------------
    // Bulk primitives
    // ------------------------------------------------------------------------------------------

    // First contiguous run of free slots at the write cursor. Empty when full.
    [[nodiscard]] virtual window expose_writable_slots() noexcept = 0;

    // The first `count` slots of the last writable window now hold items.
    virtual void commit_written(size_type count) noexcept = 0;

    // First contiguous run of queued items at the read cursor. Empty when empty.
    [[nodiscard]] virtual window expose_readable_slots() noexcept = 0;

    // The first `count` items of the last readable window were taken.
    virtual void consume_read(size_type count) noexcept = 0;

    // ------------------------------------------------------------------------------------------
    // Bulk helpers (one window per call)
    // ------------------------------------------------------------------------------------------

    // Copy up to n items from src into the next writable window.
    // Returns how many were enqueued: 0 when full, possibly < n at the wrap.
    size_type bulk_enqueue(const_pointer src, const size_type n) {
        static_assert(std::is_copy_assignable_v<value_type>,
                      "[bulkq::queue]: bulk_enqueue requires copy-assignable T.");

        const window w = expose_writable_slots();
        const size_type amount = (n < w.count) ? n : w.count;
        if (RB_UNLIKELY(amount == 0u)) {
            return 0u;
        }
        std::copy_n(src, amount, w.ptr);
        commit_written(amount);
        return amount;
    }

    // Move up to n items from the next readable window into dst.
    // Returns how many were dequeued: 0 when empty, possibly < n at the wrap.
    size_type bulk_dequeue(pointer dst, const size_type n) {
        const window w = expose_readable_slots();
        const size_type amount = (n < w.count) ? n : w.count;
        if (RB_UNLIKELY(amount == 0u)) {
            return 0u;
        }
        for (size_type i = 0; i < amount; ++i) {
            dst[i] = std::move(w.ptr[i]);
        }
        consume_read(amount);
        return amount;
    }

    // As bulk_dequeue(), but dst is raw storage: items are move-constructed
    // into dst[0, amount). The caller owns (and later destroys) them.
    size_type bulk_dequeue_uninit(pointer dst, const size_type n) {
        const window w = expose_readable_slots();
        const size_type amount = (n < w.count) ? n : w.count;
        if (RB_UNLIKELY(amount == 0u)) {
            return 0u;
        }
        std::uninitialized_move_n(w.ptr, amount, dst);
        consume_read(amount);
        return amount;
    }

#if BULKQ_HAS_SPAN
    size_type bulk_enqueue(std::span<const value_type> src) {
        return bulk_enqueue(src.data(), static_cast<size_type>(src.size()));
    }

    size_type bulk_dequeue(std::span<value_type> dst) {
        return bulk_dequeue(dst.data(), static_cast<size_type>(dst.size()));
    }

    size_type bulk_dequeue_uninit(std::span<value_type> dst) {
        return bulk_dequeue_uninit(dst.data(), static_cast<size_type>(dst.size()));
    }
#endif /* BULKQ_HAS_SPAN */

protected:
    queue() noexcept = default;
    queue(const queue &) = default;
    queue(queue &&) noexcept = default;
    queue &operator=(const queue &) = default;
    queue &operator=(queue &&) noexcept = default;
};

} // namespace bulkq

#endif /* BULKQ_QUEUE_HPP_ */
