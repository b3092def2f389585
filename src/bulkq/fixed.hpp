/*
 * fixed.hpp
 *
 * Fixed-capacity ring buffer implementing bulkq::queue<T>.
 *
 * Design goals:
 * - One allocation: the backing store is allocated and value-initialized at
 *   construction and never resized.
 * - Any capacity: cursors wrap at capacity(), no power-of-two rounding.
 * - Fast:        unchecked hot-paths; bulk windows expose contiguous runs.
 *
 * Construction policy:
 * - fixed(n)          : n == 0 (or n > ring::kMaxCapacity) throws
 *                       std::invalid_argument, allocation failure throws
 *                       std::bad_alloc. Without exceptions both end in
 *                       BULKQ_FAIL_FAST().
 * - try_create(n)     : same checks, reported as std::nullopt.
 *
 * MEMORY LAYOUT NOTE:
 * - dequeue()/consume_read() do NOT destroy elements (assignment-based ring).
 *   A dequeued slot keeps its moved-from value until it is written again.
 * - A moved-from fixed owns no storage: is_valid() == false, capacity() == 0,
 *   it is always both empty and full.
 */

#ifndef BULKQ_FIXED_HPP_
#define BULKQ_FIXED_HPP_

#include <cstddef>   // std::ptrdiff_t
#include <memory>    // std::allocator_traits, std::uninitialized_value_construct_n, std::destroy_n
#include <new>       // std::bad_alloc
#include <optional>
#include <stdexcept> // std::invalid_argument
#include <type_traits>
#include <utility>   // std::move, std::swap

#include "queue.hpp"           // ::bulkq::queue<T>
#include "base/bulkq_alloc.hpp" // ::bulkq::alloc::default_alloc
#include "base/bulkq_ring.hpp"  // ::bulkq::ring_base
#include "base/bulkq_tools.hpp" // RB_FORCEINLINE, RB_UNLIKELY, BULKQ_TRY

namespace bulkq {

/* =======================================================================
 * fixed<T, Alloc>
 *
 * Owning ring buffer of capacity() slots of T.
 * ======================================================================= */
template <class T, typename Alloc = ::bulkq::alloc::default_alloc>
class fixed final : public ::bulkq::queue<T>, private ::bulkq::ring_base {
    using Queue = ::bulkq::queue<T>;
    using Base = ::bulkq::ring_base;

public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using typename Queue::value_type;
    using typename Queue::pointer;
    using typename Queue::const_pointer;
    using typename Queue::reference;
    using typename Queue::const_reference;
    using typename Queue::size_type;
    using typename Queue::difference_type;
    using typename Queue::window;

    // Allocator types
    using base_allocator_type = Alloc;
    using allocator_type = typename std::allocator_traits<
        base_allocator_type>::template rebind_alloc<value_type>;
    using alloc_traits = std::allocator_traits<allocator_type>;
    using alloc_pointer = typename alloc_traits::pointer;

    // ------------------------------------------------------------------------------------------
    // Static Assertions
    // ------------------------------------------------------------------------------------------
    static_assert(alloc_traits::is_always_equal::value,
                  "[bulkq::fixed]: requires always_equal allocator (stateless).");
    static_assert(std::is_default_constructible_v<allocator_type>,
                  "[bulkq::fixed]: requires default-constructible allocator.");
    static_assert(std::is_same_v<alloc_pointer, pointer>,
                  "[bulkq::fixed]: requires allocator pointer type T*.");
    static_assert(std::is_default_constructible_v<value_type>,
                  "[bulkq::fixed]: value_type must be default-constructible.");
    static_assert(std::is_move_assignable_v<value_type> ||
                      std::is_copy_assignable_v<value_type>,
                  "[bulkq::fixed]: value_type must be move- or copy-assignable.");
    static_assert(std::is_move_constructible_v<value_type>,
                  "[bulkq::fixed]: value_type must be move-constructible (dequeue).");

#if (BULKQ_ENABLE_EXCEPTIONS == 0)
    static_assert(std::is_nothrow_default_constructible_v<value_type>,
                  "[bulkq::fixed]: no-exceptions mode requires noexcept default "
                  "constructor.");
    static_assert(std::is_nothrow_destructible_v<value_type>,
                  "[bulkq::fixed]: no-exceptions mode requires noexcept destructor.");
#endif /* BULKQ_ENABLE_EXCEPTIONS == 0 */

    // ------------------------------------------------------------------------------------------
    // Constructors / Destructor
    // ------------------------------------------------------------------------------------------
    explicit fixed(const size_type capacity) {
        if (RB_UNLIKELY(!::bulkq::ring::is_valid_capacity(capacity))) {
#if BULKQ_ENABLE_EXCEPTIONS
            throw std::invalid_argument("[bulkq::fixed]: capacity must be in [1, ring::kMaxCapacity]");
#else
            BULKQ_FAIL_FAST();
#endif
        }

        if (RB_UNLIKELY(!create_storage(capacity))) {
#if BULKQ_ENABLE_EXCEPTIONS
            throw std::bad_alloc{};
#else
            BULKQ_FAIL_FAST();
#endif
        }
    }

    // Non-throwing factory: std::nullopt for an invalid capacity or when the
    // backing store cannot be allocated.
    [[nodiscard]] static std::optional<fixed> try_create(const size_type capacity) {
        if (RB_UNLIKELY(!::bulkq::ring::is_valid_capacity(capacity))) {
            return std::nullopt;
        }

        fixed q;
        if (RB_UNLIKELY(!q.create_storage(capacity))) {
            return std::nullopt;
        }
        return std::optional<fixed>(std::move(q));
    }

    ~fixed() noexcept override { destroy(); }

    // Copy semantics (deep, linearized: the copy starts at slot 0)
    fixed(const fixed &other) : Queue(other), Base() { copy_from(other); }

    fixed &operator=(const fixed &other) {
        if (this != &other) {
            fixed tmp(other);
            swap(tmp);
        }
        return *this;
    }

    // Move semantics
    fixed(fixed &&other) noexcept : Queue(std::move(other)), Base() {
        move_from(std::move(other));
    }

    fixed &operator=(fixed &&other) noexcept {
        if (this != &other) {
            destroy();
            move_from(std::move(other));
        }
        return *this;
    }

    void swap(fixed &other) noexcept {
        if (this == &other) {
            return;
        }
        std::swap(storage_, other.storage_);
        Base::swap_base(other);
    }

    friend void swap(fixed &a, fixed &b) noexcept { a.swap(b); }

    // ------------------------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] RB_FORCEINLINE bool is_valid() const noexcept {
        return storage_ != nullptr;
    }

    [[nodiscard]] size_type capacity() const noexcept { return Base::capacity(); }

    [[nodiscard]] size_type amount_queued() const noexcept override { return Base::size(); }
    [[nodiscard]] size_type amount_free() const noexcept override { return Base::free(); }

    [[nodiscard]] allocator_type get_allocator() const noexcept { return {}; }

    [[nodiscard]] pointer data() noexcept { return storage_; }
    [[nodiscard]] const_pointer data() const noexcept { return storage_; }

    // i-th queued item in FIFO order (0 is the head).
    [[nodiscard]] RB_FORCEINLINE const_reference
    operator[](const size_type i) const noexcept {
        BULKQ_ASSERT(i < Base::size());
        return storage_[Base::logical_index(i)];
    }

    [[nodiscard]] RB_FORCEINLINE reference
    operator[](const size_type i) noexcept {
        BULKQ_ASSERT(i < Base::size());
        return storage_[Base::logical_index(i)];
    }

    // ------------------------------------------------------------------------------------------
    // Producer Operations
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] bool enqueue(value_type item) override {
        if (RB_UNLIKELY(Base::write_size() == 0u)) {
            return false;
        }
        storage_[Base::write_index()] = std::move(item);
        Base::increment_write();
        return true;
    }

    [[nodiscard]] window expose_writable_slots() noexcept override {
        if (RB_UNLIKELY(!is_valid())) {
            return {};
        }
        return window{storage_ + Base::write_index(), Base::write_size()};
    }

    void commit_written(const size_type count) noexcept override {
        BULKQ_ASSERT(count <= Base::write_size());
        Base::advance_write(count);
    }

    // ------------------------------------------------------------------------------------------
    // Consumer Operations
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] std::optional<value_type> dequeue() override {
        if (RB_UNLIKELY(Base::read_size() == 0u)) {
            return std::nullopt;
        }
        std::optional<value_type> out{std::move(storage_[Base::read_index()])};
        Base::increment_read();
        return out;
    }

    [[nodiscard]] window expose_readable_slots() noexcept override {
        if (RB_UNLIKELY(!is_valid())) {
            return {};
        }
        return window{storage_ + Base::read_index(), Base::read_size()};
    }

    void consume_read(const size_type count) noexcept override {
        BULKQ_ASSERT(count <= Base::read_size());
        Base::advance_read(count);
    }

private:
    // Storage-less instance, only reachable through try_create().
    fixed() noexcept = default;

    // Allocation that reports failure as nullptr in both build modes.
    [[nodiscard]] static pointer allocate_storage(const size_type n) {
        allocator_type alloc{};
#if BULKQ_ENABLE_EXCEPTIONS
        try {
            return alloc_traits::allocate(alloc, n);
        } catch (const std::bad_alloc &) {
            return nullptr;
        }
#else
        return alloc_traits::allocate(alloc, n);
#endif
    }

    // Allocates and value-initializes capacity slots, then resets geometry.
    // Returns false if allocation failed; rethrows if T's constructor throws.
    [[nodiscard]] bool create_storage(const size_type capacity) {
        BULKQ_ASSERT(storage_ == nullptr);

        pointer new_buf = allocate_storage(capacity);
        if (RB_UNLIKELY(new_buf == nullptr)) {
            return false;
        }

        BULKQ_TRY { std::uninitialized_value_construct_n(new_buf, capacity); }
        BULKQ_CATCH_ALL {
            allocator_type alloc{};
            alloc_traits::deallocate(alloc, new_buf, capacity);
            BULKQ_RETHROW;
        }

        storage_ = new_buf;
        const bool ok = Base::init(capacity);
        BULKQ_ASSERT(ok);
        (void)ok;
        return true;
    }

    void destroy() noexcept {
        pointer ptr = storage_;
        const size_type cap = Base::capacity();

        storage_ = nullptr;
        (void)Base::init(0u);

        if (ptr != nullptr) {
            if constexpr (!std::is_trivially_destructible_v<value_type>) {
                std::destroy_n(ptr, cap);
            }
            allocator_type alloc{};
            alloc_traits::deallocate(alloc, ptr, cap);
        }
    }

    void copy_from(const fixed &other) {
        static_assert(std::is_copy_assignable_v<value_type>,
                      "[bulkq::fixed]: copy requires copy-assignable value_type");

        if (!other.is_valid()) {
            return;
        }

        const size_type cap = other.capacity();
        if (RB_UNLIKELY(!create_storage(cap))) {
#if BULKQ_ENABLE_EXCEPTIONS
            throw std::bad_alloc{};
#else
            BULKQ_FAIL_FAST();
#endif
        }

        const size_type sz = other.amount_queued();
        BULKQ_TRY {
            for (size_type k = 0; k < sz; ++k) {
                storage_[k] = other[k];
            }
        }
        BULKQ_CATCH_ALL {
            destroy();
            BULKQ_RETHROW;
        }

        const bool ok = Base::init(cap, 0u, sz);
        BULKQ_ASSERT(ok);
        (void)ok;
    }

    void move_from(fixed &&other) noexcept {
        storage_ = other.storage_;
        Base::swap_base(other);

        // Steal and reset other
        other.storage_ = nullptr;
        (void)other.Base::init(0u);
    }

private:
    pointer storage_{nullptr};
};

} // namespace bulkq

#endif /* BULKQ_FIXED_HPP_ */
