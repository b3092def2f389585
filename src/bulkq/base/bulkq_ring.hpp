/*
 * ring_base
 *
 * Cursor and capacity logic for bounded ring buffers of arbitrary (not only
 * power-of-two) capacity. Owns no element storage.
 *
 * State:
 *   - _cap  : number of slots, fixed after init(), 0 means "no storage".
 *   - _read : physical index of the next slot to read, always < _cap.
 *   - _len  : number of occupied slots, 0 <= _len <= _cap.
 *
 * The write cursor is derived as (_read + _len) wrapped once at _cap, so the
 * full and empty states never alias. Capacities are limited to kMaxCapacity
 * (half the reg range) so that _read + _len and _read + n never overflow.
 *
 * Contiguous runs:
 *   - write_size() = min(free(), _cap - write_index())
 *   - read_size()  = min(size(), _cap - read_index())
 * Each is the longest run that does not cross the physical end of storage.
 */

#ifndef BULKQ_RING_BASE_HPP_
#define BULKQ_RING_BASE_HPP_

#include <limits>
#include <type_traits>

#include "basic_types.h"   // reg
#include "bulkq_tools.hpp" // RB_FORCEINLINE / RB_UNLIKELY / BULKQ_ASSERT

namespace bulkq {

namespace ring {

/* RB_REG_BITS:  bit-width of 'reg'
 * kMaxCapacity: largest capacity for which cursor sums cannot overflow.
 */
constexpr unsigned RB_REG_BITS  = std::numeric_limits<reg>::digits;
constexpr reg      kMaxCapacity = reg(1) << (RB_REG_BITS - 1);

[[nodiscard]] RB_FORCEINLINE constexpr bool is_valid_capacity(const reg cap) noexcept {
    return (cap != 0u) && (cap <= kMaxCapacity);
}

static_assert(!is_valid_capacity(reg{0}), "is_valid_capacity(0)");
static_assert(is_valid_capacity(reg{1}) && is_valid_capacity(reg{3}), "is_valid_capacity(small)");
static_assert(!is_valid_capacity(kMaxCapacity + 1u), "is_valid_capacity(limit)");

} // namespace ring

class ring_base
{
    static_assert(std::is_unsigned<reg>::value, "[ring_base]: 'reg' must be unsigned");

    [[nodiscard]] static RB_FORCEINLINE reg rb_min_(const reg a, const reg b) noexcept {
        return (a < b) ? a : b;
    }

public:
    [[nodiscard]] RB_FORCEINLINE reg capacity() const noexcept { return _cap; }

protected:
    ring_base() noexcept = default;
    ~ring_base() noexcept = default;

    // Geometry (re)initialization. Queue becomes empty.
    // Returns false (and leaves a zero-capacity ring) for an invalid capacity.
    bool init(const reg cap) noexcept;

    // Re-init with explicit state. Rejects read >= cap or len > cap.
    bool init(const reg cap, const reg read, const reg len) noexcept;

    void swap_base(ring_base &other) noexcept;

protected:
    // Core occupancy helpers.
    [[nodiscard]] RB_FORCEINLINE reg  size()  const noexcept { return _len; }
    [[nodiscard]] RB_FORCEINLINE reg  free()  const noexcept { return static_cast<reg>(_cap - _len); }

    RB_FORCEINLINE void clear() noexcept {
        _read = 0u;
        _len  = 0u;
    }

protected:
    // Physical indices into the storage.
    [[nodiscard]] RB_FORCEINLINE reg read_index()  const noexcept { return _read; }
    [[nodiscard]] reg write_index() const noexcept;

    // Physical index of the i-th queued item (i < size()).
    [[nodiscard]] reg logical_index(const reg i) const noexcept;

    // Contiguous sizes from the current cursors.
    [[nodiscard]] reg write_size() const noexcept;
    [[nodiscard]] reg read_size () const noexcept;

    // Advancement helpers (producer/consumer responsibilities).
    void advance_write(const reg n) noexcept;
    void advance_read (const reg n) noexcept;

    RB_FORCEINLINE void increment_write() noexcept { advance_write(1u); }
    RB_FORCEINLINE void increment_read () noexcept { advance_read(1u); }

private:
    reg _cap{0u};
    reg _read{0u};
    reg _len{0u};
};

/* ----------------------------- definitions ----------------------------- */

inline bool ring_base::init(const reg cap) noexcept {
    clear();
    if (RB_UNLIKELY(!ring::is_valid_capacity(cap))) {
        _cap = 0u;
        return cap == 0u;
    }
    _cap = cap;
    return true;
}

inline bool ring_base::init(const reg cap, const reg read, const reg len) noexcept {
    if (!init(cap)) {
        return false;
    }
    if (cap == 0u) {
        return (read == 0u) && (len == 0u);
    }
    if (RB_UNLIKELY(read >= cap) || RB_UNLIKELY(len > cap)) {
        return false;
    }
    _read = read;
    _len  = len;
    return true;
}

inline void ring_base::swap_base(ring_base &other) noexcept {
    const ring_base tmp = *this;
    *this = other;
    other = tmp;
}

inline reg ring_base::write_index() const noexcept {
    // _read < _cap and _len <= _cap, so one subtraction wraps.
    const reg w = static_cast<reg>(_read + _len);
    return (w >= _cap) ? static_cast<reg>(w - _cap) : w;
}

inline reg ring_base::logical_index(const reg i) const noexcept {
    BULKQ_ASSERT(i < _len);
    const reg p = static_cast<reg>(_read + i);
    return (p >= _cap) ? static_cast<reg>(p - _cap) : p;
}

inline reg ring_base::write_size() const noexcept {
    if (RB_UNLIKELY(_cap == 0u)) {
        return 0u;
    }
    return rb_min_(free(), static_cast<reg>(_cap - write_index()));
}

inline reg ring_base::read_size() const noexcept {
    if (RB_UNLIKELY(_cap == 0u)) {
        return 0u;
    }
    return rb_min_(_len, static_cast<reg>(_cap - _read));
}

inline void ring_base::advance_write(const reg n) noexcept {
    BULKQ_ASSERT(n <= write_size());
    _len = static_cast<reg>(_len + n);
}

inline void ring_base::advance_read(const reg n) noexcept {
    BULKQ_ASSERT(n <= read_size());
    if (n == 0u) {
        return;
    }
    const reg r = static_cast<reg>(_read + n);
    _read = (r >= _cap) ? static_cast<reg>(r - _cap) : r;
    _len  = static_cast<reg>(_len - n);
}

} // namespace bulkq

#endif /* BULKQ_RING_BASE_HPP_ */
