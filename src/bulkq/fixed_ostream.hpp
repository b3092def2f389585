/*
 * fixed_ostream.hpp
 *
 * Debug formatting for bulkq::fixed, kept out of fixed.hpp so that the
 * container itself does not drag in <ostream>.
 *
 *   fixed { capacity: 4, len: 3, data: [7, 21, 196] }
 *
 * Items are printed in FIFO order. signed/unsigned char (std::int8_t,
 * std::uint8_t) print as numbers, plain char as a character.
 */

#ifndef BULKQ_FIXED_OSTREAM_HPP_
#define BULKQ_FIXED_OSTREAM_HPP_

#include <ostream>
#include <type_traits>

#include "fixed.hpp"

namespace bulkq {

template <class CharT, class Traits, class T, class Alloc>
std::basic_ostream<CharT, Traits> &
operator<<(std::basic_ostream<CharT, Traits> &os, const fixed<T, Alloc> &q) {
    using size_type = typename fixed<T, Alloc>::size_type;

    const size_type len = q.amount_queued();
    os << "fixed { capacity: " << q.capacity() << ", len: " << len << ", data: [";
    for (size_type i = 0; i < len; ++i) {
        if (i != 0u) {
            os << ", ";
        }
        if constexpr (std::is_same_v<T, signed char> || std::is_same_v<T, unsigned char>) {
            os << static_cast<int>(q[i]);
        } else {
            os << q[i];
        }
    }
    return os << "] }";
}

} // namespace bulkq

#endif /* BULKQ_FIXED_OSTREAM_HPP_ */
