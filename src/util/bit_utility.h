/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Force inline on MSVC for better performance
#ifdef _MSC_VER
#define RECSET_FORCE_INLINE __forceinline
#else
#define RECSET_FORCE_INLINE inline __attribute__((always_inline))
#endif

namespace recset {
namespace util {

    /**
     * Bit helpers for existence bitmaps.
     *
     * Bitmaps are byte vectors with bit 0 in the most significant bit of
     * byte 0 (MSB-first). Every helper takes the bitmap length in bits;
     * padding bits past that length are never reported.
     */

    constexpr size_t npos = static_cast<size_t>(-1);

    constexpr size_t bytes_for_bits(size_t nbits) {
        return (nbits + 7) >> 3;
    }

    RECSET_FORCE_INLINE bool test_bit(const uint8_t* bytes, size_t bit) noexcept {
        return (bytes[bit >> 3] & (0x80u >> (bit & 7))) != 0;
    }

    RECSET_FORCE_INLINE void set_bit(uint8_t* bytes, size_t bit) noexcept {
        bytes[bit >> 3] |= static_cast<uint8_t>(0x80u >> (bit & 7));
    }

    RECSET_FORCE_INLINE void clear_bit(uint8_t* bytes, size_t bit) noexcept {
        bytes[bit >> 3] &= static_cast<uint8_t>(~(0x80u >> (bit & 7)));
    }

    // Set bits in the whole byte range
    size_t popcount(const uint8_t* bytes, size_t nbytes) noexcept;

    // Set bits in [0, nbits)
    size_t popcount_prefix(const uint8_t* bytes, size_t nbits) noexcept;

    // First set bit >= from, or npos
    size_t find_next_set(const uint8_t* bytes, size_t nbits, size_t from) noexcept;

    // Last set bit <= from, or npos. A from past the end searches from the
    // last bit.
    size_t find_prev_set(const uint8_t* bytes, size_t nbits, size_t from) noexcept;

    // Position of the k-th (0-based) set bit, or npos
    size_t select_set(const uint8_t* bytes, size_t nbits, size_t k) noexcept;

    // Sets bits [begin, end)
    void set_range(uint8_t* bytes, size_t begin, size_t end) noexcept;

    // In-place bytewise combination of equal-length bitmaps
    void bitwise_and(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept;
    void bitwise_or(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept;
    void bitwise_andnot(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept;
    void bitwise_xor(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept;

    template<typename Fn>
    void for_each_set_bit(const uint8_t* bytes, size_t nbits, Fn&& fn) {
        for (size_t bit = find_next_set(bytes, nbits, 0); bit != npos;
             bit = find_next_set(bytes, nbits, bit + 1)) {
            fn(bit);
        }
    }

    // Fixed-width big-endian integer sequences (width 2 or 4)
    void pack_offsets(const std::vector<uint32_t>& offsets, size_t width,
                      std::vector<uint8_t>& out);
    std::vector<uint32_t> unpack_offsets(const uint8_t* bytes, size_t len, size_t width);

} // namespace util
} // namespace recset
