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

#include "bit_utility.h"
#include "endian.hpp"
#include <cstring>
#ifdef _MSC_VER
#include <intrin.h>
#endif

namespace recset {
namespace util {

namespace {

    inline uint64_t load_word(const uint8_t* p) noexcept {
        uint64_t w;
        std::memcpy(&w, p, sizeof(w));
        return w;
    }

    inline unsigned popcount8(uint8_t b) noexcept {
#if defined(__GNUC__) || defined(__clang__)
        return static_cast<unsigned>(__builtin_popcount(b));
#else
        unsigned n = 0;
        while (b) { b &= static_cast<uint8_t>(b - 1); ++n; }
        return n;
#endif
    }

    inline unsigned popcount64(uint64_t w) noexcept {
#if defined(__GNUC__) || defined(__clang__)
        return static_cast<unsigned>(__builtin_popcountll(w));
#elif defined(_MSC_VER)
        return static_cast<unsigned>(__popcnt64(w));
#else
        unsigned n = 0;
        while (w) { w &= w - 1; ++n; }
        return n;
#endif
    }

    // Index (from the MSB) of the highest set bit of a non-zero byte
    inline unsigned leading_zeros8(uint8_t b) noexcept {
#if defined(__GNUC__) || defined(__clang__)
        return static_cast<unsigned>(__builtin_clz(static_cast<unsigned>(b))) - 24u;
#else
        unsigned n = 0;
        while ((b & 0x80u) == 0) { b = static_cast<uint8_t>(b << 1); ++n; }
        return n;
#endif
    }

    // Index (from the LSB) of the lowest set bit of a non-zero byte
    inline unsigned trailing_zeros8(uint8_t b) noexcept {
#if defined(__GNUC__) || defined(__clang__)
        return static_cast<unsigned>(__builtin_ctz(static_cast<unsigned>(b)));
#else
        unsigned n = 0;
        while ((b & 1u) == 0) { b = static_cast<uint8_t>(b >> 1); ++n; }
        return n;
#endif
    }

} // namespace

size_t popcount(const uint8_t* bytes, size_t nbytes) noexcept {
    size_t n = 0;
    size_t i = 0;
    for (; i + 8 <= nbytes; i += 8) {
        n += popcount64(load_word(bytes + i));
    }
    for (; i < nbytes; ++i) {
        n += popcount8(bytes[i]);
    }
    return n;
}

size_t popcount_prefix(const uint8_t* bytes, size_t nbits) noexcept {
    const size_t whole = nbits >> 3;
    size_t n = popcount(bytes, whole);
    const size_t rem = nbits & 7;
    if (rem) {
        n += popcount8(static_cast<uint8_t>(bytes[whole] & (0xFFu << (8 - rem))));
    }
    return n;
}

size_t find_next_set(const uint8_t* bytes, size_t nbits, size_t from) noexcept {
    if (from >= nbits) {
        return npos;
    }
    const size_t nbytes = bytes_for_bits(nbits);
    size_t i = from >> 3;
    uint8_t b = static_cast<uint8_t>(bytes[i] & (0xFFu >> (from & 7)));
    for (;;) {
        if (b) {
            size_t bit = (i << 3) + leading_zeros8(b);
            return bit < nbits ? bit : npos;
        }
        ++i;
        // Skip empty words; sparse bitmaps are the common case
        while (i + 8 <= nbytes && load_word(bytes + i) == 0) {
            i += 8;
        }
        if (i >= nbytes) {
            return npos;
        }
        b = bytes[i];
    }
}

size_t find_prev_set(const uint8_t* bytes, size_t nbits, size_t from) noexcept {
    if (nbits == 0) {
        return npos;
    }
    if (from >= nbits) {
        from = nbits - 1;
    }
    size_t i = from >> 3;
    uint8_t b = static_cast<uint8_t>(bytes[i] & (0xFFu << (7 - (from & 7))));
    for (;;) {
        if (b) {
            return (i << 3) + 7 - trailing_zeros8(b);
        }
        if (i == 0) {
            return npos;
        }
        --i;
        while (i >= 8 && load_word(bytes + i - 7) == 0) {
            i -= 8;
        }
        b = bytes[i];
    }
}

size_t select_set(const uint8_t* bytes, size_t nbits, size_t k) noexcept {
    const size_t nbytes = bytes_for_bits(nbits);
    size_t seen = 0;
    size_t i = 0;
    for (; i + 8 <= nbytes; i += 8) {
        size_t c = popcount64(load_word(bytes + i));
        if (seen + c > k) {
            break;
        }
        seen += c;
    }
    for (; i < nbytes; ++i) {
        size_t c = popcount8(bytes[i]);
        if (seen + c > k) {
            uint8_t b = bytes[i];
            for (unsigned bit = 0; bit < 8; ++bit) {
                if (b & (0x80u >> bit)) {
                    if (seen == k) {
                        size_t pos = (i << 3) + bit;
                        return pos < nbits ? pos : npos;
                    }
                    ++seen;
                }
            }
        }
        seen += c;
    }
    return npos;
}

void set_range(uint8_t* bytes, size_t begin, size_t end) noexcept {
    if (begin >= end) {
        return;
    }
    // Leading partial byte
    while (begin < end && (begin & 7)) {
        set_bit(bytes, begin++);
    }
    const size_t full_bytes = (end - begin) >> 3;
    if (full_bytes) {
        std::memset(bytes + (begin >> 3), 0xFF, full_bytes);
        begin += full_bytes << 3;
    }
    while (begin < end) {
        set_bit(bytes, begin++);
    }
}

void bitwise_and(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept {
    for (size_t i = 0; i < nbytes; ++i) dst[i] &= src[i];
}

void bitwise_or(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept {
    for (size_t i = 0; i < nbytes; ++i) dst[i] |= src[i];
}

void bitwise_andnot(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept {
    for (size_t i = 0; i < nbytes; ++i) dst[i] &= static_cast<uint8_t>(~src[i]);
}

void bitwise_xor(uint8_t* dst, const uint8_t* src, size_t nbytes) noexcept {
    for (size_t i = 0; i < nbytes; ++i) dst[i] ^= src[i];
}

void pack_offsets(const std::vector<uint32_t>& offsets, size_t width,
                  std::vector<uint8_t>& out) {
    const size_t base = out.size();
    out.resize(base + offsets.size() * width);
    uint8_t* p = out.data() + base;
    for (uint32_t off : offsets) {
        store_be(p, off, width);
        p += width;
    }
}

std::vector<uint32_t> unpack_offsets(const uint8_t* bytes, size_t len, size_t width) {
    std::vector<uint32_t> offsets;
    offsets.reserve(len / width);
    for (size_t i = 0; i + width <= len; i += width) {
        offsets.push_back(load_be(bytes + i, width));
    }
    return offsets;
}

} // namespace util
} // namespace recset
