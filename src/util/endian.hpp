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

namespace recset {
namespace util {

/**
 * Byte order helpers for the segment wire format.
 *
 * Segment offsets are written most significant byte first, so a packed
 * list of ascending offsets also sorts bytewise. These helpers work on any
 * host byte order.
 */

inline void store_be16(uint8_t* buf, uint16_t val) {
    buf[0] = static_cast<uint8_t>(val >> 8);
    buf[1] = static_cast<uint8_t>(val);
}

inline void store_be32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>(val >> 24);
    buf[1] = static_cast<uint8_t>(val >> 16);
    buf[2] = static_cast<uint8_t>(val >> 8);
    buf[3] = static_cast<uint8_t>(val);
}

inline void store_be64(uint8_t* buf, uint64_t val) {
    store_be32(buf, static_cast<uint32_t>(val >> 32));
    store_be32(buf + 4, static_cast<uint32_t>(val));
}

inline uint16_t load_be16(const uint8_t* buf) {
    return static_cast<uint16_t>((static_cast<uint16_t>(buf[0]) << 8) |
                                 static_cast<uint16_t>(buf[1]));
}

inline uint32_t load_be32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) |
           static_cast<uint32_t>(buf[3]);
}

inline uint64_t load_be64(const uint8_t* buf) {
    return (static_cast<uint64_t>(load_be32(buf)) << 32) | load_be32(buf + 4);
}

// Width-dispatched forms used by the offset packer (width is 2 or 4)

inline void store_be(uint8_t* buf, uint32_t val, size_t width) {
    if (width == 2) {
        store_be16(buf, static_cast<uint16_t>(val));
    } else {
        store_be32(buf, val);
    }
}

inline uint32_t load_be(const uint8_t* buf, size_t width) {
    return width == 2 ? load_be16(buf) : load_be32(buf);
}

} // namespace util
} // namespace recset
