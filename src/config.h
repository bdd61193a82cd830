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
#include <string>
#include <vector>

namespace recset {
#ifndef RECSET_SEGMENT_SIZE_BYTES
#define RECSET_SEGMENT_SIZE_BYTES 4096   // 32768 records per segment
#endif

#ifndef RECSET_CONVERSION_LIMIT
#define RECSET_CONVERSION_LIMIT 2000     // longest list before a bitmap
#endif

#ifndef RECSET_SORT_SCALE
#define RECSET_SORT_SCALE 1              // bulk load flushes per segment
#endif

#ifndef RECSET_DEFERRED_MAX_BYTES
#define RECSET_DEFERRED_MAX_BYTES (64ULL * 1024 * 1024)
#endif

    using RecordNumber  = int64_t;
    using SegmentNumber = uint64_t;
    using Offset        = uint32_t;
    using Bytes         = std::vector<uint8_t>;

    namespace limits {
        // Offsets of a 2 byte wide segment fit in uint16_t
        constexpr size_t kMaxNarrowSegmentSize = 65536;
        constexpr size_t kMaxSegmentSize = size_t(1) << 30;
    }

} // namespace recset
