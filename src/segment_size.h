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
#include <string>
#include <vector>
#include "config.h"

namespace recset {

/**
 * Geometry of the record number space.
 *
 * A SegmentSize is an immutable value fixed when a dataset is created and
 * threaded into every RecordSet and Segment built for it. Mixing values
 * built from different geometries raises ConfigError.
 */
class SegmentSize {
public:
    // Defaults: 4096 byte bitmaps, lists of up to 2000 offsets
    SegmentSize();

    static SegmentSize from_segment_size_bytes(size_t segment_size_bytes,
                                               size_t upper_conversion_limit = 0,
                                               size_t lower_conversion_limit = 0,
                                               size_t sort_scale = RECSET_SORT_SCALE);

    // segment_size records per segment (a multiple of 8). A zero
    // upper_conversion_limit picks the largest list still smaller than a
    // bitmap, capped at RECSET_CONVERSION_LIMIT. A zero
    // lower_conversion_limit means the upper one.
    static SegmentSize from_records(size_t segment_size,
                                    size_t upper_conversion_limit = 0,
                                    size_t lower_conversion_limit = 0,
                                    size_t sort_scale = RECSET_SORT_SCALE);

    /**
     * Compile-time defaults, overridden by RECSET_SEGMENT_SIZE_BYTES,
     * RECSET_CONVERSION_LIMIT and RECSET_SORT_SCALE from the environment.
     */
    static SegmentSize defaults();

    size_t segment_size() const { return segment_size_; }
    size_t segment_size_bytes() const { return segment_size_ >> 3; }
    size_t offset_width() const { return offset_width_; }
    size_t upper_conversion_limit() const { return upper_conversion_limit_; }
    size_t lower_conversion_limit() const { return lower_conversion_limit_; }
    size_t sort_scale() const { return sort_scale_; }

    // True when a list of upper_conversion_limit offsets is strictly
    // smaller than a bitmap, so a payload's type follows from its length.
    bool length_inference_ok() const;

    SegmentNumber segment_of(RecordNumber r) const;
    Offset offset_of(RecordNumber r) const;
    RecordNumber record_number(SegmentNumber segment, Offset offset) const;

    // Offsets within a segment at which a bulk load flushes, ascending.
    // The last is always segment_size - 1.
    std::vector<Offset> deferred_update_points() const;
    bool is_deferred_update_point(RecordNumber r) const;

    // Throws ConfigError
    void validate() const;

    std::string describe() const;

    bool operator==(const SegmentSize& other) const;
    bool operator!=(const SegmentSize& other) const { return !(*this == other); }

private:
    SegmentSize(size_t segment_size, size_t upper, size_t lower, size_t sort_scale);

    size_t segment_size_;
    size_t offset_width_;
    size_t upper_conversion_limit_;
    size_t lower_conversion_limit_;
    size_t sort_scale_;
};

} // namespace recset
