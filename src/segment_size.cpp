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

#include "segment_size.h"
#include "errors.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace recset {

namespace {

    size_t width_for(size_t segment_size) {
        return segment_size <= limits::kMaxNarrowSegmentSize ? 2 : 4;
    }

    size_t env_size(const char* name, size_t fallback) {
        const char* env = std::getenv(name);
        if (!env || !*env) {
            return fallback;
        }
        try {
            return static_cast<size_t>(std::stoull(env));
        } catch (const std::exception&) {
            throw ConfigError(std::string("invalid value for ") + name + ": " + env);
        }
    }

} // namespace

SegmentSize::SegmentSize()
    : SegmentSize(RECSET_SEGMENT_SIZE_BYTES * 8, RECSET_CONVERSION_LIMIT,
                  RECSET_CONVERSION_LIMIT, RECSET_SORT_SCALE) {
    validate();
}

SegmentSize::SegmentSize(size_t segment_size, size_t upper, size_t lower, size_t sort_scale)
    : segment_size_(segment_size),
      offset_width_(width_for(segment_size)),
      upper_conversion_limit_(upper),
      lower_conversion_limit_(lower),
      sort_scale_(sort_scale) {}

SegmentSize SegmentSize::from_segment_size_bytes(size_t segment_size_bytes,
                                                 size_t upper_conversion_limit,
                                                 size_t lower_conversion_limit,
                                                 size_t sort_scale) {
    if (segment_size_bytes > limits::kMaxSegmentSize / 8) {
        throw ConfigError("segment size too large: " + std::to_string(segment_size_bytes) + " bytes");
    }
    return from_records(segment_size_bytes * 8, upper_conversion_limit,
                        lower_conversion_limit, sort_scale);
}

SegmentSize SegmentSize::from_records(size_t segment_size,
                                      size_t upper_conversion_limit,
                                      size_t lower_conversion_limit,
                                      size_t sort_scale) {
    size_t upper = upper_conversion_limit;
    if (upper == 0) {
        const size_t bytes = segment_size >> 3;
        const size_t width = width_for(segment_size);
        upper = bytes > width ? (bytes - 1) / width : 1;
        upper = std::max<size_t>(1, std::min<size_t>(upper, RECSET_CONVERSION_LIMIT));
    }
    size_t lower = lower_conversion_limit == 0 ? upper : lower_conversion_limit;
    SegmentSize cfg(segment_size, upper, lower, sort_scale);
    cfg.validate();
    return cfg;
}

SegmentSize SegmentSize::defaults() {
    const size_t bytes = env_size("RECSET_SEGMENT_SIZE_BYTES", RECSET_SEGMENT_SIZE_BYTES);
    const size_t upper = env_size("RECSET_CONVERSION_LIMIT", 0);
    const size_t scale = env_size("RECSET_SORT_SCALE", RECSET_SORT_SCALE);
    return from_segment_size_bytes(bytes, upper, 0, scale);
}

bool SegmentSize::length_inference_ok() const {
    return upper_conversion_limit_ * offset_width_ < segment_size_bytes();
}

SegmentNumber SegmentSize::segment_of(RecordNumber r) const {
    if (r < 0) {
        throw RangeError("negative record number " + std::to_string(r));
    }
    return static_cast<SegmentNumber>(r) / segment_size_;
}

Offset SegmentSize::offset_of(RecordNumber r) const {
    if (r < 0) {
        throw RangeError("negative record number " + std::to_string(r));
    }
    return static_cast<Offset>(static_cast<uint64_t>(r) % segment_size_);
}

RecordNumber SegmentSize::record_number(SegmentNumber segment, Offset offset) const {
    if (offset >= segment_size_) {
        throw RangeError("offset " + std::to_string(offset) +
                         " outside segment of " + std::to_string(segment_size_) + " records");
    }
    return static_cast<RecordNumber>(segment * segment_size_ + offset);
}

std::vector<Offset> SegmentSize::deferred_update_points() const {
    std::vector<Offset> points;
    points.reserve(sort_scale_);
    for (size_t k = 1; k <= sort_scale_; ++k) {
        Offset point = static_cast<Offset>(segment_size_ * k / sort_scale_ - 1);
        if (points.empty() || points.back() != point) {
            points.push_back(point);
        }
    }
    return points;
}

bool SegmentSize::is_deferred_update_point(RecordNumber r) const {
    const Offset off = offset_of(r);
    const auto points = deferred_update_points();
    return std::binary_search(points.begin(), points.end(), off);
}

void SegmentSize::validate() const {
    if (segment_size_ == 0 || (segment_size_ & 7) != 0) {
        throw ConfigError("segment size must be a positive multiple of 8, got " +
                          std::to_string(segment_size_));
    }
    if (segment_size_ > limits::kMaxSegmentSize) {
        throw ConfigError("segment size too large: " + std::to_string(segment_size_));
    }
    if (upper_conversion_limit_ < 1 || upper_conversion_limit_ >= segment_size_) {
        throw ConfigError("conversion limit " + std::to_string(upper_conversion_limit_) +
                          " must be in [1, " + std::to_string(segment_size_) + ")");
    }
    if (lower_conversion_limit_ < 1 || lower_conversion_limit_ > upper_conversion_limit_) {
        throw ConfigError("lower conversion limit " + std::to_string(lower_conversion_limit_) +
                          " must be in [1, " + std::to_string(upper_conversion_limit_) + "]");
    }
    if (sort_scale_ < 1 || sort_scale_ > segment_size_) {
        throw ConfigError("sort scale " + std::to_string(sort_scale_) + " out of range");
    }
}

std::string SegmentSize::describe() const {
    std::ostringstream os;
    os << "segment_size=" << segment_size_
       << " bytes=" << segment_size_bytes()
       << " offset_width=" << offset_width_
       << " conversion_limit=" << upper_conversion_limit_
       << "/" << lower_conversion_limit_
       << " sort_scale=" << sort_scale_;
    return os.str();
}

bool SegmentSize::operator==(const SegmentSize& other) const {
    return segment_size_ == other.segment_size_ &&
           upper_conversion_limit_ == other.upper_conversion_limit_ &&
           lower_conversion_limit_ == other.lower_conversion_limit_ &&
           sort_scale_ == other.sort_scale_;
}

} // namespace recset
