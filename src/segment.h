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

#include <optional>
#include <variant>
#include <vector>
#include "config.h"
#include "segment_size.h"
#include "util/bit_utility.h"

namespace recset {

    // Numeric values are the one-byte wire tags of encode_framed()
    enum class SegmentKind : uint8_t {
        Integer = 1,
        List    = 2,
        Bitmap  = 3
    };

    const char* to_string(SegmentKind kind);

    struct IntegerSegment {
        Offset offset;
    };

    // Ascending, duplicate free
    struct ListSegment {
        std::vector<Offset> offsets;
    };

    // segment_size bits, MSB-first
    struct BitmapSegment {
        Bytes bits;
        size_t population = 0;
    };

    /**
     * Records of one segment, as offsets 0 .. segment_size - 1.
     *
     * The representation follows the size policy of the geometry: one
     * record is an IntegerSegment, up to upper_conversion_limit records a
     * ListSegment, more a BitmapSegment. A bitmap shrinking by removals is
     * converted back once its population reaches lower_conversion_limit.
     * An empty Segment is an empty ListSegment; RecordSet never keeps one.
     *
     * Segments compare equal when they hold the same offsets, whatever
     * their representation.
     */
    class Segment {
    public:
        using Representation = std::variant<IntegerSegment, ListSegment, BitmapSegment>;

        explicit Segment(const SegmentSize& config);

        static Segment single(const SegmentSize& config, Offset offset);
        // Sorts and removes duplicates, then applies the size policy
        static Segment from_offsets(const SegmentSize& config, std::vector<Offset> offsets);
        // Offsets [begin, end)
        static Segment range(const SegmentSize& config, Offset begin, Offset end);

        const SegmentSize& config() const { return config_; }
        const Representation& representation() const { return rep_; }
        SegmentKind kind() const;

        size_t count() const;
        bool empty() const { return count() == 0; }
        bool contains(Offset offset) const;

        // Both throw RangeError for offset >= segment_size. They return
        // false when nothing changed.
        bool insert(Offset offset);
        bool remove(Offset offset);

        std::optional<Offset> first() const;
        std::optional<Offset> last() const;
        // Smallest offset >= offset
        std::optional<Offset> next_from(Offset offset) const;
        // Smallest offset > offset
        std::optional<Offset> next_after(Offset offset) const;
        // Largest offset < offset
        std::optional<Offset> prior_before(Offset offset) const;

        // Number of records with an offset <= offset
        size_t position_of(Offset offset) const;
        // The position-th record (0-based) counting from the start, or
        // from the end when forward is false
        std::optional<Offset> offset_at(size_t position, bool forward = true) const;

        std::vector<Offset> offsets() const;

        template<typename Fn>
        void for_each(Fn&& fn) const {
            if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
                fn(one->offset);
            } else if (auto* list = std::get_if<ListSegment>(&rep_)) {
                for (Offset off : list->offsets) fn(off);
            } else {
                const auto& bm = std::get<BitmapSegment>(rep_);
                util::for_each_set_bit(bm.bits.data(), config_.segment_size(),
                                       [&](size_t bit) { fn(static_cast<Offset>(bit)); });
            }
        }

        // Converts to a bitmap whatever the population
        void promote();
        // Applies the size policy without hysteresis
        void normalize();

        // Set algebra with a segment of the same geometry, in place. The
        // result is normalized. Throw ConfigError on a geometry mismatch.
        Segment& unite_with(const Segment& other);
        Segment& intersect_with(const Segment& other);
        Segment& subtract(const Segment& other);
        Segment& symmetric_difference_with(const Segment& other);

        bool operator==(const Segment& other) const;
        bool operator!=(const Segment& other) const { return !(*this == other); }
        // Same records in the same representation
        bool identical(const Segment& other) const;

        // Payload only: one big-endian offset, a run of them, or the bitmap
        Bytes encode() const;
        // One tag byte followed by the payload
        Bytes encode_framed() const;

        static Segment decode(const SegmentSize& config, SegmentKind kind,
                              const uint8_t* data, size_t len);
        static Segment decode(const SegmentSize& config, SegmentKind kind, const Bytes& payload);
        static Segment decode_framed(const SegmentSize& config, const Bytes& framed);
        // Type taken from the payload length. Needs length_inference_ok().
        static Segment decode_inferred(const SegmentSize& config, const Bytes& payload);

        static SegmentKind kind_from_tag(uint8_t tag);

    private:
        enum class Op { Or, And, AndNot, Xor };

        void check_offset(Offset offset) const;
        void check_compatible(const Segment& other) const;
        // Sorted unique offsets to the representation the policy asks for
        void assign_offsets(std::vector<Offset> offsets);
        Bytes bitmap_bytes() const;
        Segment& combine(const Segment& other, Op op);

        SegmentSize config_;
        Representation rep_;
    };

} // namespace recset
