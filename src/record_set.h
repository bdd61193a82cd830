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

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "segment.h"
#include "segment_size.h"

namespace recset {

    namespace persist {
        class StorageAdapter;
    }

    /**
     * Set of record numbers, kept as one Segment per occupied segment
     * number in ascending order. A RecordSet never holds an empty segment.
     *
     * Algebra returns new sets and leaves its operands alone; the in-place
     * operators update the left operand. Operands must share a geometry.
     * A RecordSet is not thread-safe.
     */
    class RecordSet {
    public:
        using SegmentMap = std::map<SegmentNumber, Segment>;

        explicit RecordSet(const SegmentSize& config = SegmentSize());

        // Records [0, universe)
        static RecordSet full(const SegmentSize& config, RecordNumber universe);
        static RecordSet from_records(const SegmentSize& config,
                                      const std::vector<RecordNumber>& records);

        const SegmentSize& config() const { return config_; }

        // Both throw RangeError for a negative record number and return
        // false when nothing changed
        bool insert(RecordNumber r);
        bool remove(RecordNumber r);
        void clear() { segments_.clear(); }

        // Replaces the segment stored at number; an empty segment erases it
        void put_segment(SegmentNumber number, Segment segment);
        bool erase_segment(SegmentNumber number);
        // Applies the size policy without hysteresis to every segment
        void normalize();

        bool contains(RecordNumber r) const;
        size_t count() const;
        size_t segment_count() const { return segments_.size(); }
        bool empty() const { return segments_.empty(); }
        const Segment* find_segment(SegmentNumber number) const;
        const SegmentMap& segments() const { return segments_; }
        std::vector<RecordNumber> records() const;

        std::optional<RecordNumber> first() const;
        std::optional<RecordNumber> last() const;

        // Number of records <= r
        size_t position_of_record(RecordNumber r) const;
        // Record at a 0-based position; negative positions count from the
        // end, -1 being the last record
        std::optional<RecordNumber> record_at_position(int64_t position) const;

        RecordSet unite(const RecordSet& other) const;
        RecordSet intersect(const RecordSet& other) const;
        RecordSet subtract(const RecordSet& other) const;
        RecordSet symmetric_difference(const RecordSet& other) const;
        // Records of [0, universe) not in this set
        RecordSet complement(RecordNumber universe) const;

        RecordSet& operator|=(const RecordSet& other);
        RecordSet& operator&=(const RecordSet& other);
        RecordSet& operator-=(const RecordSet& other);
        RecordSet& operator^=(const RecordSet& other);

        bool operator==(const RecordSet& other) const;
        bool operator!=(const RecordSet& other) const { return !(*this == other); }

        /**
         * Reads every segment stored for index_value. Segment records are
         * framed (Segment::encode_framed).
         */
        static RecordSet load(const persist::StorageAdapter& adapter,
                              const std::string& index_value, const SegmentSize& config);

        /**
         * Writes every segment under index_value and removes stored segments
         * this set no longer has, inside one transaction (joined when the
         * adapter already holds one).
         */
        void store(persist::StorageAdapter& adapter, const std::string& index_value) const;

    private:
        void check_compatible(const RecordSet& other) const;

        SegmentSize config_;
        SegmentMap segments_;
    };

    RecordSet operator|(const RecordSet& a, const RecordSet& b);
    RecordSet operator&(const RecordSet& a, const RecordSet& b);
    RecordSet operator-(const RecordSet& a, const RecordSet& b);
    RecordSet operator^(const RecordSet& a, const RecordSet& b);

} // namespace recset
