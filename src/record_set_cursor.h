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

#include <memory>
#include <optional>
#include "record_set.h"

namespace recset {

    /**
     * Bidirectional cursor over an immutable RecordSet snapshot.
     *
     * Built from a reference, the cursor copies the set, so later changes to
     * the source are not seen. Built from a shared pointer, the set is
     * shared and must not be changed while the cursor lives.
     *
     * The cursor is before-first, on a record, or after-last. next() from
     * before-first is first(); prior() from after-last is last().
     */
    class RecordSetCursor {
    public:
        explicit RecordSetCursor(const RecordSet& records);
        explicit RecordSetCursor(std::shared_ptr<const RecordSet> records);

        std::optional<RecordNumber> first();
        std::optional<RecordNumber> last();
        std::optional<RecordNumber> next();
        std::optional<RecordNumber> prior();
        // Positions on r, else on the next greater record, else after-last
        std::optional<RecordNumber> set_at(RecordNumber r);
        std::optional<RecordNumber> current() const;

        // 0-based rank of the current record
        std::optional<size_t> position() const;
        size_t count() const { return records_->count(); }

        bool is_before_first() const { return state_ == State::BeforeFirst; }
        bool is_after_last() const { return state_ == State::AfterLast; }
        void reset() { state_ = State::BeforeFirst; }

        const RecordSet& record_set() const { return *records_; }

    private:
        enum class State { BeforeFirst, OnRecord, AfterLast };
        using Position = RecordSet::SegmentMap::const_iterator;

        std::optional<RecordNumber> land(Position segment, Offset offset);
        std::optional<RecordNumber> run_off(State state);

        std::shared_ptr<const RecordSet> records_;
        State state_;
        Position segment_;
        Offset offset_;
    };

} // namespace recset
