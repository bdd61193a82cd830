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

#include "record_set_cursor.h"
#include "errors.h"
#include <iterator>

namespace recset {

RecordSetCursor::RecordSetCursor(const RecordSet& records)
    : RecordSetCursor(std::make_shared<const RecordSet>(records)) {}

RecordSetCursor::RecordSetCursor(std::shared_ptr<const RecordSet> records)
    : records_(std::move(records)), state_(State::BeforeFirst), offset_(0) {
    if (!records_) {
        throw RangeError("cursor needs a record set");
    }
    segment_ = records_->segments().end();
}

std::optional<RecordNumber> RecordSetCursor::first() {
    const auto& segments = records_->segments();
    if (segments.empty()) {
        return run_off(State::AfterLast);
    }
    auto it = segments.begin();
    return land(it, *it->second.first());
}

std::optional<RecordNumber> RecordSetCursor::last() {
    const auto& segments = records_->segments();
    if (segments.empty()) {
        return run_off(State::BeforeFirst);
    }
    auto it = std::prev(segments.end());
    return land(it, *it->second.last());
}

std::optional<RecordNumber> RecordSetCursor::next() {
    switch (state_) {
    case State::BeforeFirst:
        return first();
    case State::AfterLast:
        return std::nullopt;
    case State::OnRecord:
        break;
    }
    if (auto off = segment_->second.next_after(offset_)) {
        return land(segment_, *off);
    }
    auto it = std::next(segment_);
    if (it == records_->segments().end()) {
        return run_off(State::AfterLast);
    }
    return land(it, *it->second.first());
}

std::optional<RecordNumber> RecordSetCursor::prior() {
    switch (state_) {
    case State::AfterLast:
        return last();
    case State::BeforeFirst:
        return std::nullopt;
    case State::OnRecord:
        break;
    }
    if (auto off = segment_->second.prior_before(offset_)) {
        return land(segment_, *off);
    }
    if (segment_ == records_->segments().begin()) {
        return run_off(State::BeforeFirst);
    }
    auto it = std::prev(segment_);
    return land(it, *it->second.last());
}

std::optional<RecordNumber> RecordSetCursor::set_at(RecordNumber r) {
    const SegmentSize& config = records_->config();
    const SegmentNumber number = config.segment_of(r);
    const auto& segments = records_->segments();
    auto it = segments.lower_bound(number);
    if (it != segments.end() && it->first == number) {
        if (auto off = it->second.next_from(config.offset_of(r))) {
            return land(it, *off);
        }
        ++it;
    }
    if (it == segments.end()) {
        return run_off(State::AfterLast);
    }
    return land(it, *it->second.first());
}

std::optional<RecordNumber> RecordSetCursor::current() const {
    if (state_ != State::OnRecord) {
        return std::nullopt;
    }
    return records_->config().record_number(segment_->first, offset_);
}

std::optional<size_t> RecordSetCursor::position() const {
    auto r = current();
    if (!r) {
        return std::nullopt;
    }
    return records_->position_of_record(*r) - 1;
}

std::optional<RecordNumber> RecordSetCursor::land(Position segment, Offset offset) {
    state_ = State::OnRecord;
    segment_ = segment;
    offset_ = offset;
    return current();
}

std::optional<RecordNumber> RecordSetCursor::run_off(State state) {
    state_ = state;
    segment_ = records_->segments().end();
    return std::nullopt;
}

} // namespace recset
