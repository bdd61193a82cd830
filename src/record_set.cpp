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

#include "record_set.h"
#include "errors.h"
#include "persistence/storage_adapter.h"
#include "util/log.h"
#include <algorithm>
#include <iterator>

namespace recset {

RecordSet::RecordSet(const SegmentSize& config) : config_(config) {}

RecordSet RecordSet::full(const SegmentSize& config, RecordNumber universe) {
    if (universe < 0) {
        throw RangeError("negative universe " + std::to_string(universe));
    }
    RecordSet result(config);
    const uint64_t size = config.segment_size();
    const uint64_t total = static_cast<uint64_t>(universe);
    for (SegmentNumber s = 0; s * size < total; ++s) {
        const Offset limit = static_cast<Offset>(std::min<uint64_t>(size, total - s * size));
        result.segments_.emplace_hint(result.segments_.end(), s, Segment::range(config, 0, limit));
    }
    return result;
}

RecordSet RecordSet::from_records(const SegmentSize& config,
                                  const std::vector<RecordNumber>& records) {
    std::map<SegmentNumber, std::vector<Offset>> grouped;
    for (RecordNumber r : records) {
        grouped[config.segment_of(r)].push_back(config.offset_of(r));
    }
    RecordSet result(config);
    for (auto& kv : grouped) {
        result.segments_.emplace_hint(result.segments_.end(), kv.first,
                                      Segment::from_offsets(config, std::move(kv.second)));
    }
    return result;
}

bool RecordSet::insert(RecordNumber r) {
    const SegmentNumber number = config_.segment_of(r);
    const Offset offset = config_.offset_of(r);
    auto it = segments_.find(number);
    if (it == segments_.end()) {
        segments_.emplace(number, Segment::single(config_, offset));
        return true;
    }
    return it->second.insert(offset);
}

bool RecordSet::remove(RecordNumber r) {
    const SegmentNumber number = config_.segment_of(r);
    auto it = segments_.find(number);
    if (it == segments_.end()) {
        return false;
    }
    if (!it->second.remove(config_.offset_of(r))) {
        return false;
    }
    if (it->second.empty()) {
        segments_.erase(it);
    }
    return true;
}

void RecordSet::put_segment(SegmentNumber number, Segment segment) {
    if (segment.config() != config_) {
        throw ConfigError("segment geometry " + segment.config().describe() +
                          " does not match record set geometry " + config_.describe());
    }
    if (segment.empty()) {
        segments_.erase(number);
        return;
    }
    auto it = segments_.find(number);
    if (it == segments_.end()) {
        segments_.emplace(number, std::move(segment));
    } else {
        it->second = std::move(segment);
    }
}

bool RecordSet::erase_segment(SegmentNumber number) {
    return segments_.erase(number) != 0;
}

void RecordSet::normalize() {
    for (auto& kv : segments_) {
        kv.second.normalize();
    }
}

bool RecordSet::contains(RecordNumber r) const {
    if (r < 0) {
        return false;
    }
    auto it = segments_.find(config_.segment_of(r));
    return it != segments_.end() && it->second.contains(config_.offset_of(r));
}

size_t RecordSet::count() const {
    size_t n = 0;
    for (const auto& kv : segments_) {
        n += kv.second.count();
    }
    return n;
}

const Segment* RecordSet::find_segment(SegmentNumber number) const {
    auto it = segments_.find(number);
    return it == segments_.end() ? nullptr : &it->second;
}

std::vector<RecordNumber> RecordSet::records() const {
    std::vector<RecordNumber> out;
    out.reserve(count());
    for (const auto& kv : segments_) {
        const SegmentNumber number = kv.first;
        kv.second.for_each([&](Offset off) {
            out.push_back(config_.record_number(number, off));
        });
    }
    return out;
}

std::optional<RecordNumber> RecordSet::first() const {
    if (segments_.empty()) {
        return std::nullopt;
    }
    const auto& front = *segments_.begin();
    return config_.record_number(front.first, *front.second.first());
}

std::optional<RecordNumber> RecordSet::last() const {
    if (segments_.empty()) {
        return std::nullopt;
    }
    const auto& back = *segments_.rbegin();
    return config_.record_number(back.first, *back.second.last());
}

size_t RecordSet::position_of_record(RecordNumber r) const {
    const SegmentNumber number = config_.segment_of(r);
    const Offset offset = config_.offset_of(r);
    size_t position = 0;
    for (const auto& kv : segments_) {
        if (kv.first > number) {
            break;
        }
        if (kv.first == number) {
            position += kv.second.position_of(offset);
            break;
        }
        position += kv.second.count();
    }
    return position;
}

std::optional<RecordNumber> RecordSet::record_at_position(int64_t position) const {
    const size_t total = count();
    if (position < 0) {
        position += static_cast<int64_t>(total);
        if (position < 0) {
            return std::nullopt;
        }
    }
    size_t remaining = static_cast<size_t>(position);
    if (remaining >= total) {
        return std::nullopt;
    }
    for (const auto& kv : segments_) {
        const size_t n = kv.second.count();
        if (remaining < n) {
            auto off = kv.second.offset_at(remaining);
            if (!off) {
                return std::nullopt;
            }
            return config_.record_number(kv.first, *off);
        }
        remaining -= n;
    }
    return std::nullopt;
}

RecordSet RecordSet::unite(const RecordSet& other) const {
    RecordSet result(*this);
    result |= other;
    return result;
}

RecordSet RecordSet::intersect(const RecordSet& other) const {
    RecordSet result(*this);
    result &= other;
    return result;
}

RecordSet RecordSet::subtract(const RecordSet& other) const {
    RecordSet result(*this);
    result -= other;
    return result;
}

RecordSet RecordSet::symmetric_difference(const RecordSet& other) const {
    RecordSet result(*this);
    result ^= other;
    return result;
}

RecordSet RecordSet::complement(RecordNumber universe) const {
    RecordSet result = full(config_, universe);
    for (auto it = result.segments_.begin(); it != result.segments_.end();) {
        const Segment* mine = find_segment(it->first);
        if (mine) {
            it->second.subtract(*mine);
        }
        it = it->second.empty() ? result.segments_.erase(it) : std::next(it);
    }
    return result;
}

RecordSet& RecordSet::operator|=(const RecordSet& other) {
    check_compatible(other);
    auto lhs = segments_.begin();
    for (const auto& entry : other.segments_) {
        while (lhs != segments_.end() && lhs->first < entry.first) {
            ++lhs;
        }
        if (lhs != segments_.end() && lhs->first == entry.first) {
            lhs->second.unite_with(entry.second);
            ++lhs;
        } else {
            segments_.emplace_hint(lhs, entry.first, entry.second);
        }
    }
    return *this;
}

RecordSet& RecordSet::operator&=(const RecordSet& other) {
    check_compatible(other);
    auto rhs = other.segments_.begin();
    for (auto lhs = segments_.begin(); lhs != segments_.end();) {
        while (rhs != other.segments_.end() && rhs->first < lhs->first) {
            ++rhs;
        }
        if (rhs == other.segments_.end() || rhs->first != lhs->first) {
            lhs = segments_.erase(lhs);
            continue;
        }
        lhs->second.intersect_with(rhs->second);
        lhs = lhs->second.empty() ? segments_.erase(lhs) : std::next(lhs);
    }
    return *this;
}

RecordSet& RecordSet::operator-=(const RecordSet& other) {
    check_compatible(other);
    auto rhs = other.segments_.begin();
    for (auto lhs = segments_.begin(); lhs != segments_.end();) {
        while (rhs != other.segments_.end() && rhs->first < lhs->first) {
            ++rhs;
        }
        if (rhs == other.segments_.end() || rhs->first != lhs->first) {
            ++lhs;
            continue;
        }
        lhs->second.subtract(rhs->second);
        lhs = lhs->second.empty() ? segments_.erase(lhs) : std::next(lhs);
    }
    return *this;
}

RecordSet& RecordSet::operator^=(const RecordSet& other) {
    check_compatible(other);
    auto lhs = segments_.begin();
    for (const auto& entry : other.segments_) {
        while (lhs != segments_.end() && lhs->first < entry.first) {
            ++lhs;
        }
        if (lhs != segments_.end() && lhs->first == entry.first) {
            lhs->second.symmetric_difference_with(entry.second);
            lhs = lhs->second.empty() ? segments_.erase(lhs) : std::next(lhs);
        } else {
            segments_.emplace_hint(lhs, entry.first, entry.second);
        }
    }
    return *this;
}

bool RecordSet::operator==(const RecordSet& other) const {
    return config_.segment_size() == other.config_.segment_size() &&
           segments_ == other.segments_;
}

RecordSet RecordSet::load(const persist::StorageAdapter& adapter,
                          const std::string& index_value, const SegmentSize& config) {
    RecordSet result(config);
    for (SegmentNumber number : adapter.segments(index_value)) {
        std::optional<Bytes> bytes = adapter.get(index_value, number);
        if (!bytes) {
            continue;
        }
        Segment segment = Segment::decode_framed(config, *bytes);
        result.segments_.emplace_hint(result.segments_.end(), number, std::move(segment));
    }
    trace() << "loaded " << result.segments_.size() << " segments";
    return result;
}

void RecordSet::store(persist::StorageAdapter& adapter, const std::string& index_value) const {
    persist::TransactionScope txn(adapter);
    for (SegmentNumber number : adapter.segments(index_value)) {
        if (segments_.find(number) == segments_.end()) {
            adapter.remove(index_value, number);
        }
    }
    for (const auto& kv : segments_) {
        adapter.put(index_value, kv.first, kv.second.encode_framed());
    }
    txn.commit();
    debug() << "stored " << segments_.size() << " segments";
}

void RecordSet::check_compatible(const RecordSet& other) const {
    if (config_ != other.config_) {
        throw ConfigError("record sets of different geometry: " + config_.describe() +
                          " vs " + other.config_.describe());
    }
}

RecordSet operator|(const RecordSet& a, const RecordSet& b) { return a.unite(b); }
RecordSet operator&(const RecordSet& a, const RecordSet& b) { return a.intersect(b); }
RecordSet operator-(const RecordSet& a, const RecordSet& b) { return a.subtract(b); }
RecordSet operator^(const RecordSet& a, const RecordSet& b) { return a.symmetric_difference(b); }

} // namespace recset
