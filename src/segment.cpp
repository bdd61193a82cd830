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

#include "segment.h"
#include "errors.h"
#include "util/endian.hpp"
#include "util/log.h"
#include <algorithm>
#include <iterator>

namespace recset {

const char* to_string(SegmentKind kind) {
    switch (kind) {
    case SegmentKind::Integer:
        return "integer";
    case SegmentKind::List:
        return "list";
    case SegmentKind::Bitmap:
        return "bitmap";
    }
    return "unknown";
}

Segment::Segment(const SegmentSize& config)
    : config_(config), rep_(ListSegment{}) {}

Segment Segment::single(const SegmentSize& config, Offset offset) {
    Segment s(config);
    s.check_offset(offset);
    s.rep_ = IntegerSegment{offset};
    return s;
}

Segment Segment::from_offsets(const SegmentSize& config, std::vector<Offset> offsets) {
    Segment s(config);
    std::sort(offsets.begin(), offsets.end());
    offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());
    if (!offsets.empty()) {
        s.check_offset(offsets.back());
    }
    s.assign_offsets(std::move(offsets));
    return s;
}

Segment Segment::range(const SegmentSize& config, Offset begin, Offset end) {
    Segment s(config);
    if (end > config.segment_size()) {
        throw RangeError("range end " + std::to_string(end) + " outside segment of " +
                         std::to_string(config.segment_size()) + " records");
    }
    if (begin >= end) {
        return s;
    }
    BitmapSegment bm;
    bm.bits.assign(config.segment_size_bytes(), 0);
    util::set_range(bm.bits.data(), begin, end);
    bm.population = end - begin;
    s.rep_ = std::move(bm);
    s.normalize();
    return s;
}

SegmentKind Segment::kind() const {
    switch (rep_.index()) {
    case 0:
        return SegmentKind::Integer;
    case 1:
        return SegmentKind::List;
    default:
        return SegmentKind::Bitmap;
    }
}

size_t Segment::count() const {
    if (std::holds_alternative<IntegerSegment>(rep_)) {
        return 1;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        return list->offsets.size();
    }
    return std::get<BitmapSegment>(rep_).population;
}

bool Segment::contains(Offset offset) const {
    if (offset >= config_.segment_size()) {
        return false;
    }
    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        return one->offset == offset;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        return std::binary_search(list->offsets.begin(), list->offsets.end(), offset);
    }
    return util::test_bit(std::get<BitmapSegment>(rep_).bits.data(), offset);
}

bool Segment::insert(Offset offset) {
    check_offset(offset);

    if (auto* bm = std::get_if<BitmapSegment>(&rep_)) {
        if (util::test_bit(bm->bits.data(), offset)) {
            return false;
        }
        util::set_bit(bm->bits.data(), offset);
        ++bm->population;
        return true;
    }

    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        if (one->offset == offset) {
            return false;
        }
        std::vector<Offset> pair;
        if (offset < one->offset) {
            pair = {offset, one->offset};
        } else {
            pair = {one->offset, offset};
        }
        assign_offsets(std::move(pair));
        return true;
    }

    auto& list = std::get<ListSegment>(rep_).offsets;
    auto it = std::lower_bound(list.begin(), list.end(), offset);
    if (it != list.end() && *it == offset) {
        return false;
    }
    if (list.empty()) {
        rep_ = IntegerSegment{offset};
        return true;
    }
    list.insert(it, offset);
    if (list.size() > config_.upper_conversion_limit()) {
        trace() << "segment list of " << list.size() << " offsets converted to bitmap";
        promote();
    }
    return true;
}

bool Segment::remove(Offset offset) {
    check_offset(offset);

    if (auto* bm = std::get_if<BitmapSegment>(&rep_)) {
        if (!util::test_bit(bm->bits.data(), offset)) {
            return false;
        }
        util::clear_bit(bm->bits.data(), offset);
        --bm->population;
        if (bm->population <= config_.lower_conversion_limit()) {
            trace() << "segment bitmap of " << bm->population << " records converted down";
            assign_offsets(offsets());
        }
        return true;
    }

    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        if (one->offset != offset) {
            return false;
        }
        rep_ = ListSegment{};
        return true;
    }

    auto& list = std::get<ListSegment>(rep_).offsets;
    auto it = std::lower_bound(list.begin(), list.end(), offset);
    if (it == list.end() || *it != offset) {
        return false;
    }
    list.erase(it);
    if (list.size() == 1) {
        rep_ = IntegerSegment{list.front()};
    }
    return true;
}

std::optional<Offset> Segment::first() const {
    return next_from(0);
}

std::optional<Offset> Segment::last() const {
    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        return one->offset;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        if (list->offsets.empty()) return std::nullopt;
        return list->offsets.back();
    }
    const auto& bm = std::get<BitmapSegment>(rep_);
    size_t bit = util::find_prev_set(bm.bits.data(), config_.segment_size(), util::npos);
    if (bit == util::npos) return std::nullopt;
    return static_cast<Offset>(bit);
}

std::optional<Offset> Segment::next_from(Offset offset) const {
    if (offset >= config_.segment_size()) {
        return std::nullopt;
    }
    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        if (one->offset >= offset) return one->offset;
        return std::nullopt;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        auto it = std::lower_bound(list->offsets.begin(), list->offsets.end(), offset);
        if (it == list->offsets.end()) return std::nullopt;
        return *it;
    }
    const auto& bm = std::get<BitmapSegment>(rep_);
    size_t bit = util::find_next_set(bm.bits.data(), config_.segment_size(), offset);
    if (bit == util::npos) return std::nullopt;
    return static_cast<Offset>(bit);
}

std::optional<Offset> Segment::next_after(Offset offset) const {
    if (static_cast<size_t>(offset) + 1 >= config_.segment_size()) {
        return std::nullopt;
    }
    return next_from(offset + 1);
}

std::optional<Offset> Segment::prior_before(Offset offset) const {
    if (offset == 0) {
        return std::nullopt;
    }
    const Offset limit = static_cast<Offset>(
        std::min<size_t>(offset - 1, config_.segment_size() - 1));
    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        if (one->offset <= limit) return one->offset;
        return std::nullopt;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        auto it = std::upper_bound(list->offsets.begin(), list->offsets.end(), limit);
        if (it == list->offsets.begin()) return std::nullopt;
        return *std::prev(it);
    }
    const auto& bm = std::get<BitmapSegment>(rep_);
    size_t bit = util::find_prev_set(bm.bits.data(), config_.segment_size(), limit);
    if (bit == util::npos) return std::nullopt;
    return static_cast<Offset>(bit);
}

size_t Segment::position_of(Offset offset) const {
    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        return one->offset <= offset ? 1 : 0;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        return static_cast<size_t>(
            std::upper_bound(list->offsets.begin(), list->offsets.end(), offset) -
            list->offsets.begin());
    }
    const auto& bm = std::get<BitmapSegment>(rep_);
    size_t nbits = std::min<size_t>(static_cast<size_t>(offset) + 1, config_.segment_size());
    return util::popcount_prefix(bm.bits.data(), nbits);
}

std::optional<Offset> Segment::offset_at(size_t position, bool forward) const {
    const size_t n = count();
    if (position >= n) {
        return std::nullopt;
    }
    if (!forward) {
        position = n - 1 - position;
    }
    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        return one->offset;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        return list->offsets[position];
    }
    const auto& bm = std::get<BitmapSegment>(rep_);
    size_t bit = util::select_set(bm.bits.data(), config_.segment_size(), position);
    if (bit == util::npos) return std::nullopt;
    return static_cast<Offset>(bit);
}

std::vector<Offset> Segment::offsets() const {
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        return list->offsets;
    }
    std::vector<Offset> out;
    out.reserve(count());
    for_each([&](Offset off) { out.push_back(off); });
    return out;
}

void Segment::promote() {
    if (std::holds_alternative<BitmapSegment>(rep_)) {
        return;
    }
    BitmapSegment bm;
    bm.bits = bitmap_bytes();
    bm.population = count();
    rep_ = std::move(bm);
}

void Segment::normalize() {
    if (auto* bm = std::get_if<BitmapSegment>(&rep_)) {
        if (bm->population > config_.upper_conversion_limit()) {
            return;
        }
    }
    assign_offsets(offsets());
}

Segment& Segment::unite_with(const Segment& other) {
    return combine(other, Op::Or);
}

Segment& Segment::intersect_with(const Segment& other) {
    return combine(other, Op::And);
}

Segment& Segment::subtract(const Segment& other) {
    return combine(other, Op::AndNot);
}

Segment& Segment::symmetric_difference_with(const Segment& other) {
    return combine(other, Op::Xor);
}

Segment& Segment::combine(const Segment& other, Op op) {
    check_compatible(other);

    const bool lhs_bitmap = std::holds_alternative<BitmapSegment>(rep_);
    const bool rhs_bitmap = std::holds_alternative<BitmapSegment>(other.rep_);

    // A short side filtered against a bitmap stays short
    if (!lhs_bitmap && rhs_bitmap && (op == Op::And || op == Op::AndNot)) {
        std::vector<Offset> kept;
        for_each([&](Offset off) {
            if (other.contains(off) == (op == Op::And)) kept.push_back(off);
        });
        assign_offsets(std::move(kept));
        return *this;
    }
    if (lhs_bitmap && !rhs_bitmap && op == Op::And) {
        std::vector<Offset> kept;
        other.for_each([&](Offset off) {
            if (contains(off)) kept.push_back(off);
        });
        assign_offsets(std::move(kept));
        return *this;
    }

    if (lhs_bitmap || rhs_bitmap) {
        Bytes lhs = bitmap_bytes();
        Bytes rhs = other.bitmap_bytes();
        switch (op) {
        case Op::Or:     util::bitwise_or(lhs.data(), rhs.data(), lhs.size()); break;
        case Op::And:    util::bitwise_and(lhs.data(), rhs.data(), lhs.size()); break;
        case Op::AndNot: util::bitwise_andnot(lhs.data(), rhs.data(), lhs.size()); break;
        case Op::Xor:    util::bitwise_xor(lhs.data(), rhs.data(), lhs.size()); break;
        }
        BitmapSegment bm;
        bm.population = util::popcount(lhs.data(), lhs.size());
        bm.bits = std::move(lhs);
        rep_ = std::move(bm);
        normalize();
        return *this;
    }

    const std::vector<Offset> a = offsets();
    const std::vector<Offset> b = other.offsets();
    std::vector<Offset> out;
    out.reserve(op == Op::And ? std::min(a.size(), b.size()) : a.size() + b.size());
    auto sink = std::back_inserter(out);
    switch (op) {
    case Op::Or:     std::set_union(a.begin(), a.end(), b.begin(), b.end(), sink); break;
    case Op::And:    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), sink); break;
    case Op::AndNot: std::set_difference(a.begin(), a.end(), b.begin(), b.end(), sink); break;
    case Op::Xor:    std::set_symmetric_difference(a.begin(), a.end(), b.begin(), b.end(), sink); break;
    }
    assign_offsets(std::move(out));
    return *this;
}

bool Segment::operator==(const Segment& other) const {
    if (config_.segment_size() != other.config_.segment_size() || count() != other.count()) {
        return false;
    }
    auto* lhs = std::get_if<BitmapSegment>(&rep_);
    auto* rhs = std::get_if<BitmapSegment>(&other.rep_);
    if (lhs && rhs) {
        return lhs->bits == rhs->bits;
    }
    return offsets() == other.offsets();
}

bool Segment::identical(const Segment& other) const {
    return kind() == other.kind() && *this == other;
}

Bytes Segment::encode() const {
    const size_t width = config_.offset_width();
    Bytes out;
    if (auto* one = std::get_if<IntegerSegment>(&rep_)) {
        out.resize(width);
        util::store_be(out.data(), one->offset, width);
        return out;
    }
    if (auto* list = std::get_if<ListSegment>(&rep_)) {
        if (list->offsets.empty()) {
            throw EncodingError("cannot encode an empty segment");
        }
        util::pack_offsets(list->offsets, width, out);
        return out;
    }
    const auto& bm = std::get<BitmapSegment>(rep_);
    if (bm.population == 0) {
        throw EncodingError("cannot encode an empty segment");
    }
    return bm.bits;
}

Bytes Segment::encode_framed() const {
    Bytes payload = encode();
    Bytes out;
    out.reserve(payload.size() + 1);
    out.push_back(static_cast<uint8_t>(kind()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

SegmentKind Segment::kind_from_tag(uint8_t tag) {
    switch (tag) {
    case static_cast<uint8_t>(SegmentKind::Integer):
        return SegmentKind::Integer;
    case static_cast<uint8_t>(SegmentKind::List):
        return SegmentKind::List;
    case static_cast<uint8_t>(SegmentKind::Bitmap):
        return SegmentKind::Bitmap;
    default:
        throw EncodingError("unknown segment type tag " + std::to_string(tag));
    }
}

Segment Segment::decode(const SegmentSize& config, SegmentKind kind,
                        const uint8_t* data, size_t len) {
    const size_t width = config.offset_width();
    Segment s(config);

    switch (kind) {
    case SegmentKind::Integer: {
        if (len != width) {
            throw EncodingError("integer segment of " + std::to_string(len) +
                                " bytes, expected " + std::to_string(width));
        }
        Offset off = util::load_be(data, width);
        if (off >= config.segment_size()) {
            throw EncodingError("integer segment offset " + std::to_string(off) + " out of range");
        }
        s.rep_ = IntegerSegment{off};
        return s;
    }
    case SegmentKind::List: {
        if (len == 0 || len % width != 0) {
            throw EncodingError("list segment of " + std::to_string(len) +
                                " bytes is not a multiple of " + std::to_string(width));
        }
        if (len / width > config.upper_conversion_limit()) {
            throw EncodingError("list segment of " + std::to_string(len / width) +
                                " offsets exceeds conversion limit " +
                                std::to_string(config.upper_conversion_limit()));
        }
        std::vector<Offset> offsets = util::unpack_offsets(data, len, width);
        for (size_t i = 0; i < offsets.size(); ++i) {
            if (offsets[i] >= config.segment_size()) {
                throw EncodingError("list segment offset " + std::to_string(offsets[i]) + " out of range");
            }
            if (i > 0 && offsets[i] <= offsets[i - 1]) {
                throw EncodingError("list segment offsets not strictly ascending");
            }
        }
        // A one-entry list stays a list until normalize()
        s.rep_ = ListSegment{std::move(offsets)};
        return s;
    }
    case SegmentKind::Bitmap: {
        if (len != config.segment_size_bytes()) {
            throw EncodingError("bitmap segment of " + std::to_string(len) +
                                " bytes, expected " + std::to_string(config.segment_size_bytes()));
        }
        BitmapSegment bm;
        bm.bits.assign(data, data + len);
        bm.population = util::popcount(data, len);
        if (bm.population == 0) {
            throw EncodingError("bitmap segment with no records");
        }
        s.rep_ = std::move(bm);
        return s;
    }
    }
    throw EncodingError("unknown segment kind");
}

Segment Segment::decode(const SegmentSize& config, SegmentKind kind, const Bytes& payload) {
    return decode(config, kind, payload.data(), payload.size());
}

Segment Segment::decode_framed(const SegmentSize& config, const Bytes& framed) {
    if (framed.empty()) {
        throw EncodingError("empty segment record");
    }
    return decode(config, kind_from_tag(framed[0]), framed.data() + 1, framed.size() - 1);
}

Segment Segment::decode_inferred(const SegmentSize& config, const Bytes& payload) {
    if (!config.length_inference_ok()) {
        throw ConfigError("segment type cannot be inferred from length with " + config.describe());
    }
    SegmentKind kind = SegmentKind::List;
    if (payload.size() == config.offset_width()) {
        kind = SegmentKind::Integer;
    } else if (payload.size() == config.segment_size_bytes()) {
        kind = SegmentKind::Bitmap;
    }
    return decode(config, kind, payload);
}

void Segment::check_offset(Offset offset) const {
    if (offset >= config_.segment_size()) {
        throw RangeError("offset " + std::to_string(offset) + " outside segment of " +
                         std::to_string(config_.segment_size()) + " records");
    }
}

void Segment::check_compatible(const Segment& other) const {
    if (config_ != other.config_) {
        throw ConfigError("segments of different geometry: " + config_.describe() +
                          " vs " + other.config_.describe());
    }
}

void Segment::assign_offsets(std::vector<Offset> offsets) {
    if (offsets.empty()) {
        rep_ = ListSegment{};
    } else if (offsets.size() == 1) {
        rep_ = IntegerSegment{offsets.front()};
    } else if (offsets.size() <= config_.upper_conversion_limit()) {
        rep_ = ListSegment{std::move(offsets)};
    } else {
        BitmapSegment bm;
        bm.bits.assign(config_.segment_size_bytes(), 0);
        for (Offset off : offsets) {
            util::set_bit(bm.bits.data(), off);
        }
        bm.population = offsets.size();
        rep_ = std::move(bm);
    }
}

Bytes Segment::bitmap_bytes() const {
    if (auto* bm = std::get_if<BitmapSegment>(&rep_)) {
        return bm->bits;
    }
    Bytes bits(config_.segment_size_bytes(), 0);
    for_each([&](Offset off) { util::set_bit(bits.data(), off); });
    return bits;
}

} // namespace recset
