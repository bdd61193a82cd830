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

#include <gtest/gtest.h>
#include "segment.h"
#include "errors.h"

using namespace recset;

namespace {

    const SegmentSize kSmall = SegmentSize::from_records(64, 8);

    Segment build(const SegmentSize& cfg, std::vector<Offset> offsets) {
        return Segment::from_offsets(cfg, std::move(offsets));
    }

} // namespace

TEST(SegmentCodecTest, IntegerPayload) {
    Segment s = build(kSmall, {40});
    EXPECT_EQ(s.encode(), (Bytes{0x00, 0x28}));
    EXPECT_EQ(s.encode_framed(), (Bytes{0x01, 0x00, 0x28}));

    Segment back = Segment::decode(kSmall, SegmentKind::Integer, Bytes{0x00, 0x28});
    EXPECT_TRUE(back.identical(s));
}

TEST(SegmentCodecTest, ListPayload) {
    Segment s = build(kSmall, {40, 3, 9});
    ASSERT_EQ(s.kind(), SegmentKind::List);
    EXPECT_EQ(s.encode(), (Bytes{0x00, 0x03, 0x00, 0x09, 0x00, 0x28}));
    EXPECT_EQ(s.encode_framed()[0], 0x02);

    Segment back = Segment::decode_framed(kSmall, s.encode_framed());
    EXPECT_TRUE(back.identical(s));
}

TEST(SegmentCodecTest, BitmapPayloadIsMsbFirst) {
    Segment s = build(kSmall, {0, 1, 2, 3, 4, 5, 6, 7, 8, 63});
    ASSERT_EQ(s.kind(), SegmentKind::Bitmap);
    EXPECT_EQ(s.encode(), (Bytes{0xFF, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01}));

    Bytes framed = s.encode_framed();
    ASSERT_EQ(framed.size(), 9u);
    EXPECT_EQ(framed[0], 0x03);
    EXPECT_TRUE(Segment::decode_framed(kSmall, framed).identical(s));
}

TEST(SegmentCodecTest, WideOffsets) {
    auto wide = SegmentSize::from_records(65544);
    ASSERT_EQ(wide.offset_width(), 4u);

    Segment s = build(wide, {65000});
    EXPECT_EQ(s.encode(), (Bytes{0x00, 0x00, 0xFD, 0xE8}));

    Segment two = build(wide, {1, 65543});
    EXPECT_EQ(two.encode(), (Bytes{0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x07}));
    EXPECT_EQ(Segment::decode(wide, SegmentKind::List, two.encode()), two);
}

TEST(SegmentCodecTest, SingleEntryListKeepsRepresentation) {
    const Bytes framed{0x02, 0x00, 0x05};
    Segment s = Segment::decode_framed(kSmall, framed);
    EXPECT_EQ(s.kind(), SegmentKind::List);
    EXPECT_EQ(s.count(), 1u);
    EXPECT_EQ(s.first(), Offset(5));
    EXPECT_EQ(s.encode_framed(), framed);
    EXPECT_EQ(s, Segment::from_offsets(kSmall, {5}));

    Segment grown = s;
    EXPECT_TRUE(grown.insert(9));
    EXPECT_EQ(grown.offsets(), (std::vector<Offset>{5, 9}));

    Segment drained = s;
    EXPECT_TRUE(drained.remove(5));
    EXPECT_TRUE(drained.empty());

    s.normalize();
    EXPECT_EQ(s.kind(), SegmentKind::Integer);
    EXPECT_EQ(s.encode_framed(), (Bytes{0x01, 0x00, 0x05}));
}

TEST(SegmentCodecTest, SparseBitmapKeepsRepresentation) {
    Bytes bits(8, 0);
    bits[0] = 0x40;  // offset 1
    bits[5] = 0x01;  // offset 47
    Segment s = Segment::decode(kSmall, SegmentKind::Bitmap, bits);
    EXPECT_EQ(s.kind(), SegmentKind::Bitmap);
    EXPECT_EQ(s.offsets(), (std::vector<Offset>{1, 47}));
    EXPECT_EQ(s.encode(), bits);

    s.normalize();
    EXPECT_EQ(s.kind(), SegmentKind::List);
}

TEST(SegmentCodecTest, EmptySegmentHasNoEncoding) {
    Segment empty(kSmall);
    EXPECT_THROW(empty.encode(), EncodingError);
    EXPECT_THROW(empty.encode_framed(), EncodingError);

    Segment drained = build(kSmall, {0, 1, 2, 3, 4, 5, 6, 7, 8});
    drained.promote();
    for (Offset off = 0; off <= 8; ++off) {
        drained.remove(off);
    }
    EXPECT_THROW(drained.encode(), EncodingError);
}

TEST(SegmentCodecTest, RejectsMalformedIntegers) {
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::Integer, Bytes{0x05}), EncodingError);
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::Integer, Bytes{0x00, 0x00, 0x05}),
                 EncodingError);
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::Integer, Bytes{0x00, 0x40}), EncodingError);
}

TEST(SegmentCodecTest, RejectsMalformedLists) {
    // Odd length
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::List, Bytes{0x00, 0x01, 0x02}),
                 EncodingError);
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::List, Bytes{}), EncodingError);
    // Descending
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::List, Bytes{0x00, 0x09, 0x00, 0x03}),
                 EncodingError);
    // Duplicate
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::List, Bytes{0x00, 0x03, 0x00, 0x03}),
                 EncodingError);
    // Out of range
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::List, Bytes{0x00, 0x03, 0x00, 0x40}),
                 EncodingError);

    // Longer than the conversion limit
    Bytes nine;
    for (uint8_t i = 0; i < 9; ++i) {
        nine.push_back(0x00);
        nine.push_back(i);
    }
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::List, nine), EncodingError);
}

TEST(SegmentCodecTest, RejectsMalformedBitmaps) {
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::Bitmap, Bytes(7, 0xFF)), EncodingError);
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::Bitmap, Bytes(9, 0xFF)), EncodingError);
    EXPECT_THROW(Segment::decode(kSmall, SegmentKind::Bitmap, Bytes(8, 0x00)), EncodingError);
}

TEST(SegmentCodecTest, RejectsUnknownTags) {
    EXPECT_THROW(Segment::decode_framed(kSmall, Bytes{}), EncodingError);
    EXPECT_THROW(Segment::decode_framed(kSmall, Bytes{0x00, 0x00, 0x05}), EncodingError);
    EXPECT_THROW(Segment::decode_framed(kSmall, Bytes{0x04, 0x00, 0x05}), EncodingError);
    EXPECT_THROW(Segment::kind_from_tag(0xFF), EncodingError);
    EXPECT_EQ(Segment::kind_from_tag(2), SegmentKind::List);
}

TEST(SegmentCodecTest, LengthInference) {
    SegmentSize cfg;
    ASSERT_TRUE(cfg.length_inference_ok());

    Segment one = build(cfg, {12345});
    Segment few = build(cfg, {1, 2, 3});
    std::vector<Offset> many;
    for (Offset off = 0; off < 3000; ++off) {
        many.push_back(static_cast<Offset>(off * 7 % cfg.segment_size()));
    }
    Segment dense = build(cfg, many);
    ASSERT_EQ(dense.kind(), SegmentKind::Bitmap);

    EXPECT_TRUE(Segment::decode_inferred(cfg, one.encode()).identical(one));
    EXPECT_TRUE(Segment::decode_inferred(cfg, few.encode()).identical(few));
    EXPECT_TRUE(Segment::decode_inferred(cfg, dense.encode()).identical(dense));
}

TEST(SegmentCodecTest, LengthInferenceNeedsRoomyBitmaps) {
    // A full list of 8 two-byte offsets is as long as the 8-byte bitmap
    ASSERT_FALSE(kSmall.length_inference_ok());
    Segment s = build(kSmall, {1, 2});
    EXPECT_THROW(Segment::decode_inferred(kSmall, s.encode()), ConfigError);
}

TEST(SegmentCodecTest, KindNames) {
    EXPECT_STREQ(to_string(SegmentKind::Integer), "integer");
    EXPECT_STREQ(to_string(SegmentKind::List), "list");
    EXPECT_STREQ(to_string(SegmentKind::Bitmap), "bitmap");
}
