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
#include "segment_size.h"
#include "errors.h"
#include <cstdlib>

using namespace recset;

class SegmentSizeTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("RECSET_SEGMENT_SIZE_BYTES");
        unsetenv("RECSET_CONVERSION_LIMIT");
        unsetenv("RECSET_SORT_SCALE");
    }
};

TEST_F(SegmentSizeTest, Defaults) {
    SegmentSize cfg;
    EXPECT_EQ(cfg.segment_size(), 32768u);
    EXPECT_EQ(cfg.segment_size_bytes(), 4096u);
    EXPECT_EQ(cfg.offset_width(), 2u);
    EXPECT_EQ(cfg.upper_conversion_limit(), 2000u);
    EXPECT_EQ(cfg.lower_conversion_limit(), 2000u);
    EXPECT_EQ(cfg.sort_scale(), 1u);
    EXPECT_TRUE(cfg.length_inference_ok());
}

TEST_F(SegmentSizeTest, FromBytes) {
    auto cfg = SegmentSize::from_segment_size_bytes(16);
    EXPECT_EQ(cfg.segment_size(), 128u);
    // Largest list still smaller than the 16 byte bitmap
    EXPECT_EQ(cfg.upper_conversion_limit(), 7u);
    EXPECT_TRUE(cfg.length_inference_ok());
}

TEST_F(SegmentSizeTest, WideOffsets) {
    auto narrow = SegmentSize::from_records(65536, 100);
    EXPECT_EQ(narrow.offset_width(), 2u);

    auto wide = SegmentSize::from_records(65544, 100);
    EXPECT_EQ(wide.offset_width(), 4u);
}

TEST_F(SegmentSizeTest, RecordArithmetic) {
    auto cfg = SegmentSize::from_records(64, 8);
    EXPECT_EQ(cfg.segment_of(0), 0u);
    EXPECT_EQ(cfg.segment_of(63), 0u);
    EXPECT_EQ(cfg.segment_of(64), 1u);
    EXPECT_EQ(cfg.offset_of(64), 0u);
    EXPECT_EQ(cfg.offset_of(130), 2u);
    EXPECT_EQ(cfg.record_number(2, 2), 130);

    EXPECT_THROW(cfg.segment_of(-1), RangeError);
    EXPECT_THROW(cfg.offset_of(-5), RangeError);
    EXPECT_THROW(cfg.record_number(0, 64), RangeError);
}

TEST_F(SegmentSizeTest, SmallGeometryNeedsFramedTags) {
    // 64 records, lists of up to 8: a 4 entry list is as long as the bitmap
    auto cfg = SegmentSize::from_records(64, 8);
    EXPECT_EQ(cfg.upper_conversion_limit(), 8u);
    EXPECT_FALSE(cfg.length_inference_ok());
}

TEST_F(SegmentSizeTest, Validation) {
    EXPECT_THROW(SegmentSize::from_records(0), ConfigError);
    EXPECT_THROW(SegmentSize::from_records(100), ConfigError);       // not a multiple of 8
    EXPECT_THROW(SegmentSize::from_records(64, 64), ConfigError);    // list as big as the segment
    EXPECT_THROW(SegmentSize::from_records(64, 8, 9), ConfigError);  // lower above upper
    EXPECT_THROW(SegmentSize::from_records(64, 8, 0, 65), ConfigError);
    EXPECT_NO_THROW(SegmentSize::from_records(64, 8, 4, 4));
}

TEST_F(SegmentSizeTest, DeferredUpdatePoints) {
    // 4000 bytes per bitmap: one flush at the end of each segment
    auto cfg = SegmentSize::from_segment_size_bytes(4000, 2000);
    EXPECT_EQ(cfg.deferred_update_points(), (std::vector<Offset>{31999}));

    auto small = SegmentSize::from_segment_size_bytes(16);
    EXPECT_EQ(small.deferred_update_points(), (std::vector<Offset>{127}));
    EXPECT_TRUE(small.is_deferred_update_point(127));
    EXPECT_TRUE(small.is_deferred_update_point(255));
    EXPECT_FALSE(small.is_deferred_update_point(128));

    auto scaled = SegmentSize::from_records(128, 0, 0, 4);
    EXPECT_EQ(scaled.deferred_update_points(), (std::vector<Offset>{31, 63, 95, 127}));
    EXPECT_TRUE(scaled.is_deferred_update_point(128 + 63));
}

TEST_F(SegmentSizeTest, Equality) {
    auto a = SegmentSize::from_records(64, 8);
    auto b = SegmentSize::from_records(64, 8);
    auto c = SegmentSize::from_records(64, 7);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a.describe().find("segment_size=64"), std::string::npos);
}

TEST_F(SegmentSizeTest, EnvironmentOverrides) {
    setenv("RECSET_SEGMENT_SIZE_BYTES", "16", 1);
    setenv("RECSET_CONVERSION_LIMIT", "5", 1);
    setenv("RECSET_SORT_SCALE", "2", 1);
    auto cfg = SegmentSize::defaults();
    EXPECT_EQ(cfg.segment_size(), 128u);
    EXPECT_EQ(cfg.upper_conversion_limit(), 5u);
    EXPECT_EQ(cfg.sort_scale(), 2u);

    setenv("RECSET_SEGMENT_SIZE_BYTES", "lots", 1);
    EXPECT_THROW(SegmentSize::defaults(), ConfigError);
}
