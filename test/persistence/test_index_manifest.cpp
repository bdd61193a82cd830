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
#include <gmock/gmock.h>
#include "persistence/index_manifest.h"
#include "errors.h"
#include "test_helpers.h"
#include <filesystem>

namespace recset {
namespace persist {
namespace test {

namespace fs = std::filesystem;
using ::testing::HasSubstr;

class IndexManifestTest : public ::testing::Test {
protected:
    std::string test_dir_;

    void SetUp() override {
        test_dir_ = create_temp_dir("recset_manifest_test");
    }

    void TearDown() override {
        if (!test_dir_.empty()) {
            fs::remove_all(test_dir_);
        }
    }
};

TEST_F(IndexManifestTest, StoreAndLoad) {
    auto geometry = SegmentSize::from_records(1024, 50, 40, 2);
    {
        IndexManifest manifest(test_dir_);
        manifest.set_geometry(geometry);
        EXPECT_TRUE(manifest.add_index("colour"));
        EXPECT_TRUE(manifest.add_index("size"));
        EXPECT_FALSE(manifest.add_index("colour"));
        ASSERT_TRUE(manifest.store());
    }
    ASSERT_TRUE(fs::exists(test_dir_ + "/recset.manifest.json"));
    EXPECT_FALSE(fs::exists(test_dir_ + "/recset.manifest.json.tmp"));

    IndexManifest loaded(test_dir_);
    ASSERT_TRUE(loaded.load());
    EXPECT_EQ(loaded.version(), 1u);
    EXPECT_GT(loaded.created_unix(), 0);
    EXPECT_EQ(loaded.geometry(), geometry);
    EXPECT_EQ(loaded.indexes(), (std::vector<std::string>{"colour", "size"}));
    EXPECT_TRUE(loaded.has_index("size"));
    EXPECT_FALSE(loaded.has_index("weight"));
}

TEST_F(IndexManifestTest, JsonLayout) {
    IndexManifest manifest(test_dir_);
    manifest.set_geometry(SegmentSize::from_records(64, 8));
    manifest.add_index("k");
    ASSERT_TRUE(manifest.store());

    std::string json = read_file(manifest.get_manifest_path());
    EXPECT_THAT(json, HasSubstr("\"segment_size\": 64"));
    EXPECT_THAT(json, HasSubstr("\"offset_width\": 2"));
    EXPECT_THAT(json, HasSubstr("\"upper_conversion_limit\": 8"));
    EXPECT_THAT(json, HasSubstr("\"indexes\": ["));
}

TEST_F(IndexManifestTest, LoadMissingOrCorrupt) {
    IndexManifest manifest(test_dir_);
    EXPECT_FALSE(manifest.load());

    write_file(manifest.get_manifest_path(), "{ not json");
    EXPECT_FALSE(manifest.load());

    write_file(manifest.get_manifest_path(), "{\"version\": 1}");
    EXPECT_FALSE(manifest.load());

    write_file(manifest.get_manifest_path(),
               "{\"geometry\": {\"segment_size\": 100, \"upper_conversion_limit\": 8,"
               " \"lower_conversion_limit\": 8, \"sort_scale\": 1}}");
    EXPECT_FALSE(manifest.load());

    write_file(manifest.get_manifest_path(),
               "{\"geometry\": {\"segment_size\": 64, \"offset_width\": 4,"
               " \"upper_conversion_limit\": 8, \"lower_conversion_limit\": 8, \"sort_scale\": 1}}");
    EXPECT_FALSE(manifest.load());
}

TEST_F(IndexManifestTest, OpenCreatesThenReuses) {
    auto geometry = SegmentSize::from_records(64, 8);
    std::string dir = test_dir_ + "/dataset";

    IndexManifest created = IndexManifest::open(dir, geometry, {"a"});
    EXPECT_TRUE(fs::exists(created.get_manifest_path()));
    EXPECT_EQ(created.indexes(), (std::vector<std::string>{"a"}));

    IndexManifest reopened = IndexManifest::open(dir, geometry, {"a", "b"});
    EXPECT_EQ(reopened.created_unix(), created.created_unix());
    EXPECT_EQ(reopened.indexes(), (std::vector<std::string>{"a", "b"}));

    IndexManifest again(dir);
    ASSERT_TRUE(again.load());
    EXPECT_TRUE(again.has_index("b"));
}

TEST_F(IndexManifestTest, OpenRefusesOtherGeometry) {
    IndexManifest::open(test_dir_, SegmentSize::from_records(64, 8));
    try {
        IndexManifest::open(test_dir_, SegmentSize::from_records(128, 8));
        FAIL() << "geometry change accepted";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), HasSubstr("migration required"));
    }
    EXPECT_NO_THROW(IndexManifest::open(test_dir_, SegmentSize::from_records(64, 8)));
}

TEST_F(IndexManifestTest, OpenRefusesUnreadableManifest) {
    write_file(test_dir_ + "/recset.manifest.json", "garbage");
    EXPECT_THROW(IndexManifest::open(test_dir_, SegmentSize()), ConfigError);
}

TEST_F(IndexManifestTest, CheckCompatible) {
    IndexManifest manifest(test_dir_);
    manifest.set_geometry(SegmentSize::from_records(64, 8));
    EXPECT_NO_THROW(manifest.check_compatible(SegmentSize::from_records(64, 8)));
    EXPECT_THROW(manifest.check_compatible(SegmentSize::from_records(64, 8, 4)), ConfigError);
    EXPECT_THROW(manifest.check_compatible(SegmentSize::from_records(64, 8, 8, 2)), ConfigError);
}

} // namespace test
} // namespace persist
} // namespace recset
