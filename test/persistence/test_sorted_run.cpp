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
#include "persistence/sorted_run.h"
#include "errors.h"
#include "test_helpers.h"

using namespace recset;
using namespace recset::persist;

class SortedRunTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string run_path;

    void SetUp() override {
        test_dir = test::create_temp_dir("recset_sorted_run_test");
        run_path = test_dir + "/0.run";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void WriteSample() {
        SortedRunWriter writer(run_path);
        writer.append("alpha", 0, {{3, true}, {3, false}});
        writer.append("alpha", 7, {{65535, true}});
        writer.append(std::string("b\0z", 3), 2, {});
        writer.append("beta", 1, {{0, false}});
        writer.commit();
    }
};

TEST_F(SortedRunTest, ReadsEntriesBackInOrder) {
    WriteSample();

    SortedRunReader reader(run_path);
    RunEntry entry;
    ASSERT_TRUE(reader.next(entry));
    EXPECT_EQ(entry.index_value, "alpha");
    EXPECT_EQ(entry.segment, 0u);
    ASSERT_EQ(entry.ops.size(), 2u);
    EXPECT_EQ(entry.ops[0].offset, 3u);
    EXPECT_TRUE(entry.ops[0].insert);
    EXPECT_FALSE(entry.ops[1].insert);

    ASSERT_TRUE(reader.next(entry));
    EXPECT_EQ(entry.segment, 7u);
    EXPECT_EQ(entry.ops[0].offset, 65535u);

    ASSERT_TRUE(reader.next(entry));
    EXPECT_EQ(entry.index_value, std::string("b\0z", 3));
    EXPECT_TRUE(entry.ops.empty());

    ASSERT_TRUE(reader.next(entry));
    EXPECT_EQ(entry.index_value, "beta");
    EXPECT_FALSE(reader.next(entry));
    EXPECT_EQ(reader.entries_read(), 4u);
}

TEST_F(SortedRunTest, AppendMustAscend) {
    SortedRunWriter writer(run_path);
    writer.append("m", 4, {{1, true}});
    EXPECT_THROW(writer.append("m", 4, {{2, true}}), EncodingError);
    EXPECT_THROW(writer.append("m", 3, {{2, true}}), EncodingError);
    EXPECT_THROW(writer.append("a", 9, {{2, true}}), EncodingError);
    writer.append("m", 5, {{2, true}});
    EXPECT_EQ(writer.entries(), 2u);
}

TEST_F(SortedRunTest, UncommittedRunLeavesNoFiles) {
    {
        SortedRunWriter writer(run_path);
        writer.append("k", 0, {{1, true}});
        EXPECT_TRUE(std::filesystem::exists(run_path + ".tmp"));
    }
    EXPECT_FALSE(std::filesystem::exists(run_path));
    EXPECT_FALSE(std::filesystem::exists(run_path + ".tmp"));
}

TEST_F(SortedRunTest, EmptyRun) {
    {
        SortedRunWriter writer(run_path);
        writer.commit();
    }
    SortedRunReader reader(run_path);
    RunEntry entry;
    EXPECT_FALSE(reader.next(entry));
}

TEST_F(SortedRunTest, TruncatedRunIsRejected) {
    WriteSample();
    const std::string bytes = test::read_file(run_path);
    test::write_file(run_path, bytes.substr(0, bytes.size() - 3));

    SortedRunReader reader(run_path);
    RunEntry entry;
    EXPECT_TRUE(reader.next(entry));
    EXPECT_TRUE(reader.next(entry));
    EXPECT_TRUE(reader.next(entry));
    EXPECT_THROW(reader.next(entry), EncodingError);
}

TEST_F(SortedRunTest, BadHeaderIsRejected) {
    test::write_file(run_path, "NOPE\0\0\0\1");
    EXPECT_THROW(SortedRunReader reader(run_path), EncodingError);

    test::write_file(run_path, std::string("RSRN\0\0\0\x09", 8));
    EXPECT_THROW(SortedRunReader reader(run_path), EncodingError);

    test::write_file(run_path, "RSR");
    EXPECT_THROW(SortedRunReader reader(run_path), EncodingError);
}

TEST_F(SortedRunTest, BadChangeFlagIsRejected) {
    WriteSample();
    std::string bytes = test::read_file(run_path);
    // Flag byte of the last change in the file
    bytes.back() = 7;
    test::write_file(run_path, bytes);

    SortedRunReader reader(run_path);
    RunEntry entry;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(reader.next(entry));
    }
    EXPECT_THROW(reader.next(entry), EncodingError);
}

TEST_F(SortedRunTest, MissingRunIsStorageError) {
    EXPECT_THROW(SortedRunReader reader(test_dir + "/missing.run"), StorageError);
    EXPECT_THROW(SortedRunWriter writer(test_dir + "/no/such/dir/0.run"), StorageError);
}
