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
#include <fstream>
#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>
#include "persistence/platform_fs.h"
#include "test_helpers.h"

using namespace recset::persist;

class PlatformFSTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string test_file;

    void SetUp() override {
        test_dir = test::create_temp_dir("recset_platform_fs_test");
        test_file = test_dir + "/test.dat";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void CreateTestFile(size_t size) {
        std::ofstream ofs(test_file, std::ios::binary);
        std::vector<char> data(size, 'x');
        ofs.write(data.data(), size);
    }
};

TEST_F(PlatformFSTest, FileSize) {
    CreateTestFile(4096);
    auto [res, size] = PlatformFS::file_size(test_file);
    EXPECT_TRUE(res.ok);
    EXPECT_EQ(size, 4096u);

    auto missing = PlatformFS::file_size(test_dir + "/missing");
    EXPECT_FALSE(missing.first.ok);
    EXPECT_EQ(missing.first.err, ENOENT);
}

TEST_F(PlatformFSTest, FsyncFile) {
    CreateTestFile(100);
    EXPECT_TRUE(PlatformFS::fsync_file(test_file).ok);

    FSResult missing = PlatformFS::fsync_file(test_dir + "/missing");
    EXPECT_FALSE(missing.ok);
    EXPECT_EQ(missing.err, ENOENT);
}

TEST_F(PlatformFSTest, FsyncDirectory) {
    EXPECT_TRUE(PlatformFS::fsync_directory(test_dir).ok);
    EXPECT_FALSE(PlatformFS::fsync_directory(test_dir + "/missing").ok);
}

TEST_F(PlatformFSTest, AtomicReplace) {
    CreateTestFile(10);
    std::string target = test_dir + "/final.dat";
    {
        std::ofstream old(target, std::ios::binary);
        old << "old contents that are longer";
    }

    FSResult res = PlatformFS::atomic_replace(test_file, target);
    EXPECT_TRUE(res.ok);
    EXPECT_EQ(access(test_file.c_str(), F_OK), -1);
    EXPECT_EQ(PlatformFS::file_size(target).second, 10u);

    EXPECT_FALSE(PlatformFS::atomic_replace(test_dir + "/missing", target).ok);
}

TEST_F(PlatformFSTest, EnsureDirectory) {
    std::string nested = test_dir + "/a/b/c";
    EXPECT_TRUE(PlatformFS::ensure_directory(nested).ok);
    struct stat st{};
    ASSERT_EQ(stat(nested.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));

    // Existing directories are fine
    EXPECT_TRUE(PlatformFS::ensure_directory(nested).ok);

    // A regular file in the way is not
    CreateTestFile(1);
    EXPECT_FALSE(PlatformFS::ensure_directory(test_file + "/sub").ok);
}
