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
#include <cerrno>
#include <filesystem>
#include <string>

#include "../../src/persistence/platform_fs.h"
#include "test_helpers.h"

using namespace duodb::persist;
namespace fs = std::filesystem;

class PlatformFSTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = duodb::test::create_temp_dir("duodb_platform_fs");
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::string path(const std::string& name) const {
        return (fs::path(test_dir_) / name).string();
    }

    std::string test_dir_;
};

TEST_F(PlatformFSTest, EnsureDirectoryIsIdempotent) {
    std::string dir = path("a/b/c");
    EXPECT_TRUE(PlatformFS::ensure_directory(dir).ok);
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(PlatformFS::ensure_directory(dir).ok);
}

TEST_F(PlatformFSTest, EnsureDirectoryFailsOverFile) {
    std::string file = path("plain");
    duodb::test::write_file(file, "x");
    FSResult r = PlatformFS::ensure_directory(file);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.err, 0);
}

TEST_F(PlatformFSTest, EnsureFileKeepsContent) {
    std::string file = path("data.json");
    EXPECT_TRUE(PlatformFS::ensure_file(file).ok);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_EQ(fs::file_size(file), 0u);

    duodb::test::write_file(file, "[]");
    EXPECT_TRUE(PlatformFS::ensure_file(file).ok);
    EXPECT_EQ(duodb::test::read_file(file), "[]");
}

TEST_F(PlatformFSTest, AtomicReplaceOverwritesTarget) {
    std::string tmp = path("data.json.tmp");
    std::string dst = path("data.json");
    duodb::test::write_file(dst, "old");
    duodb::test::write_file(tmp, "new");

    ASSERT_TRUE(PlatformFS::fsync_file(tmp).ok);
    FSResult r = PlatformFS::atomic_replace(tmp, dst);
    EXPECT_TRUE(r.ok) << r.err;
    EXPECT_FALSE(fs::exists(tmp));
    EXPECT_EQ(duodb::test::read_file(dst), "new");
}

TEST_F(PlatformFSTest, AtomicReplaceMissingSource) {
    FSResult r = PlatformFS::atomic_replace(path("nope.tmp"), path("data.json"));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ENOENT);
}

TEST_F(PlatformFSTest, FileSize) {
    std::string file = path("sized");
    duodb::test::write_file(file, "12345");
    auto [st, size] = PlatformFS::file_size(file);
    EXPECT_TRUE(st.ok);
    EXPECT_EQ(size, 5u);

    auto missing = PlatformFS::file_size(path("missing"));
    EXPECT_FALSE(missing.first.ok);
    EXPECT_EQ(missing.first.err, ENOENT);
}

TEST_F(PlatformFSTest, RemoveFileReportsAbsence) {
    std::string file = path("gone");
    duodb::test::write_file(file, "x");

    FSResult r = PlatformFS::remove_file(file);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.err, 0);

    r = PlatformFS::remove_file(file);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.err, ENOENT);
}

TEST_F(PlatformFSTest, FsyncMissingFileFails) {
    EXPECT_FALSE(PlatformFS::fsync_file(path("missing")).ok);
    EXPECT_TRUE(PlatformFS::fsync_directory(test_dir_).ok);
}
