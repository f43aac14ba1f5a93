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
#include <sys/stat.h>
#include <unistd.h>
#include "persistence/platform_fs.h"
#include "persistence/aligned_buffer.h"
#include "test_helpers.h"

using namespace xlease::persist;
using namespace xlease::persist::test;

class PlatformFSTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string test_file;

    void SetUp() override {
        test_dir = create_temp_dir("xlease_platform_fs_test");
        test_file = test_dir + "/test.dat";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }
};

TEST_F(PlatformFSTest, CreateSparse) {
    FSResult res = PlatformFS::create_sparse(test_file, 64 * 1024 * 1024);
    ASSERT_TRUE(res.ok);

    auto [st, size] = PlatformFS::file_size(test_file);
    EXPECT_TRUE(st.ok);
    EXPECT_EQ(size, 64u * 1024 * 1024);

    struct stat sb{};
    ASSERT_EQ(::stat(test_file.c_str(), &sb), 0);
    EXPECT_LT(uint64_t(sb.st_blocks) * 512, 64u * 1024 * 1024);
}

TEST_F(PlatformFSTest, Preallocate) {
    FSResult res = PlatformFS::preallocate(test_file, 1024 * 1024);
    ASSERT_TRUE(res.ok);
    auto [st, size] = PlatformFS::file_size(test_file);
    EXPECT_TRUE(st.ok);
    EXPECT_EQ(size, 1024u * 1024);
}

TEST_F(PlatformFSTest, FileSizeMissing) {
    auto [st, size] = PlatformFS::file_size(test_dir + "/missing");
    EXPECT_FALSE(st.ok);
    EXPECT_EQ(st.err, ENOENT);
    EXPECT_EQ(size, 0u);
}

TEST_F(PlatformFSTest, OpenDirectMissing) {
    bool direct = false;
    auto [res, fd] = PlatformFS::open_direct(test_dir + "/missing", true, &direct);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.err, ENOENT);
    EXPECT_EQ(fd, -1);
}

TEST_F(PlatformFSTest, ReadWriteFull) {
    ASSERT_TRUE(PlatformFS::create_sparse(test_file, 4096).ok);
    bool direct = false;
    auto [res, fd] = PlatformFS::open_direct(test_file, true, &direct);
    ASSERT_TRUE(res.ok);

    AlignedBuffer out(1024);
    std::memset(out.data(), 'z', out.size());
    EXPECT_TRUE(PlatformFS::pwrite_full(fd, 512, out.data(), out.size()).ok);

    AlignedBuffer in(1024);
    auto [rres, n] = PlatformFS::pread_full(fd, 512, in.data(), in.size());
    EXPECT_TRUE(rres.ok);
    EXPECT_EQ(n, 1024u);
    EXPECT_EQ(std::memcmp(in.data(), out.data(), 1024), 0);

    // Short read at end of file
    auto [sres, short_n] = PlatformFS::pread_full(fd, 3584, in.data(), in.size());
    EXPECT_TRUE(sres.ok);
    EXPECT_EQ(short_n, 512u);

    auto [dres, dsize] = PlatformFS::device_size(fd);
    EXPECT_TRUE(dres.ok);
    EXPECT_EQ(dsize, 4096u);

    EXPECT_TRUE(PlatformFS::close(fd).ok);
}
