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
#include <cstdio>
#include <filesystem>
#include <map>
#include "../../src/persistence/index_rebuild.h"
#include "../../src/persistence/leases_volume.h"
#include "../../src/persistence/errors.h"
#include "test_helpers.h"

using namespace xlease::persist;
using namespace xlease::persist::test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;
namespace fs = std::filesystem;

namespace {

class RecordingFile : public DirectFile {
public:
    using DirectFile::DirectFile;

    void pwrite(uint64_t offset, const void* buf, size_t len) override {
        writes.emplace_back(offset, len);
        DirectFile::pwrite(offset, buf, len);
    }

    std::vector<std::pair<uint64_t, size_t>> writes;
};

uint64_t SlotOffset(size_t slot) {
    return layout::kUserResourceBase + slot * layout::kSlotSize;
}

} // namespace

class IndexRebuildTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string path_;
    std::string lockspace_;
    NiceMock<MockLockManager> lock_manager_;

    void SetUp() override {
        test_dir_ = create_temp_dir("xlease_rebuild_test");
        lockspace_ = fs::path(test_dir_).filename().string();
        path_ = make_leases(test_dir_);
        DirectFile file(path_);
        format_index(lockspace_, file);
    }

    void TearDown() override { fs::remove_all(test_dir_); }

    void AddResource(size_t slot, const std::string& lockspace, const std::string& resource) {
        lock_manager_.store.write_resource(lockspace, resource, {{path_, SlotOffset(slot)}});
    }

    std::map<std::string, LeaseState> Leases() {
        DirectFile file(path_);
        LeasesVolume vol(file, lock_manager_);
        return vol.leases();
    }
};

TEST_F(IndexRebuildTest, RebuildEmpty) {
    for (size_t slot : {3, 4, 6}) {
        char name[8];
        std::snprintf(name, sizeof(name), "%04zu", slot);
        AddResource(slot, lockspace_, name);
    }
    // The index is empty
    EXPECT_TRUE(Leases().empty());

    {
        DirectFile file(path_);
        rebuild_index(lockspace_, file, lock_manager_);
    }

    std::map<std::string, LeaseState> expected = {
        {"0003", LeaseState{SlotOffset(3), false}},
        {"0004", LeaseState{SlotOffset(4), false}},
        {"0006", LeaseState{SlotOffset(6), false}},
    };
    EXPECT_EQ(Leases(), expected);
}

TEST_F(IndexRebuildTest, IgnoresStaleRecords) {
    {
        DirectFile file(path_);
        write_records(file, {{0, Record("stale", 0)}, {1, Record("updating", 0, true)}});
    }
    AddResource(1, lockspace_, "updating");
    AddResource(2, lockspace_, "real");

    {
        DirectFile file(path_);
        rebuild_index(lockspace_, file, lock_manager_);
    }

    std::map<std::string, LeaseState> expected = {
        {"updating", LeaseState{SlotOffset(1), false}},
        {"real", LeaseState{SlotOffset(2), false}},
    };
    EXPECT_EQ(Leases(), expected);
}

TEST_F(IndexRebuildTest, IgnoresOtherLockspacesAndRemovedResources) {
    AddResource(0, "other-lockspace", "foreign");
    AddResource(1, "", "");
    AddResource(2, lockspace_, "");
    AddResource(3, lockspace_, "mine");

    DirectFile file(path_);
    rebuild_index(lockspace_, file, lock_manager_);

    std::map<std::string, LeaseState> expected = {
        {"mine", LeaseState{SlotOffset(3), false}},
    };
    EXPECT_EQ(Leases(), expected);
}

TEST_F(IndexRebuildTest, ScansEverySlotOfTheVolume) {
    fs::resize_file(path_, layout::kUserResourceBase + 4 * layout::kSlotSize);
    DirectFile file(path_);
    EXPECT_CALL(lock_manager_, read_resource(path_, _)).Times(4);
    rebuild_index(lockspace_, file, lock_manager_);
}

TEST_F(IndexRebuildTest, HeaderUpdatingDuringScan) {
    fs::resize_file(path_, layout::kUserResourceBase + 2 * layout::kSlotSize);
    RecordingFile file(path_);
    EXPECT_CALL(lock_manager_, read_resource(path_, _))
        .Times(2)
        .WillRepeatedly([this](const std::string&, uint64_t offset) -> ResourceInfo {
            std::string header = peek(path_, layout::kIndexBase, layout::kMetadataSize);
            EXPECT_EQ(header[IndexMetadata::kUpdatingOffset], 'u');
            throw LockManagerError(LockManager::kLeaderMagic,
                                   "no resource at " + std::to_string(offset));
        });

    rebuild_index(lockspace_, file, lock_manager_, 555);

    // Header, records in one write, final header
    std::vector<std::pair<uint64_t, size_t>> expected = {
        {layout::kIndexBase, layout::kMetadataSize},
        {layout::kRecordBase, layout::kIndexSize},
        {layout::kIndexBase, layout::kMetadataSize},
    };
    EXPECT_EQ(file.writes, expected);

    LeasesVolume vol(file, lock_manager_);
    EXPECT_EQ(vol.mtime(), 555u);
    EXPECT_EQ(vol.lockspace(), lockspace_);
}

TEST_F(IndexRebuildTest, LockManagerErrorLeavesIndexInvalid) {
    AddResource(0, lockspace_, "lease");
    EXPECT_CALL(lock_manager_, read_resource(_, _)).Times(::testing::AnyNumber());
    EXPECT_CALL(lock_manager_, read_resource(path_, SlotOffset(5)))
        .WillOnce(Throw(LockManagerError(-5, "injected")))
        .WillRepeatedly(::testing::DoDefault());

    DirectFile file(path_);
    EXPECT_THROW(rebuild_index(lockspace_, file, lock_manager_), LockManagerError);
    EXPECT_THROW({ LeasesVolume vol(file, lock_manager_); }, InvalidIndex);

    // Retrying fixes the index
    rebuild_index(lockspace_, file, lock_manager_);
    EXPECT_EQ(Leases().count("lease"), 1u);
}

TEST_F(IndexRebuildTest, RepairsUpdatingHeader) {
    poke(path_, layout::kIndexBase, IndexMetadata(index::kVersion, lockspace_, 0, true).bytes());
    DirectFile file(path_);
    EXPECT_THROW({ LeasesVolume vol(file, lock_manager_); }, InvalidIndex);

    rebuild_index(lockspace_, file, lock_manager_);
    EXPECT_TRUE(Leases().empty());
}

TEST_F(IndexRebuildTest, RebuildUnformattedVolume) {
    fs::resize_file(path_, 0);
    fs::resize_file(path_, volume::kDefaultSize);
    AddResource(10, lockspace_, "lease");

    DirectFile file(path_);
    rebuild_index(lockspace_, file, lock_manager_);
    std::map<std::string, LeaseState> expected = {
        {"lease", LeaseState{SlotOffset(10), false}},
    };
    EXPECT_EQ(Leases(), expected);
}

TEST_F(IndexRebuildTest, FormatClearsIndex) {
    DirectFile file(path_);
    write_records(file, {{0, Record("a", 0)}, {100, Record("b", 0)}});
    EXPECT_EQ(Leases().size(), 2u);

    format_index(lockspace_, file, 42);
    EXPECT_TRUE(Leases().empty());

    LeasesVolume vol(file, lock_manager_);
    EXPECT_EQ(vol.mtime(), 42u);
}

TEST_F(IndexRebuildTest, InvalidLockspace) {
    DirectFile file(path_);
    EXPECT_THROW(format_index("", file), std::invalid_argument);
    EXPECT_THROW(format_index(std::string(49, 'x'), file), std::invalid_argument);
    EXPECT_THROW(rebuild_index("", file, lock_manager_), std::invalid_argument);
}

TEST_F(IndexRebuildTest, DumpIndex) {
    DirectFile file(path_);
    write_records(file, {{0, Record("a", 10)}, {5, Record("b", 20, true)}});
    poke(path_, layout::kRecordBase + 7 * layout::kRecordSize, "garbage");

    IndexDump dump = dump_index(file);
    ASSERT_TRUE(dump.metadata.has_value());
    EXPECT_EQ(dump.metadata->lockspace, lockspace_);
    EXPECT_TRUE(dump.error.empty());

    ASSERT_EQ(dump.records.size(), 3u);
    EXPECT_EQ(dump.records[0].recnum, 0u);
    EXPECT_EQ(dump.records[0].offset, SlotOffset(0));
    EXPECT_EQ(dump.records[0].record.value(), Record("a", 10));
    EXPECT_EQ(dump.records[1].recnum, 5u);
    EXPECT_EQ(dump.records[1].record.value(), Record("b", 20, true));
    EXPECT_EQ(dump.records[2].recnum, 7u);
    EXPECT_FALSE(dump.records[2].record.has_value());
    EXPECT_FALSE(dump.records[2].error.empty());
}

TEST_F(IndexRebuildTest, DumpUpdatingIndex) {
    poke(path_, layout::kIndexBase, IndexMetadata(index::kVersion, lockspace_, 7, true).bytes());
    DirectFile file(path_);
    IndexDump dump = dump_index(file);
    ASSERT_TRUE(dump.metadata.has_value());
    EXPECT_TRUE(dump.metadata->updating);
    EXPECT_EQ(dump.metadata->mtime, 7u);
}

TEST_F(IndexRebuildTest, DumpUnformattedVolume) {
    fs::resize_file(path_, 0);
    fs::resize_file(path_, volume::kDefaultSize);
    DirectFile file(path_);
    IndexDump dump = dump_index(file);
    EXPECT_FALSE(dump.metadata.has_value());
    EXPECT_FALSE(dump.error.empty());
    EXPECT_TRUE(dump.records.empty());
}
