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
#include <filesystem>
#include "../../src/persistence/disk_resource_store.h"
#include "../../src/persistence/index_rebuild.h"
#include "../../src/persistence/leases_volume.h"
#include "../../src/persistence/errors.h"
#include "test_helpers.h"

using namespace xlease::persist;
using namespace xlease::persist::test;
namespace fs = std::filesystem;

class DiskResourceStoreTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string path_;
    DiskResourceStore store_;

    void SetUp() override {
        test_dir_ = create_temp_dir("xlease_resource_store_test");
        path_ = make_leases(test_dir_, 16 * layout::kSlotSize);
    }

    void TearDown() override { fs::remove_all(test_dir_); }

    static int ReadErrorCode(LockManager& lm, const std::string& path, uint64_t offset) {
        try {
            lm.read_resource(path, offset);
        } catch (const LockManagerError& e) {
            return e.code();
        }
        return 0;
    }
};

TEST_F(DiskResourceStoreTest, WriteAndRead) {
    const uint64_t offset = layout::kUserResourceBase;
    store_.write_resource("lockspace", "resource", {{path_, offset}});
    EXPECT_EQ(store_.read_resource(path_, offset), (ResourceInfo{"lockspace", "resource"}));

    // Leader magic is big endian at the start of the slot
    EXPECT_EQ(peek(path_, offset, 4), std::string("\x06\x15\x20\x10", 4));
}

TEST_F(DiskResourceStoreTest, BlankSlotHasNoLeader) {
    EXPECT_EQ(ReadErrorCode(store_, path_, layout::kUserResourceBase), LockManager::kLeaderMagic);
}

TEST_F(DiskResourceStoreTest, Overwrite) {
    const uint64_t offset = layout::kUserResourceBase + layout::kSlotSize;
    store_.write_resource("lockspace", "first", {{path_, offset}});
    store_.write_resource("lockspace", "second", {{path_, offset}});
    EXPECT_EQ(store_.read_resource(path_, offset).resource, "second");
}

TEST_F(DiskResourceStoreTest, Invalidate) {
    const uint64_t offset = layout::kUserResourceBase;
    store_.write_resource("lockspace", "resource", {{path_, offset}});
    store_.write_resource("", "", {{path_, offset}});
    EXPECT_EQ(store_.read_resource(path_, offset), (ResourceInfo{"", ""}));
}

TEST_F(DiskResourceStoreTest, RejectsBadArguments) {
    EXPECT_THROW(store_.write_resource("lockspace", "resource", {}), LockManagerError);
    EXPECT_THROW(store_.write_resource("lockspace", "resource", {{path_, 4096}}),
                 LockManagerError);
    EXPECT_THROW(store_.write_resource(std::string(49, 'x'), "resource",
                                       {{path_, layout::kUserResourceBase}}),
                 LockManagerError);
    EXPECT_THROW(store_.read_resource(path_, 512), LockManagerError);
}

TEST_F(DiskResourceStoreTest, MissingFile) {
    EXPECT_EQ(ReadErrorCode(store_, test_dir_ + "/missing", 0), ENOENT);
}

TEST_F(DiskResourceStoreTest, ReadPastEnd) {
    EXPECT_EQ(ReadErrorCode(store_, path_, 16 * layout::kSlotSize), LockManager::kLeaderMagic);
}

TEST_F(DiskResourceStoreTest, InterruptibleIo) {
    VolumeConfig cfg;
    cfg.interruptible_io = true;
    DiskResourceStore store(cfg);
    store.write_resource("lockspace", "resource", {{path_, layout::kUserResourceBase}});
    EXPECT_EQ(store_.read_resource(path_, layout::kUserResourceBase).resource, "resource");
}

TEST_F(DiskResourceStoreTest, VolumeLifecycleOnDisk) {
    {
        DirectFile file(path_);
        format_index("lockspace", file);
        LeasesVolume vol(file, store_);
        vol.add("a");
        vol.add("b");
        vol.add("c");
        vol.remove("b");
    }

    // Throw the index away and recover it from the resource leaders
    DirectFile file(path_);
    format_index("lockspace", file);
    rebuild_index("lockspace", file, store_);

    LeasesVolume vol(file, store_);
    std::map<std::string, LeaseState> expected = {
        {"a", LeaseState{layout::kUserResourceBase, false}},
        {"c", LeaseState{layout::kUserResourceBase + 2 * layout::kSlotSize, false}},
    };
    EXPECT_EQ(vol.leases(), expected);
}

TEST(MemoryLockManagerTest, Basics) {
    MemoryLockManager lm;
    EXPECT_THROW(lm.read_resource("/path", 0), LockManagerError);
    lm.write_resource("ls", "res", {{"/path", 0}, {"/other", layout::kSlotSize}});
    EXPECT_EQ(lm.size(), 2u);
    EXPECT_EQ(lm.read_resource("/other", layout::kSlotSize), (ResourceInfo{"ls", "res"}));
    EXPECT_THROW(lm.write_resource("ls", "res", {{"/path", 512}}), LockManagerError);
    lm.clear();
    EXPECT_EQ(lm.size(), 0u);
}
