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
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include "../../src/persistence/direct_file.h"
#include "../../src/persistence/errors.h"
#include "../../src/persistence/index_rebuild.h"
#include "../../src/persistence/interruptible_direct_file.h"
#include "../../src/persistence/leases_volume.h"
#include "../../src/persistence/memory_lock_manager.h"
#include "../../src/util/log.h"
#include "../../test/persistence/test_helpers.h"

using namespace xlease::persist;
using namespace xlease::persist::test;
using namespace std::chrono;
namespace fs = std::filesystem;

class LeasesVolumeBenchmark : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string path_;
    MemoryLockManager lock_manager_;

    void SetUp() override {
        xlease::initLoggingFromEnv();
        test_dir_ = create_temp_dir("xlease_bench");
        path_ = make_leases(test_dir_);
        DirectFile file(path_);
        format_index("bench", file);
    }

    void TearDown() override { fs::remove_all(test_dir_); }

    void report(const std::string& what, int count, microseconds elapsed) {
        double seconds = elapsed.count() / 1e6;
        std::cout << std::setw(28) << std::left << what << " "
                  << count << " in " << std::fixed << std::setprecision(6) << seconds
                  << " seconds (" << seconds / count << " seconds each)\n";
    }

    // Open, operate and close like a short lived client would
    template <typename File, typename Op>
    microseconds run(int count, Op op) {
        auto start = steady_clock::now();
        for (int i = 0; i < count; i++) {
            File file(path_);
            LeasesVolume vol(file, lock_manager_);
            op(vol, i);
        }
        return duration_cast<microseconds>(steady_clock::now() - start);
    }
};

TEST_F(LeasesVolumeBenchmark, Lookup) {
    const int count = 100;
    auto missing = [](LeasesVolume& vol, int) {
        EXPECT_THROW(vol.lookup(make_uuid()), NoSuchLease);
    };
    report("lookup (direct)", count, run<DirectFile>(count, missing));
    report("lookup (interruptible)", count, run<InterruptibleDirectFile>(count, missing));
}

TEST_F(LeasesVolumeBenchmark, Add) {
    const int count = 100;
    // Excludes the time to create real lock manager resources
    auto add = [](LeasesVolume& vol, int) { vol.add(make_uuid()); };
    report("add (direct)", count, run<DirectFile>(count, add));
    report("add (interruptible)", count, run<InterruptibleDirectFile>(count, add));

    DirectFile file(path_);
    LeasesVolume vol(file, lock_manager_);
    EXPECT_EQ(vol.leases().size(), size_t(2 * count));
}

TEST_F(LeasesVolumeBenchmark, Rebuild) {
    const int leases = 1000;
    {
        DirectFile file(path_);
        LeasesVolume vol(file, lock_manager_);
        for (int i = 0; i < leases; i++) {
            vol.add(make_uuid());
        }
    }
    DirectFile file(path_);
    auto start = steady_clock::now();
    rebuild_index("bench", file, lock_manager_);
    report("rebuild (1000 leases)", 1, duration_cast<microseconds>(steady_clock::now() - start));

    LeasesVolume vol(file, lock_manager_);
    EXPECT_EQ(vol.leases().size(), size_t(leases));
}
