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

// xlease-tool: create, inspect and repair leases volumes

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include "../src/persistence/config.h"
#include "../src/persistence/disk_resource_store.h"
#include "../src/persistence/errors.h"
#include "../src/persistence/index_rebuild.h"
#include "../src/persistence/leases_volume.h"
#include "../src/persistence/platform_fs.h"
#include "../src/persistence/storage_config.h"
#include "../src/util/log.h"
#include "../src/util/logmanager.h"

namespace po = boost::program_options;
using namespace xlease;
using namespace xlease::persist;

namespace {

const char* kUsage =
    "Usage: xlease-tool COMMAND [LEASE_ID] --path PATH [options]\n"
    "\n"
    "Commands:\n"
    "  create    create a volume file and format its index (needs --lockspace)\n"
    "  format    write an empty index (needs --lockspace)\n"
    "  add       add LEASE_ID\n"
    "  remove    remove LEASE_ID\n"
    "  lookup    show where LEASE_ID is stored\n"
    "  list      list all leases\n"
    "  rebuild   rebuild the index from the resource area (needs --lockspace)\n"
    "  dump      print the raw index, even if it is invalid\n";

std::string require(const po::variables_map& vm, const char* name, const std::string& command) {
    if (!vm.count(name)) {
        throw po::error(command + " requires --" + name);
    }
    return vm[name].as<std::string>();
}

int cmd_create(const po::variables_map& vm, const VolumeConfig& cfg) {
    std::string path = require(vm, "path", "create");
    std::string lockspace = require(vm, "lockspace", "create");
    uint64_t size = vm["size"].as<uint64_t>();
    if (size < volume::kMinSize) {
        throw po::error("--size must be at least " + std::to_string(volume::kMinSize));
    }

    FSResult res = vm.count("preallocate") ? PlatformFS::preallocate(path, size)
                                           : PlatformFS::create_sparse(path, size);
    if (!res.ok) {
        throw IOError(res.err, "Cannot create " + path);
    }
    auto file = open_aligned_file(path, cfg);
    format_index(lockspace, *file);
    file->close();

    auto [st, actual] = PlatformFS::file_size(path);
    if (!st.ok) {
        throw IOError(st.err, "Cannot stat " + path);
    }
    std::cout << "Created " << path << " (" << actual << " bytes) for lockspace " << lockspace
              << std::endl;
    return 0;
}

void print_lease(const LeaseInfo& lease) {
    std::cout << "lockspace: " << lease.lockspace << "\n"
              << "resource:  " << lease.resource << "\n"
              << "path:      " << lease.path << "\n"
              << "offset:    " << lease.offset << std::endl;
}

int cmd_dump(AlignedFile& file) {
    IndexDump dump = dump_index(file);
    if (dump.metadata) {
        const IndexMetadata& md = *dump.metadata;
        std::cout << "version:   " << md.version << "\n"
                  << "lockspace: " << md.lockspace << "\n"
                  << "mtime:     " << md.mtime << "\n"
                  << "updating:  " << (md.updating ? "yes" : "no") << "\n";
    } else {
        std::cout << "header:    " << dump.error << "\n";
    }
    for (const auto& entry : dump.records) {
        std::cout << entry.recnum << " offset=" << entry.offset << " ";
        if (entry.record) {
            std::cout << "resource=" << entry.record->resource
                      << " modified=" << entry.record->modified
                      << " updating=" << (entry.record->updating ? "yes" : "no");
        } else {
            std::cout << "invalid: " << entry.error;
        }
        std::cout << "\n";
    }
    std::cout.flush();
    return 0;
}

int run(const std::string& command, const po::variables_map& vm, const VolumeConfig& cfg) {
    if (command == "create") {
        return cmd_create(vm, cfg);
    }

    std::string path = require(vm, "path", command);
    DiskResourceStore store(cfg);

    if (command == "format") {
        auto file = open_aligned_file(path, cfg);
        format_index(require(vm, "lockspace", command), *file);
        return 0;
    }
    if (command == "rebuild") {
        auto file = open_aligned_file(path, cfg);
        rebuild_index(require(vm, "lockspace", command), *file, store);
        return 0;
    }
    if (command == "dump") {
        auto file = open_aligned_file(path, cfg);
        return cmd_dump(*file);
    }

    LeasesVolume vol(open_aligned_file(path, cfg), store);

    if (command == "list") {
        for (const auto& [lease_id, state] : vol.leases()) {
            std::cout << lease_id << " offset=" << state.offset
                      << " updating=" << (state.updating ? "yes" : "no") << "\n";
        }
        std::cout.flush();
        return 0;
    }

    std::string lease_id = require(vm, "lease-id", command);
    if (command == "add") {
        print_lease(vol.add(lease_id));
    } else if (command == "remove") {
        vol.remove(lease_id);
    } else if (command == "lookup") {
        print_lease(vol.lookup(lease_id));
    } else {
        throw po::error("unknown command '" + command + "'");
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    VolumeConfig cfg;
    po::variables_map vm;

    po::options_description visible("Options");
    visible.add_options()
        ("help,h", "show this help")
        ("path,p", po::value<std::string>(), "leases volume (file or block device)")
        ("lockspace,l", po::value<std::string>(), "lockspace name")
        ("size", po::value<uint64_t>()->default_value(volume::kDefaultSize),
         "volume size in bytes for create")
        ("preallocate", "allocate the volume instead of creating a sparse file")
        ("interruptible", "run I/O in a worker process that can be timed out")
        ("timeout-ms", po::value<uint64_t>(), "I/O timeout for --interruptible")
        ("log-file", po::value<std::string>(), "log into DIR/xlease.log instead of stderr")
        ("log-level", po::value<std::string>(), "TRACE, DEBUG, INFO, WARNING, ERROR or SEVERE");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("lease-id", po::value<std::string>());

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("lease-id", 1);

    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("command")) {
            std::cout << kUsage << "\n" << visible << std::endl;
            return vm.count("help") ? 0 : 2;
        }

        cfg = VolumeConfig::defaults();
        if (vm.count("interruptible")) cfg.interruptible_io = true;
        if (vm.count("timeout-ms")) cfg.io_timeout_ms = vm["timeout-ms"].as<uint64_t>();
        if (vm.count("log-level")) cfg.log_level = vm["log-level"].as<std::string>();
        if (!cfg.validate()) {
            throw po::error("invalid configuration (timeout " + std::to_string(cfg.io_timeout_ms) +
                            "ms, log level '" + cfg.log_level + "')");
        }
    } catch (const po::error& e) {
        std::cerr << "xlease-tool: " << e.what() << "\n\n" << kUsage;
        return 2;
    } catch (const std::exception& e) {
        // XLEASE_IO_TIMEOUT_MS that is not a number
        std::cerr << "xlease-tool: " << e.what() << std::endl;
        return 2;
    }

    setLogLevelFromString(cfg.log_level);

    std::unique_ptr<LogManager> log_manager;
    try {
        if (vm.count("log-file")) {
            log_manager = std::make_unique<LogManager>(vm["log-file"].as<std::string>());
        }
        return run(vm["command"].as<std::string>(), vm, cfg);
    } catch (const po::error& e) {
        std::cerr << "xlease-tool: " << e.what() << "\n\n" << kUsage;
        return 2;
    } catch (const std::exception& e) {
        if (log_manager) {
            error() << vm["command"].as<std::string>() << " failed: " << e.what();
        }
        std::cerr << "xlease-tool: " << e.what() << std::endl;
        return 1;
    }
}
