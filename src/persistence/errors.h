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

#pragma once
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace xlease {
    namespace persist {

        // Base for every failure raised by the lease index engine
        class XleaseError : public std::runtime_error {
        public:
            explicit XleaseError(const std::string& msg) : std::runtime_error(msg) {}
        };

        // Header or index region failed validation; the index must be rebuilt
        class InvalidIndex : public XleaseError {
        public:
            explicit InvalidIndex(const std::string& reason)
                : XleaseError("Invalid index: " + reason) {}
        };

        class InvalidRecord : public XleaseError {
        public:
            explicit InvalidRecord(const std::string& reason)
                : XleaseError("Invalid record: " + reason) {}
        };

        class NoSuchLease : public XleaseError {
        public:
            explicit NoSuchLease(const std::string& lease_id)
                : XleaseError("No such lease " + lease_id), lease_id_(lease_id) {}
            const std::string& lease_id() const { return lease_id_; }
        private:
            std::string lease_id_;
        };

        class LeaseExists : public XleaseError {
        public:
            explicit LeaseExists(const std::string& lease_id)
                : XleaseError("Lease exists " + lease_id), lease_id_(lease_id) {}
            const std::string& lease_id() const { return lease_id_; }
        private:
            std::string lease_id_;
        };

        // An add or remove was interrupted; the slot state is ambiguous
        class LeaseUpdating : public XleaseError {
        public:
            explicit LeaseUpdating(const std::string& lease_id)
                : XleaseError("Lease " + lease_id + " is updating"), lease_id_(lease_id) {}
            const std::string& lease_id() const { return lease_id_; }
        private:
            std::string lease_id_;
        };

        class NoSpace : public XleaseError {
        public:
            explicit NoSpace(const std::string& lease_id)
                : XleaseError("No space to add lease " + lease_id) {}
        };

        // Read or write to the backing store failed
        class IOError : public XleaseError {
        public:
            IOError(int err, const std::string& what)
                : XleaseError(what + ": " + std::strerror(err)), err_(err) {}
            int err() const { return err_; }
        private:
            int err_;
        };

        class TimeoutError : public IOError {
        public:
            explicit TimeoutError(const std::string& what) : IOError(ETIMEDOUT, what) {}
        };

        // The lock manager rejected or failed an operation
        class LockManagerError : public XleaseError {
        public:
            LockManagerError(int code, const std::string& msg)
                : XleaseError(msg + " (code=" + std::to_string(code) + ")"), code_(code) {}
            int code() const { return code_; }
        private:
            int code_;
        };

    } // namespace persist
} // namespace xlease
