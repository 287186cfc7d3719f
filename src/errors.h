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
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tsbtreedb {

    // Base class of every error raised by the storage engine
    class DatabaseError : public std::runtime_error {
    public:
        explicit DatabaseError(const std::string& what) : std::runtime_error(what) {}
    };

    // Lookup or child lookup missed
    class KeyNotFound : public DatabaseError {
    public:
        explicit KeyNotFound(const std::string& key, const std::string& detail = std::string())
            : DatabaseError("Key not found: " + key + (detail.empty() ? std::string() : " (" + detail + ")")),
              key_(key) {}

        const std::string& key() const { return key_; }

    private:
        std::string key_;
    };

    // Operation on a database that has been closed
    class ClosedHandle : public DatabaseError {
    public:
        ClosedHandle() : DatabaseError("Database closed.") {}
    };

    class UnsupportedOperation : public DatabaseError {
    public:
        explicit UnsupportedOperation(const std::string& op)
            : DatabaseError("Unsupported operation: " + op) {}
    };

    // Underlying file open/read/write/lock/sync failure
    class IOError : public DatabaseError {
    public:
        IOError(const std::string& what, int err)
            : DatabaseError(what), err_(err) {}

        int err() const { return err_; }

    private:
        int err_;
    };

    // A record decoded into structurally invalid data
    class MalformedRecord : public DatabaseError {
    public:
        MalformedRecord(const std::string& what, uint64_t address = 0)
            : DatabaseError(address ? what + " (record at " + std::to_string(address) + ")" : what),
              address_(address) {}

        uint64_t address() const { return address_; }

    private:
        uint64_t address_;
    };

} // namespace tsbtreedb
