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
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <mutex>
#include <string>
#include "config.h"
#include "storage_config.h"

namespace tsbtreedb { namespace persist {

        /**
         * Single-file, append-only record store.
         *
         * Layout:
         *   [0, SUPERBLOCK_SIZE)    superblock; bytes 0..7 hold the big-endian
         *                           root address, the rest is zero
         *   [SUPERBLOCK_SIZE, EOF)  records: u64 big-endian length + payload
         *
         * Records are write-once. The root address is the only field ever
         * overwritten, and only by commit_root_address().
         *
         * Writers take an exclusive flock(2) on the file; it is held from the
         * first write until commit_root_address() or unlock(). Readers never
         * lock: read() and get_root_address() use positional reads.
         */
        class StorageFile {
        public:
            static constexpr size_t SUPERBLOCK_SIZE = superblock::kSize;

            explicit StorageFile(const std::string& path,
                                 const StorageConfig& config = StorageConfig::defaults());
            ~StorageFile();

            StorageFile(const StorageFile&) = delete;
            StorageFile& operator=(const StorageFile&) = delete;

            // Takes the exclusive writer lock, blocking until available.
            // Returns true if this call acquired it, false if already held.
            bool lock();
            void unlock();
            bool locked() const { return locked_.load(std::memory_order_acquire); }

            // Appends a length-prefixed record and returns its address.
            // Takes the writer lock and keeps it.
            uint64_t write(const std::string& data);

            std::string read(uint64_t address) const;

            // Makes every appended record durable, then publishes address as
            // the new root and releases the writer lock.
            void commit_root_address(uint64_t address);
            uint64_t get_root_address() const;

            void close();
            bool closed() const { return fd_ < 0; }

            uint64_t size() const;
            const std::string& path() const { return path_; }

        private:
            void ensure_superblock();
            bool acquire_lock();
            void release_lock();
            void check_open(const char* op) const;
            void sync(const char* what);
            void pwrite_fully(const void* buf, size_t len, uint64_t offset, const char* what);
            size_t pread_fully(void* buf, size_t len, uint64_t offset) const;

            std::string path_;
            StorageConfig config_;
            int fd_ = -1;
            std::atomic<bool> locked_{false};
            std::mutex mu_;                  // serialises write/commit/lock state
        };

    } // namespace persist
} // namespace tsbtreedb
