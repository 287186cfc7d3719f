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

#include "storage_file.h"
#include "../errors.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <cerrno>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace tsbtreedb {
    namespace persist {

        namespace {
            [[noreturn]] void throw_io(const std::string& what, const std::string& path, int e) {
                std::string msg = what + " " + path + ": " + errnoWithDescription(e);
                error() << msg;
                throw IOError(msg, e);
            }
        }

        StorageFile::StorageFile(const std::string& path, const StorageConfig& config)
            : path_(path), config_(config) {
            // Open with O_CLOEXEC to prevent FD leaks to child processes
            int flags = O_RDWR;
            if (config_.create_if_missing) flags |= O_CREAT;
#ifdef O_CLOEXEC
            flags |= O_CLOEXEC;
#endif

            fd_ = ::open(path_.c_str(), flags, 0644);
            if (fd_ < 0) {
                throw_io("Failed to open file", path_, errno);
            }

            try {
                ensure_superblock();
            } catch (...) {
                ::close(fd_);
                fd_ = -1;
                throw;
            }

            debug() << "opened storage file " << path_ << " (" << size() << " bytes)";
        }

        StorageFile::~StorageFile() {
            try {
                close();
            } catch (const DatabaseError& e) {
                severe() << "failed to close " << path_ << ": " << e.what();
            }
        }

        void StorageFile::ensure_superblock() {
            // Only a short file needs the lock; an initialised file is never
            // rewritten here, so readers can open while a writer holds it.
            if (size() >= SUPERBLOCK_SIZE) {
                return;
            }

            std::lock_guard<std::mutex> lock(mu_);
            acquire_lock();

            const uint64_t end = size();
            if (end < SUPERBLOCK_SIZE) {
                std::vector<uint8_t> zeros(SUPERBLOCK_SIZE - end, 0);
                pwrite_fully(zeros.data(), zeros.size(), end, "Failed to initialise superblock of");
                if (config_.sync_on_commit) {
                    sync("superblock");
                }
                info() << "initialised superblock of " << path_;
            }

            release_lock();
        }

        bool StorageFile::acquire_lock() {
            if (locked_.load(std::memory_order_acquire)) {
                return false;
            }

            int rc;
            do {
                rc = ::flock(fd_, LOCK_EX);
            } while (rc != 0 && errno == EINTR);
            if (rc != 0) {
                throw_io("Failed to lock", path_, errno);
            }

            locked_.store(true, std::memory_order_release);
            trace() << "locked " << path_;
            return true;
        }

        void StorageFile::release_lock() {
            if (!locked_.load(std::memory_order_acquire)) {
                return;
            }

            if (::flock(fd_, LOCK_UN) != 0) {
                throw_io("Failed to unlock", path_, errno);
            }

            locked_.store(false, std::memory_order_release);
            trace() << "unlocked " << path_;
        }

        bool StorageFile::lock() {
            std::lock_guard<std::mutex> lock(mu_);
            check_open("lock");
            return acquire_lock();
        }

        void StorageFile::unlock() {
            std::lock_guard<std::mutex> lock(mu_);
            check_open("unlock");
            release_lock();
        }

        uint64_t StorageFile::write(const std::string& data) {
            std::lock_guard<std::mutex> lock(mu_);
            check_open("write");
            acquire_lock();

            off_t end = ::lseek(fd_, 0, SEEK_END);
            if (end < 0) {
                throw_io("Failed to seek to end of", path_, errno);
            }
            const uint64_t address = static_cast<uint64_t>(end);

            std::string rec(record::kLengthPrefixSize, '\0');
            util::store_be64(reinterpret_cast<uint8_t*>(&rec[0]), data.size());
            rec.append(data);

            pwrite_fully(rec.data(), rec.size(), address, "Failed to append record to");
            return address;
        }

        std::string StorageFile::read(uint64_t address) const {
            check_open("read");

            if (address < SUPERBLOCK_SIZE) {
                throw MalformedRecord("record address inside superblock", address);
            }

            uint8_t prefix[record::kLengthPrefixSize];
            if (pread_fully(prefix, sizeof(prefix), address) != sizeof(prefix)) {
                throw MalformedRecord("truncated record length prefix", address);
            }

            const uint64_t length = util::load_be64(prefix);
            const uint64_t file_size = size();
            const uint64_t payload_at = address + record::kLengthPrefixSize;
            if (payload_at > file_size || length > file_size - payload_at) {
                throw MalformedRecord("record extends past end of file", address);
            }

            std::string data(static_cast<size_t>(length), '\0');
            if (length > 0 && pread_fully(&data[0], data.size(), payload_at) != data.size()) {
                throw MalformedRecord("truncated record payload", address);
            }
            return data;
        }

        void StorageFile::commit_root_address(uint64_t address) {
            std::lock_guard<std::mutex> lock(mu_);
            check_open("commit");
            acquire_lock();

            // Records must be on disk before anything points at them
            if (config_.sync_on_commit) {
                sync("records");
            }

            uint8_t buf[superblock::kRootAddressSize];
            util::store_be64(buf, address);
            pwrite_fully(buf, sizeof(buf), superblock::kRootAddressOffset, "Failed to write root address of");

            if (config_.sync_on_commit) {
                sync("root address");
            }

            release_lock();
            debug() << "committed root " << address << " to " << path_;
        }

        uint64_t StorageFile::get_root_address() const {
            check_open("read root address of");

            uint8_t buf[superblock::kRootAddressSize];
            if (pread_fully(buf, sizeof(buf), superblock::kRootAddressOffset) != sizeof(buf)) {
                throw MalformedRecord("truncated superblock in " + path_);
            }
            return util::load_be64(buf);
        }

        void StorageFile::close() {
            std::lock_guard<std::mutex> lock(mu_);
            if (fd_ < 0) {
                return;
            }

            if (locked_.load(std::memory_order_acquire)) {
                // close(2) drops the flock as well, so a failed unlock is not fatal
                if (::flock(fd_, LOCK_UN) != 0) {
                    warning() << "unlock before close failed for " << path_ << ": " << errnoWithDescription();
                }
                locked_.store(false, std::memory_order_release);
            }

            int fd = fd_;
            fd_ = -1;
            if (::close(fd) != 0) {
                throw_io("Failed to close", path_, errno);
            }
            debug() << "closed storage file " << path_;
        }

        uint64_t StorageFile::size() const {
            struct stat st;
            if (::fstat(fd_, &st) != 0) {
                throw_io("Failed to stat", path_, errno);
            }
            return static_cast<uint64_t>(st.st_size);
        }

        void StorageFile::check_open(const char* op) const {
            if (fd_ < 0) {
                throw IOError(std::string("Cannot ") + op + " " + path_ + ": file is closed", EBADF);
            }
        }

        void StorageFile::sync(const char* what) {
            if (::fdatasync(fd_) != 0) {
                throw_io(std::string("Failed to sync ") + what + " of", path_, errno);
            }
        }

        void StorageFile::pwrite_fully(const void* buf, size_t len, uint64_t offset, const char* what) {
            const char* p = static_cast<const char*>(buf);
            while (len > 0) {
                ssize_t n = ::pwrite(fd_, p, len, static_cast<off_t>(offset));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    throw_io(what, path_, errno);
                }
                p += n;
                len -= static_cast<size_t>(n);
                offset += static_cast<uint64_t>(n);
            }
        }

        size_t StorageFile::pread_fully(void* buf, size_t len, uint64_t offset) const {
            char* p = static_cast<char*>(buf);
            size_t total = 0;
            while (total < len) {
                ssize_t n = ::pread(fd_, p + total, len - total, static_cast<off_t>(offset + total));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    throw_io("Failed to read", path_, errno);
                }
                if (n == 0) {
                    break; // EOF
                }
                total += static_cast<size_t>(n);
            }
            return total;
        }

    } // namespace persist
} // namespace tsbtreedb
