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
#include <memory>
#include "persistence/config.h"
#include "persistence/storage_file.h"

namespace tsbtreedb {

    /**
     * Lazily resolved, write-once pointer to a record.
     *
     * A reference is in one of three states:
     *   unresolved      address only; resolve() reads and decodes the record
     *   resolved-dirty  referent only; store() appends it and records the address
     *   resolved-clean  both
     * A reference with neither is the null reference.
     *
     * The decoded referent is cached for the lifetime of the reference and
     * the address, once assigned, never changes.
     *
     * Codec supplies:
     *   static std::string encode(const T&);
     *   static std::shared_ptr<const T> decode(const std::string& bytes, uint64_t address);
     *   static void prepare(const T&, persist::StorageFile&);   // store dependencies first
     */
    template <typename T, typename Codec>
    class Reference {
    public:
        using referent_type = T;

        Reference() = default;
        explicit Reference(uint64_t address) : address_(address) {}
        explicit Reference(std::shared_ptr<const T> referent) : referent_(std::move(referent)) {}

        Reference(const Reference&) = delete;
        Reference& operator=(const Reference&) = delete;

        uint64_t address() const { return address_; }

        bool is_null() const { return !referent_ && address_ == persist::record::kNullAddress; }
        bool is_dirty() const { return referent_ && address_ == persist::record::kNullAddress; }
        bool is_resolved() const { return static_cast<bool>(referent_); }

        // Returns the referent, reading it from storage on first use.
        // Returns nullptr for the null reference.
        std::shared_ptr<const T> resolve(persist::StorageFile& storage) {
            if (!referent_ && address_ != persist::record::kNullAddress) {
                referent_ = Codec::decode(storage.read(address_), address_);
            }
            return referent_;
        }

        // Persists a dirty referent (and, through the codec, everything it
        // depends on). No-op when already stored or null.
        uint64_t store(persist::StorageFile& storage) {
            if (referent_ && address_ == persist::record::kNullAddress) {
                Codec::prepare(*referent_, storage);
                address_ = storage.write(Codec::encode(*referent_));
            }
            return address_;
        }

    private:
        uint64_t address_ = persist::record::kNullAddress;
        std::shared_ptr<const T> referent_;
    };

} // namespace tsbtreedb
