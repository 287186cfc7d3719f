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
#include <cstddef>

namespace tsbtreedb {
namespace persist {

// Superblock configuration
namespace superblock {
    constexpr size_t kSize = 4096;                            // One sector-aligned header
    constexpr size_t kRootAddressOffset = 0;                  // u64 big-endian root address
    constexpr size_t kRootAddressSize = 8;
}

// Record configuration
namespace record {
    constexpr size_t kLengthPrefixSize = 8;                   // u64 big-endian payload length
    constexpr uint64_t kNullAddress = 0;                      // Never a valid record address
}

// Node record layout: version | left | key | value | right
namespace node_format {
    constexpr uint8_t kVersion = 1;
    constexpr size_t kVersionSize = 1;
    constexpr size_t kAddressSize = 8;
    // Smallest node record: version, three addresses and an empty string key
    constexpr size_t kMinSize = kVersionSize + 3 * kAddressSize + 1 + 4;
}

// Key tags
namespace key_format {
    constexpr uint8_t kTagInt64 = 1;
    constexpr uint8_t kTagUInt64 = 2;
    constexpr uint8_t kTagDouble = 3;
    constexpr uint8_t kTagString = 4;
    constexpr size_t kTagSize = 1;
    constexpr size_t kNumericSize = 8;
    constexpr size_t kStringLengthSize = 4;
}

// Environment overrides read by StorageConfig::defaults()
namespace env {
    constexpr const char* kSyncOnCommit = "TSBTREEDB_SYNC_ON_COMMIT";
    constexpr const char* kCreateIfMissing = "TSBTREEDB_CREATE_IF_MISSING";
}

} // namespace persist
} // namespace tsbtreedb
