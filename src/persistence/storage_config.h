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
#include <cstdlib>
#include <string>
#include "config.h"

namespace tsbtreedb {
namespace persist {

/**
 * Runtime configuration for a storage file
 */
struct StorageConfig {
    // fdatasync before and after publishing a new root address
    bool sync_on_commit    = true;

    // Create the file when it does not exist yet
    bool create_if_missing = true;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StorageConfig defaults() {
        StorageConfig cfg;

        if (const char* env = std::getenv(env::kSyncOnCommit)) {
            cfg.sync_on_commit = (std::string(env) != "0");
        }

        if (const char* env = std::getenv(env::kCreateIfMissing)) {
            cfg.create_if_missing = (std::string(env) != "0");
        }

        return cfg;
    }

    /**
     * Config for scratch files: no fsync on commit
     */
    static StorageConfig no_sync() {
        StorageConfig cfg;
        cfg.sync_on_commit = false;
        return cfg;
    }

    /**
     * Open existing files only
     */
    static StorageConfig open_existing() {
        StorageConfig cfg;
        cfg.create_if_missing = false;
        return cfg;
    }
};

} // namespace persist
} // namespace tsbtreedb
