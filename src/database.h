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

#include <memory>
#include <string>
#include "binary_tree.h"
#include "errors.h"
#include "key.h"
#include "persistence/storage_config.h"
#include "persistence/storage_file.h"

namespace tsbtreedb {

    /**
     * Embedded key/value store over a single file.
     *
     * Writes are visible to this handle at once and become durable (and
     * visible to other handles) only after commit(). Once closed, every
     * operation throws ClosedHandle.
     */
    class Database {
    public:
        explicit Database(const std::string& path,
                          const persist::StorageConfig& config = persist::StorageConfig::defaults());
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        std::string get(const Key& key);
        void set(const Key& key, const std::string& value);
        void remove(const Key& key);
        void commit();
        void close();
        bool closed() const;

        std::string get_min();
        std::string get_max();
        BinaryTree::Entry get_left(const Key& key);
        BinaryTree::Entry get_right(const Key& key);
        BinaryTree::Entries chop(const Key& threshold);
        BinaryTree::Entries items();

        const std::string& path() const { return storage_.path(); }

    private:
        void assert_not_closed() const;

        persist::StorageFile storage_;
        BinaryTree tree_;
    };

    // Opens (creating if needed) the database file at path
    std::unique_ptr<Database> connect(const std::string& path,
                                      const persist::StorageConfig& config = persist::StorageConfig::defaults());

} // namespace tsbtreedb
