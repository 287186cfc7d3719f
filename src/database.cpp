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

#include "database.h"
#include "util/log.h"

namespace tsbtreedb {

    Database::Database(const std::string& path, const persist::StorageConfig& config)
        : storage_(path, config), tree_(storage_) {
        info() << "database " << path << " opened, root at " << storage_.get_root_address();
    }

    Database::~Database() {
        try {
            close();
        } catch (const DatabaseError& e) {
            severe() << "closing " << storage_.path() << " failed: " << e.what();
        }
    }

    void Database::assert_not_closed() const {
        if (storage_.closed()) {
            throw ClosedHandle();
        }
    }

    bool Database::closed() const {
        return storage_.closed();
    }

    void Database::close() {
        if (storage_.closed()) {
            return;
        }
        storage_.close();
        info() << "database " << storage_.path() << " closed";
    }

    void Database::commit() {
        assert_not_closed();
        tree_.commit();
    }

    std::string Database::get(const Key& key) {
        assert_not_closed();
        return tree_.get(key);
    }

    void Database::set(const Key& key, const std::string& value) {
        assert_not_closed();
        tree_.set(key, value);
    }

    void Database::remove(const Key& key) {
        assert_not_closed();
        tree_.remove(key);
    }

    std::string Database::get_min() {
        assert_not_closed();
        return tree_.get_min();
    }

    std::string Database::get_max() {
        assert_not_closed();
        return tree_.get_max();
    }

    BinaryTree::Entry Database::get_left(const Key& key) {
        assert_not_closed();
        return tree_.get_left(key);
    }

    BinaryTree::Entry Database::get_right(const Key& key) {
        assert_not_closed();
        return tree_.get_right(key);
    }

    BinaryTree::Entries Database::chop(const Key& threshold) {
        assert_not_closed();
        return tree_.chop(threshold);
    }

    BinaryTree::Entries Database::items() {
        assert_not_closed();
        return tree_.items();
    }

    std::unique_ptr<Database> connect(const std::string& path, const persist::StorageConfig& config) {
        return std::unique_ptr<Database>(new Database(path, config));
    }

} // namespace tsbtreedb
