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
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "key.h"
#include "node.h"
#include "persistence/storage_file.h"

namespace tsbtreedb {

    /**
     * Copy-on-write, unbalanced binary search tree over a StorageFile.
     *
     * The tree never modifies a node. set() builds a new path from the
     * changed leaf up to a new in-memory root and shares every other
     * subtree with the previous version. Nothing reaches the file until
     * commit(), which appends the dirty path bottom-up and then publishes
     * the new root address in the superblock.
     *
     * Reads refresh the root from the superblock unless this handle holds
     * the writer lock, so a reader always sees the latest committed tree and
     * a writer keeps seeing its own uncommitted edits.
     */
    class BinaryTree {
    public:
        using Entry = std::pair<Key, std::string>;
        using Entries = std::vector<Entry>;

        explicit BinaryTree(persist::StorageFile& storage);

        BinaryTree(const BinaryTree&) = delete;
        BinaryTree& operator=(const BinaryTree&) = delete;

        std::string get(const Key& key);
        void set(const Key& key, const std::string& value);

        // Deletion is not supported; always throws UnsupportedOperation
        void remove(const Key& key);

        void commit();

        // Value of the smallest / largest key
        std::string get_min();
        std::string get_max();

        // Key and value of the immediate left / right child of the node
        // holding key. This is the literal child, not the in-order neighbour.
        Entry get_left(const Key& key);
        Entry get_right(const Key& key);

        // Every entry with key <= threshold, in expand-point order
        Entries chop(const Key& threshold);

        // In-order entries of the subtree rooted at node (empty for nullptr)
        Entries traverse_in_order(const std::shared_ptr<const Node>& node);

        // In-order entries of the whole tree
        Entries items();

        // Current root reference; holding it keeps that tree version readable
        NodeRefPtr root() const;

        // Resolves a reference against this tree's storage
        std::shared_ptr<const Node> follow(const NodeRefPtr& ref);

    private:
        void refresh_tree_ref();
        void refresh_unless_locked();
        std::shared_ptr<const Node> follow_locked(const NodeRefPtr& ref);
        std::string follow_value(const ValueRefPtr& ref);
        std::shared_ptr<const Node> find_node(const Key& key);
        Entry child_entry(const Key& key, bool left);
        NodeRefPtr insert(std::shared_ptr<const Node> node, const Key& key, const ValueRefPtr& value);
        void append_in_order(const std::shared_ptr<const Node>& node, Entries& out);

        persist::StorageFile& storage_;
        NodeRefPtr tree_ref_;
        mutable std::mutex mu_;
    };

} // namespace tsbtreedb
