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
#include "key.h"
#include "reference.hpp"

namespace tsbtreedb {

    class Node;

    // Value records hold the raw value bytes
    struct ValueCodec {
        static std::string encode(const std::string& value) { return value; }
        static std::shared_ptr<const std::string> decode(const std::string& bytes, uint64_t address);
        static void prepare(const std::string&, persist::StorageFile&) {}
    };

    // Node records: version | left address | key | value address | right address
    struct NodeCodec {
        static std::string encode(const Node& node);
        static std::shared_ptr<const Node> decode(const std::string& bytes, uint64_t address);
        static void prepare(const Node& node, persist::StorageFile& storage);
    };

    using ValueRef = Reference<std::string, ValueCodec>;
    using NodeRef = Reference<Node, NodeCodec>;
    using ValueRefPtr = std::shared_ptr<ValueRef>;
    using NodeRefPtr = std::shared_ptr<NodeRef>;

    /**
     * Immutable tree node. Children and value are shared references, so a
     * copy-on-write update only allocates the nodes on the changed path
     * and reuses every untouched subtree as is.
     */
    class Node {
    public:
        Node(NodeRefPtr left, Key key, ValueRefPtr value, NodeRefPtr right);

        const NodeRefPtr& left() const { return left_; }
        const Key& key() const { return key_; }
        const ValueRefPtr& value() const { return value_; }
        const NodeRefPtr& right() const { return right_; }

        // Copies of this node with one field replaced
        std::shared_ptr<const Node> with_left(NodeRefPtr left) const;
        std::shared_ptr<const Node> with_right(NodeRefPtr right) const;
        std::shared_ptr<const Node> with_value(ValueRefPtr value) const;

        // Stores value, left and right references, in that order
        void store_refs(persist::StorageFile& storage) const;

    private:
        NodeRefPtr left_;
        Key key_;
        ValueRefPtr value_;
        NodeRefPtr right_;
    };

    inline NodeRefPtr null_node_ref() { return std::make_shared<NodeRef>(); }

} // namespace tsbtreedb
