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

#include "node.h"
#include "errors.h"
#include "util/endian.hpp"

namespace tsbtreedb {

    using namespace persist;

    Node::Node(NodeRefPtr left, Key key, ValueRefPtr value, NodeRefPtr right)
        : left_(left ? std::move(left) : null_node_ref()),
          key_(std::move(key)),
          value_(value ? std::move(value) : std::make_shared<ValueRef>()),
          right_(right ? std::move(right) : null_node_ref()) {}

    std::shared_ptr<const Node> Node::with_left(NodeRefPtr left) const {
        return std::make_shared<Node>(std::move(left), key_, value_, right_);
    }

    std::shared_ptr<const Node> Node::with_right(NodeRefPtr right) const {
        return std::make_shared<Node>(left_, key_, value_, std::move(right));
    }

    std::shared_ptr<const Node> Node::with_value(ValueRefPtr value) const {
        return std::make_shared<Node>(left_, key_, std::move(value), right_);
    }

    void Node::store_refs(StorageFile& storage) const {
        value_->store(storage);
        left_->store(storage);
        right_->store(storage);
    }

    std::shared_ptr<const std::string> ValueCodec::decode(const std::string& bytes, uint64_t) {
        return std::make_shared<std::string>(bytes);
    }

    void NodeCodec::prepare(const Node& node, StorageFile& storage) {
        node.store_refs(storage);
    }

    std::string NodeCodec::encode(const Node& node) {
        std::string out;
        out.reserve(node_format::kMinSize);

        uint8_t addr[node_format::kAddressSize];
        out.push_back(static_cast<char>(node_format::kVersion));

        util::store_be64(addr, node.left()->address());
        out.append(reinterpret_cast<const char*>(addr), sizeof(addr));

        node.key().encode(out);

        util::store_be64(addr, node.value()->address());
        out.append(reinterpret_cast<const char*>(addr), sizeof(addr));

        util::store_be64(addr, node.right()->address());
        out.append(reinterpret_cast<const char*>(addr), sizeof(addr));

        return out;
    }

    std::shared_ptr<const Node> NodeCodec::decode(const std::string& bytes, uint64_t address) {
        const uint8_t* p = reinterpret_cast<const uint8_t*>(bytes.data());
        size_t remaining = bytes.size();

        if (remaining < node_format::kMinSize) {
            throw MalformedRecord("node record too short: " + std::to_string(remaining) + " bytes", address);
        }
        if (p[0] != node_format::kVersion) {
            throw MalformedRecord("unsupported node format version " + std::to_string(static_cast<unsigned>(p[0])), address);
        }
        p += node_format::kVersionSize;
        remaining -= node_format::kVersionSize;

        const uint64_t left = util::load_be64(p);
        p += node_format::kAddressSize;
        remaining -= node_format::kAddressSize;

        size_t used = 0;
        Key key = [&]() {
            try {
                return Key::decode(p, remaining, &used);
            } catch (const MalformedRecord& e) {
                throw MalformedRecord(e.what(), address);
            }
        }();
        p += used;
        remaining -= used;

        if (remaining != 2 * node_format::kAddressSize) {
            throw MalformedRecord(remaining < 2 * node_format::kAddressSize
                                      ? "truncated node record"
                                      : "trailing bytes after node record",
                                  address);
        }

        const uint64_t value = util::load_be64(p);
        const uint64_t right = util::load_be64(p + node_format::kAddressSize);

        if (value == record::kNullAddress) {
            throw MalformedRecord("node record without a value", address);
        }

        return std::make_shared<Node>(
            left ? std::make_shared<NodeRef>(left) : null_node_ref(),
            std::move(key),
            std::make_shared<ValueRef>(value),
            right ? std::make_shared<NodeRef>(right) : null_node_ref());
    }

} // namespace tsbtreedb
