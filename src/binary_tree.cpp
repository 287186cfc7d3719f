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

#include "binary_tree.h"
#include "errors.h"
#include "util/log.h"

namespace tsbtreedb {

    using namespace persist;

    BinaryTree::BinaryTree(StorageFile& storage) : storage_(storage) {
        refresh_tree_ref();
    }

    void BinaryTree::refresh_tree_ref() {
        tree_ref_ = std::make_shared<NodeRef>(storage_.get_root_address());
        trace() << "tree root refreshed to " << tree_ref_->address();
    }

    void BinaryTree::refresh_unless_locked() {
        if (!storage_.locked()) {
            refresh_tree_ref();
        }
    }

    std::shared_ptr<const Node> BinaryTree::follow_locked(const NodeRefPtr& ref) {
        return ref->resolve(storage_);
    }

    std::shared_ptr<const Node> BinaryTree::follow(const NodeRefPtr& ref) {
        std::lock_guard<std::mutex> lock(mu_);
        return follow_locked(ref);
    }

    std::string BinaryTree::follow_value(const ValueRefPtr& ref) {
        auto value = ref->resolve(storage_);
        if (!value) {
            throw MalformedRecord("node without a value");
        }
        return *value;
    }

    NodeRefPtr BinaryTree::root() const {
        std::lock_guard<std::mutex> lock(mu_);
        return tree_ref_;
    }

    std::shared_ptr<const Node> BinaryTree::find_node(const Key& key) {
        auto node = follow_locked(tree_ref_);
        while (node) {
            if (key < node->key()) {
                node = follow_locked(node->left());
            } else if (key > node->key()) {
                node = follow_locked(node->right());
            } else {
                return node;
            }
        }
        return nullptr;
    }

    std::string BinaryTree::get(const Key& key) {
        std::lock_guard<std::mutex> lock(mu_);
        refresh_unless_locked();

        auto node = find_node(key);
        if (!node) {
            throw KeyNotFound(key.to_string());
        }
        return follow_value(node->value());
    }

    void BinaryTree::set(const Key& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mu_);

        // A freshly taken lock means another writer may have committed since
        // our root was read; start from the latest committed tree.
        if (storage_.lock()) {
            refresh_tree_ref();
        }

        auto node = follow_locked(tree_ref_);
        auto value_ref = std::make_shared<ValueRef>(std::make_shared<std::string>(value));
        tree_ref_ = insert(std::move(node), key, value_ref);
    }

    NodeRefPtr BinaryTree::insert(std::shared_ptr<const Node> node, const Key& key, const ValueRefPtr& value) {
        struct Step {
            std::shared_ptr<const Node> node;
            bool went_left;
        };
        std::vector<Step> path;

        while (node) {
            if (key < node->key()) {
                path.push_back({node, true});
                node = follow_locked(node->left());
            } else if (key > node->key()) {
                path.push_back({node, false});
                node = follow_locked(node->right());
            } else {
                break;
            }
        }

        NodeRefPtr child;
        if (node) {
            child = std::make_shared<NodeRef>(node->with_value(value));
        } else {
            child = std::make_shared<NodeRef>(
                std::make_shared<Node>(null_node_ref(), key, value, null_node_ref()));
        }

        // Rebuild the path bottom-up; siblings are shared, not copied
        for (auto it = path.rbegin(); it != path.rend(); ++it) {
            child = std::make_shared<NodeRef>(it->went_left ? it->node->with_left(child)
                                                            : it->node->with_right(child));
        }
        return child;
    }

    void BinaryTree::remove(const Key& key) {
        throw UnsupportedOperation("delete " + key.to_string());
    }

    void BinaryTree::commit() {
        std::lock_guard<std::mutex> lock(mu_);

        // Every set() takes the writer lock, so without it there is nothing
        // pending and our root may be older than the published one.
        if (!storage_.locked()) {
            refresh_tree_ref();
            debug() << "nothing to commit, root stays at " << tree_ref_->address();
            return;
        }

        tree_ref_->store(storage_);
        storage_.commit_root_address(tree_ref_->address());
        debug() << "tree committed with root " << tree_ref_->address();
    }

    std::string BinaryTree::get_min() {
        std::lock_guard<std::mutex> lock(mu_);
        refresh_unless_locked();

        auto node = follow_locked(tree_ref_);
        if (!node) {
            throw KeyNotFound("<min>", "tree is empty");
        }
        while (auto next = follow_locked(node->left())) {
            node = next;
        }
        return follow_value(node->value());
    }

    std::string BinaryTree::get_max() {
        std::lock_guard<std::mutex> lock(mu_);
        refresh_unless_locked();

        auto node = follow_locked(tree_ref_);
        if (!node) {
            throw KeyNotFound("<max>", "tree is empty");
        }
        while (auto next = follow_locked(node->right())) {
            node = next;
        }
        return follow_value(node->value());
    }

    BinaryTree::Entry BinaryTree::child_entry(const Key& key, bool left) {
        std::lock_guard<std::mutex> lock(mu_);
        refresh_unless_locked();

        auto node = find_node(key);
        if (!node) {
            throw KeyNotFound(key.to_string());
        }

        auto child = follow_locked(left ? node->left() : node->right());
        if (!child) {
            throw KeyNotFound(key.to_string(), left ? "no left child" : "no right child");
        }
        return Entry(child->key(), follow_value(child->value()));
    }

    BinaryTree::Entry BinaryTree::get_left(const Key& key) {
        return child_entry(key, true);
    }

    BinaryTree::Entry BinaryTree::get_right(const Key& key) {
        return child_entry(key, false);
    }

    void BinaryTree::append_in_order(const std::shared_ptr<const Node>& start, Entries& out) {
        std::vector<std::shared_ptr<const Node>> stack;
        auto node = start;
        while (node || !stack.empty()) {
            while (node) {
                stack.push_back(node);
                node = follow_locked(node->left());
            }
            node = stack.back();
            stack.pop_back();
            out.emplace_back(node->key(), follow_value(node->value()));
            node = follow_locked(node->right());
        }
    }

    BinaryTree::Entries BinaryTree::traverse_in_order(const std::shared_ptr<const Node>& node) {
        std::lock_guard<std::mutex> lock(mu_);
        Entries out;
        append_in_order(node, out);
        return out;
    }

    BinaryTree::Entries BinaryTree::items() {
        std::lock_guard<std::mutex> lock(mu_);
        refresh_unless_locked();

        Entries out;
        append_in_order(follow_locked(tree_ref_), out);
        return out;
    }

    BinaryTree::Entries BinaryTree::chop(const Key& threshold) {
        std::lock_guard<std::mutex> lock(mu_);
        refresh_unless_locked();

        // Every right turn leaves behind a node whose key and whole left
        // subtree are <= threshold. The node where the descent stops is
        // expanded as well.
        std::vector<std::shared_ptr<const Node>> expand;
        std::shared_ptr<const Node> last;

        auto node = follow_locked(tree_ref_);
        while (node) {
            last = node;
            if (threshold < node->key()) {
                node = follow_locked(node->left());
            } else if (threshold > node->key()) {
                auto right = follow_locked(node->right());
                if (right) {
                    expand.push_back(node);
                }
                node = right;
            } else {
                node = nullptr;
            }
        }

        Entries out;
        if (!last) {
            return out;
        }
        expand.push_back(last);

        for (const auto& n : expand) {
            if (n->key() <= threshold) {
                out.emplace_back(n->key(), follow_value(n->value()));
            }
            append_in_order(follow_locked(n->left()), out);
        }
        return out;
    }

} // namespace tsbtreedb
