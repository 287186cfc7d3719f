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

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "binary_tree.h"
#include "errors.h"
#include "persistence/storage_file.h"
#include "persistence/test_helpers.h"

using namespace tsbtreedb;
using namespace tsbtreedb::persist;

class BinaryTreeTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string db_path;

    void SetUp() override {
        test_dir = test::create_temp_dir("tsbtreedb_tree_test");
        db_path = test_dir + "/tree.db";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::unique_ptr<StorageFile> open_storage() {
        return std::make_unique<StorageFile>(db_path, StorageConfig::no_sync());
    }

    static void insert_nine(BinaryTree& tree) {
        tree.set(8, "eight");
        tree.set(3, "three");
        tree.set(10, "ten");
        tree.set(1, "one");
        tree.set(6, "six");
        tree.set(14, "fourteen");
        tree.set(4, "four");
        tree.set(7, "seven");
        tree.set(13, "thirteen");
    }

    // Walks the subtree checking lo < key < hi everywhere; returns the node count
    static size_t check_ordering(BinaryTree& tree, const NodeRefPtr& ref, const Key* lo, const Key* hi) {
        auto node = tree.follow(ref);
        if (!node) {
            return 0;
        }
        if (lo) {
            EXPECT_LT(*lo, node->key());
        }
        if (hi) {
            EXPECT_LT(node->key(), *hi);
        }
        return 1 + check_ordering(tree, node->left(), lo, &node->key())
                 + check_ordering(tree, node->right(), &node->key(), hi);
    }

    static BinaryTree::Entries filtered(const BinaryTree::Entries& all, const Key& threshold) {
        BinaryTree::Entries out;
        for (const auto& e : all) {
            if (e.first <= threshold) {
                out.push_back(e);
            }
        }
        return out;
    }

    static BinaryTree::Entries sorted(BinaryTree::Entries entries) {
        std::sort(entries.begin(), entries.end(),
                  [](const BinaryTree::Entry& a, const BinaryTree::Entry& b) { return a.first < b.first; });
        return entries;
    }
};

TEST_F(BinaryTreeTest, EmptyTree) {
    auto storage = open_storage();
    BinaryTree tree(*storage);

    EXPECT_TRUE(tree.root()->is_null());
    EXPECT_THROW(tree.get(1), KeyNotFound);
    EXPECT_THROW(tree.get_min(), KeyNotFound);
    EXPECT_THROW(tree.get_max(), KeyNotFound);
    EXPECT_THROW(tree.get_left(1), KeyNotFound);
    EXPECT_TRUE(tree.items().empty());
    EXPECT_TRUE(tree.chop(100).empty());
    EXPECT_TRUE(tree.traverse_in_order(nullptr).empty());
}

TEST_F(BinaryTreeTest, WriterSeesUncommittedEdits) {
    auto storage = open_storage();
    BinaryTree tree(*storage);

    tree.set(16, "big");
    EXPECT_TRUE(storage->locked());
    EXPECT_EQ(tree.get(16), "big");
    EXPECT_TRUE(tree.root()->is_dirty());

    // Nothing published until commit
    EXPECT_EQ(storage->get_root_address(), 0u);
    tree.commit();
    EXPECT_FALSE(storage->locked());
    EXPECT_EQ(storage->get_root_address(), tree.root()->address());
    EXPECT_EQ(tree.get(16), "big");
}

TEST_F(BinaryTreeTest, MissingKeyNamesTheKey) {
    auto storage = open_storage();
    BinaryTree tree(*storage);
    tree.set(1, "one");

    try {
        tree.get("absent");
        FAIL() << "expected KeyNotFound";
    } catch (const KeyNotFound& e) {
        EXPECT_EQ(e.key(), "absent");
        EXPECT_EQ(std::string(e.what()), "Key not found: absent");
    }
}

TEST_F(BinaryTreeTest, DuplicateKeysKeepLatestValue) {
    auto storage = open_storage();
    BinaryTree tree(*storage);

    tree.set(5, "a");
    tree.set(2, "two");
    tree.set(5, "b");
    tree.commit();
    tree.set(5.0, "c");
    tree.commit();

    auto all = tree.items();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].first, Key(5));
    EXPECT_EQ(all[1].second, "c");
    EXPECT_EQ(tree.get(5u), "c");
}

TEST_F(BinaryTreeTest, OrderingInvariantHolds) {
    auto storage = open_storage();
    BinaryTree tree(*storage);

    std::vector<int> keys;
    for (int i = 0; i < 200; i++) {
        keys.push_back(i * 3 - 100);
    }
    std::mt19937 gen(42);
    std::shuffle(keys.begin(), keys.end(), gen);

    for (int k : keys) {
        tree.set(k, "v" + std::to_string(k));
    }
    EXPECT_EQ(check_ordering(tree, tree.root(), nullptr, nullptr), keys.size());

    tree.commit();
    auto storage2 = open_storage();
    BinaryTree reread(*storage2);
    EXPECT_EQ(check_ordering(reread, reread.root(), nullptr, nullptr), keys.size());

    auto all = reread.items();
    ASSERT_EQ(all.size(), keys.size());
    for (size_t i = 1; i < all.size(); i++) {
        EXPECT_LT(all[i - 1].first, all[i].first);
    }
    EXPECT_EQ(reread.get(-100), "v-100");
    EXPECT_EQ(reread.get_min(), "v-100");
    EXPECT_EQ(reread.get_max(), "v497");
}

TEST_F(BinaryTreeTest, MixedKeyKindsOrderNumbersFirst) {
    auto storage = open_storage();
    BinaryTree tree(*storage);

    tree.set("apple", "fruit");
    tree.set(2.5, "two and a half");
    tree.set(-7, "minus seven");
    tree.set(uint64_t(3), "three");
    tree.set("", "empty");
    tree.commit();

    auto all = tree.items();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all[0].second, "minus seven");
    EXPECT_EQ(all[1].second, "two and a half");
    EXPECT_EQ(all[2].second, "three");
    EXPECT_EQ(all[3].second, "empty");
    EXPECT_EQ(all[4].second, "fruit");

    EXPECT_EQ(tree.get(3), "three");
    EXPECT_EQ(tree.get(2.5f), "two and a half");
    EXPECT_EQ(tree.get_max(), "fruit");
}

TEST_F(BinaryTreeTest, SetSharesUntouchedSubtrees) {
    auto storage = open_storage();
    BinaryTree tree(*storage);
    tree.set(8, "eight");
    tree.set(3, "three");
    tree.set(10, "ten");
    tree.commit();

    tree.set(12, "twelve");
    NodeRefPtr old_root = tree.root();
    auto old_node = tree.follow(old_root);

    tree.set(9, "nine");
    NodeRefPtr new_root = tree.root();
    auto new_node = tree.follow(new_root);

    EXPECT_NE(old_root, new_root);
    EXPECT_EQ(new_node->left(), old_node->left());
    EXPECT_EQ(new_node->value(), old_node->value());
    EXPECT_NE(new_node->right(), old_node->right());

    // The committed subtree under 3 is reused, not rewritten
    EXPECT_NE(new_node->left()->address(), 0u);

    auto old_ten = tree.follow(old_node->right());
    auto new_ten = tree.follow(new_node->right());
    EXPECT_EQ(new_ten->right(), old_ten->right());
    EXPECT_NE(new_ten->left(), old_ten->left());

    // The previous version is still whole
    auto old_entries = tree.traverse_in_order(old_node);
    ASSERT_EQ(old_entries.size(), 4u);
    EXPECT_EQ(old_entries[3].first, Key(12));
    EXPECT_EQ(tree.traverse_in_order(new_node).size(), 5u);
}

TEST_F(BinaryTreeTest, CommitAppendsOnlyTheChangedPath) {
    auto storage = open_storage();
    BinaryTree tree(*storage);
    tree.set(8, "eight");
    tree.set(3, "three");
    tree.set(10, "ten");
    tree.commit();

    const uint64_t before = storage->size();
    tree.set(1, "one");
    tree.commit();

    // One value record and three node records (1, 3 and 8); 10 is reused
    const uint64_t value_record = 8 + 3;
    const uint64_t node_record = 8 + (1 + 8 + 9 + 8 + 8);
    EXPECT_EQ(storage->size() - before, value_record + 3 * node_record);

    // A commit with nothing dirty writes nothing but the root
    const uint64_t after = storage->size();
    tree.commit();
    EXPECT_EQ(storage->size(), after);
}

TEST_F(BinaryTreeTest, MinAndMax) {
    auto storage = open_storage();
    BinaryTree tree(*storage);
    insert_nine(tree);

    EXPECT_EQ(tree.get_min(), "one");
    EXPECT_EQ(tree.get_max(), "fourteen");

    tree.commit();
    tree.set(0.5, "half");
    EXPECT_EQ(tree.get_min(), "half");
}

TEST_F(BinaryTreeTest, LeftAndRightAreLiteralChildren) {
    auto storage = open_storage();
    BinaryTree tree(*storage);
    insert_nine(tree);
    tree.commit();

    EXPECT_EQ(tree.get_left(8), BinaryTree::Entry(3, "three"));
    EXPECT_EQ(tree.get_right(8), BinaryTree::Entry(10, "ten"));
    EXPECT_EQ(tree.get_left(3), BinaryTree::Entry(1, "one"));
    EXPECT_EQ(tree.get_right(3), BinaryTree::Entry(6, "six"));
    EXPECT_EQ(tree.get_left(6), BinaryTree::Entry(4, "four"));
    EXPECT_EQ(tree.get_right(6), BinaryTree::Entry(7, "seven"));
    EXPECT_EQ(tree.get_right(10), BinaryTree::Entry(14, "fourteen"));
    EXPECT_EQ(tree.get_left(14), BinaryTree::Entry(13, "thirteen"));

    // Leaves and one-sided nodes have no child on the other side
    EXPECT_THROW(tree.get_left(10), KeyNotFound);
    EXPECT_THROW(tree.get_right(7), KeyNotFound);
    EXPECT_THROW(tree.get_left(99), KeyNotFound);
}

TEST_F(BinaryTreeTest, ChopFollowsExpandPointOrder) {
    auto storage = open_storage();
    BinaryTree tree(*storage);
    insert_nine(tree);
    tree.commit();

    BinaryTree::Entries expected = {
        {3, "three"}, {1, "one"}, {6, "six"}, {4, "four"}
    };
    EXPECT_EQ(tree.chop(6), expected);
    EXPECT_EQ(tree.chop(6.1), expected);

    EXPECT_TRUE(tree.chop(0).empty());
    EXPECT_EQ(tree.chop(1), (BinaryTree::Entries{{1, "one"}}));
}

TEST_F(BinaryTreeTest, ChopMatchesFilteredScan) {
    auto storage = open_storage();
    BinaryTree tree(*storage);

    std::vector<int> keys;
    for (int i = 0; i < 60; i++) {
        keys.push_back(i * 2);
    }
    std::mt19937 gen(7);
    std::shuffle(keys.begin(), keys.end(), gen);
    for (int k : keys) {
        tree.set(k, std::to_string(k));
    }
    tree.commit();

    auto all = tree.items();
    ASSERT_EQ(all.size(), keys.size());

    std::vector<Key> thresholds = {Key(-1), Key(-0.5), Key(1000), Key(1.0e9), Key("zzz")};
    for (int k : keys) {
        thresholds.emplace_back(k);          // existing key
        thresholds.emplace_back(k + 1);      // between two keys
        thresholds.emplace_back(k - 0.25);
    }

    for (const Key& t : thresholds) {
        auto chopped = tree.chop(t);
        EXPECT_EQ(sorted(chopped), filtered(all, t)) << "threshold " << t;
    }
}

TEST_F(BinaryTreeTest, DegenerateTreeStaysUsable) {
    const int n = 2000;
    {
        auto storage = open_storage();
        BinaryTree tree(*storage);
        for (int i = 0; i < n; i++) {
            tree.set(i, std::to_string(i));
        }
        tree.commit();
    }

    auto storage = open_storage();
    BinaryTree tree(*storage);
    auto all = tree.items();
    ASSERT_EQ(all.size(), static_cast<size_t>(n));
    EXPECT_EQ(all.back().second, std::to_string(n - 1));
    EXPECT_EQ(tree.get(n - 1), std::to_string(n - 1));
    EXPECT_EQ(tree.get_max(), std::to_string(n - 1));
    EXPECT_EQ(tree.chop(n / 2).size(), static_cast<size_t>(n / 2 + 1));
}

TEST_F(BinaryTreeTest, ReaderSeesOnlyCommittedVersions) {
    auto wstorage = open_storage();
    auto rstorage = open_storage();
    BinaryTree writer(*wstorage);
    BinaryTree reader(*rstorage);

    writer.set(1, "one");
    writer.commit();
    EXPECT_EQ(reader.get(1), "one");

    writer.set(2, "two");
    EXPECT_THROW(reader.get(2), KeyNotFound);
    EXPECT_EQ(reader.items().size(), 1u);
    EXPECT_EQ(reader.get_max(), "one");

    writer.commit();
    EXPECT_EQ(reader.get(2), "two");
    EXPECT_EQ(reader.get_max(), "two");
}

TEST_F(BinaryTreeTest, NewWriterStartsFromLatestCommit) {
    auto astorage = open_storage();
    auto bstorage = open_storage();
    BinaryTree a(*astorage);
    BinaryTree b(*bstorage);

    // b reads the empty tree before a commits
    EXPECT_TRUE(b.items().empty());

    a.set(1, "from a");
    a.commit();

    b.set(2, "from b");
    b.commit();

    EXPECT_EQ(a.get(1), "from a");
    EXPECT_EQ(a.get(2), "from b");
    EXPECT_EQ(a.items().size(), 2u);
}

TEST_F(BinaryTreeTest, RemoveIsUnsupported) {
    auto storage = open_storage();
    BinaryTree tree(*storage);
    tree.set(1, "one");

    EXPECT_THROW(tree.remove(1), UnsupportedOperation);
    EXPECT_THROW(tree.remove(42), UnsupportedOperation);
    EXPECT_EQ(tree.get(1), "one");
}
