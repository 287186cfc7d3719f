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
#include <filesystem>
#include <memory>
#include <string>
#include "errors.h"
#include "node.h"
#include "persistence/storage_file.h"
#include "persistence/test_helpers.h"
#include "util/endian.hpp"

using namespace tsbtreedb;
using namespace tsbtreedb::persist;

namespace {

    ValueRefPtr dirty_value(const std::string& v) {
        return std::make_shared<ValueRef>(std::make_shared<std::string>(v));
    }

    NodeRefPtr dirty_leaf(const Key& key, const std::string& v) {
        return std::make_shared<NodeRef>(
            std::make_shared<Node>(nullptr, key, dirty_value(v), nullptr));
    }

    std::string node_record(uint8_t version, uint64_t left, const Key& key, uint64_t value, uint64_t right) {
        std::string out(1, static_cast<char>(version));
        uint8_t addr[8];
        util::store_be64(addr, left);
        out.append(reinterpret_cast<const char*>(addr), 8);
        key.encode(out);
        util::store_be64(addr, value);
        out.append(reinterpret_cast<const char*>(addr), 8);
        util::store_be64(addr, right);
        out.append(reinterpret_cast<const char*>(addr), 8);
        return out;
    }

} // namespace

class NodeTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::unique_ptr<StorageFile> storage;

    void SetUp() override {
        test_dir = test::create_temp_dir("tsbtreedb_node_test");
        storage = std::make_unique<StorageFile>(test_dir + "/nodes.db", StorageConfig::no_sync());
    }

    void TearDown() override {
        storage.reset();
        std::filesystem::remove_all(test_dir);
    }
};

TEST_F(NodeTest, NullReference) {
    ValueRef ref;
    EXPECT_TRUE(ref.is_null());
    EXPECT_FALSE(ref.is_dirty());
    EXPECT_FALSE(ref.is_resolved());
    EXPECT_EQ(ref.resolve(*storage), nullptr);

    EXPECT_EQ(ref.store(*storage), 0u);
    EXPECT_EQ(storage->size(), StorageFile::SUPERBLOCK_SIZE);
}

TEST_F(NodeTest, DirtyReferenceStoresOnce) {
    auto ref = dirty_value("payload");
    EXPECT_TRUE(ref->is_dirty());
    EXPECT_TRUE(ref->is_resolved());
    EXPECT_EQ(ref->address(), 0u);

    uint64_t addr = ref->store(*storage);
    EXPECT_EQ(addr, StorageFile::SUPERBLOCK_SIZE);
    EXPECT_FALSE(ref->is_dirty());
    EXPECT_TRUE(ref->is_resolved());

    uint64_t size = storage->size();
    EXPECT_EQ(ref->store(*storage), addr);
    EXPECT_EQ(storage->size(), size);
    EXPECT_EQ(storage->read(addr), "payload");
}

TEST_F(NodeTest, AddressReferenceResolvesLazily) {
    uint64_t addr = storage->write("stored value");

    ValueRef ref(addr);
    EXPECT_FALSE(ref.is_null());
    EXPECT_FALSE(ref.is_dirty());
    EXPECT_FALSE(ref.is_resolved());

    auto v = ref.resolve(*storage);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "stored value");
    EXPECT_TRUE(ref.is_resolved());

    // Cached: same object on the next resolve
    EXPECT_EQ(ref.resolve(*storage), v);
}

TEST_F(NodeTest, StoreWritesValueThenChildrenThenNode) {
    auto left = dirty_leaf(Key(1), "one");
    auto right = dirty_leaf(Key(9), "nine");
    auto value = dirty_value("five");
    NodeRef root(std::make_shared<Node>(left, Key(5), value, right));

    uint64_t root_addr = root.store(*storage);

    EXPECT_EQ(value->address(), StorageFile::SUPERBLOCK_SIZE);
    EXPECT_LT(value->address(), left->address());
    EXPECT_LT(left->address(), right->address());
    EXPECT_LT(right->address(), root_addr);

    // Leaves had their own values stored ahead of them
    auto leaf = left->resolve(*storage);
    EXPECT_NE(leaf->value()->address(), 0u);
    EXPECT_LT(leaf->value()->address(), left->address());
    EXPECT_TRUE(leaf->left()->is_null());
    EXPECT_TRUE(leaf->right()->is_null());
}

TEST_F(NodeTest, DecodedNodeHasUnresolvedChildren) {
    auto left = dirty_leaf(Key("a"), "A");
    NodeRef root(std::make_shared<Node>(left, Key("m"), dirty_value("M"), nullptr));
    uint64_t addr = root.store(*storage);

    NodeRef reread(addr);
    auto node = reread.resolve(*storage);
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->key(), Key("m"));
    EXPECT_EQ(node->key().kind(), Key::Kind::String);

    EXPECT_EQ(node->left()->address(), left->address());
    EXPECT_FALSE(node->left()->is_resolved());
    EXPECT_TRUE(node->right()->is_null());
    EXPECT_FALSE(node->value()->is_resolved());

    EXPECT_EQ(*node->value()->resolve(*storage), "M");
    auto child = node->left()->resolve(*storage);
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->key(), Key("a"));
    EXPECT_EQ(*child->value()->resolve(*storage), "A");
}

TEST_F(NodeTest, EncodedLayout) {
    auto value = dirty_value("v");
    value->store(*storage);
    Node node(nullptr, Key(int64_t(3)), value, std::make_shared<NodeRef>(uint64_t(8192)));

    std::string bytes = NodeCodec::encode(node);
    ASSERT_EQ(bytes.size(), 1u + 8u + 9u + 8u + 8u);

    const uint8_t* p = reinterpret_cast<const uint8_t*>(bytes.data());
    EXPECT_EQ(p[0], node_format::kVersion);
    EXPECT_EQ(util::load_be64(p + 1), 0u);
    EXPECT_EQ(p[9], key_format::kTagInt64);
    EXPECT_EQ(util::load_bei64(p + 10), 3);
    EXPECT_EQ(util::load_be64(p + 18), value->address());
    EXPECT_EQ(util::load_be64(p + 26), 8192u);
}

TEST_F(NodeTest, WithCopiesShareUntouchedFields) {
    auto left = dirty_leaf(Key(1), "one");
    auto right = dirty_leaf(Key(9), "nine");
    auto value = dirty_value("five");
    auto node = std::make_shared<Node>(left, Key(5), value, right);

    auto replaced = node->with_value(dirty_value("FIVE"));
    EXPECT_EQ(replaced->left(), left);
    EXPECT_EQ(replaced->right(), right);
    EXPECT_NE(replaced->value(), value);
    EXPECT_EQ(replaced->key(), Key(5));

    auto relinked = node->with_left(nullptr);
    EXPECT_TRUE(relinked->left()->is_null());
    EXPECT_EQ(relinked->value(), value);
    EXPECT_EQ(relinked->right(), right);

    // Original untouched
    EXPECT_EQ(node->left(), left);
    EXPECT_EQ(*node->value()->resolve(*storage), "five");
}

TEST_F(NodeTest, DecodeRejectsMalformedRecords) {
    const uint64_t at = 4242;

    EXPECT_THROW(NodeCodec::decode(std::string(10, '\0'), at), MalformedRecord);

    std::string bad_version = node_record(2, 0, Key(1), 4096, 0);
    EXPECT_THROW(NodeCodec::decode(bad_version, at), MalformedRecord);

    std::string trailing = node_record(1, 0, Key(1), 4096, 0) + "x";
    EXPECT_THROW(NodeCodec::decode(trailing, at), MalformedRecord);

    std::string good = node_record(1, 0, Key("long enough key"), 4096, 0);
    EXPECT_THROW(NodeCodec::decode(good.substr(0, good.size() - 3), at), MalformedRecord);

    std::string no_value = node_record(1, 0, Key(1), 0, 0);
    EXPECT_THROW(NodeCodec::decode(no_value, at), MalformedRecord);

    std::string bad_tag = node_record(1, 0, Key(1), 4096, 0);
    bad_tag[9] = 0x7;
    try {
        NodeCodec::decode(bad_tag, at);
        FAIL() << "expected MalformedRecord";
    } catch (const MalformedRecord& e) {
        EXPECT_EQ(e.address(), at);
    }

    EXPECT_NO_THROW(NodeCodec::decode(good, at));
    EXPECT_NO_THROW(NodeCodec::decode(node_record(1, 0, Key(""), 4096, 0), at));
}

TEST_F(NodeTest, CorruptNodeOnDiskIsMalformed) {
    NodeRef root(std::make_shared<Node>(nullptr, Key(1), dirty_value("x"), nullptr));
    uint64_t addr = root.store(*storage);

    // Overwrite the version byte just past the length prefix
    test::patch_file(test_dir + "/nodes.db", addr + 8, {0x09});

    NodeRef reread(addr);
    EXPECT_THROW(reread.resolve(*storage), MalformedRecord);
    EXPECT_FALSE(reread.is_resolved());
}
