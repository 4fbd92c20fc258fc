// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <hashdb/errors.hpp>
#include <hashdb/node.hpp>

using namespace hashdb;

TEST(node, layout)
{
    Children children{};
    children[0] = 1;
    children[7] = 8;
    const auto internal = make_internal(children);
    EXPECT_FALSE(is_leaf(internal));
    EXPECT_EQ(get_child(internal, 0), (Fea{1, 0, 0, 0}));
    EXPECT_EQ(get_child(internal, 1), (Fea{0, 0, 0, 8}));

    const Fea rkey{1, 2, 3, 4};
    const Fea value_hash{5, 6, 7, 8};
    const auto leaf = make_leaf(rkey, value_hash);
    EXPECT_TRUE(is_leaf(leaf));
    EXPECT_EQ(leaf_rkey(leaf), rkey);
    EXPECT_EQ(leaf_value_hash(leaf), value_hash);
    EXPECT_EQ(leaf[8], 1);
    EXPECT_EQ(leaf[11], 0);
}

TEST(node, value_chunks)
{
    const auto v = (uint256{0xaabbccdd} << 224) | 0x1122334455667788;
    const auto node = make_value(v);
    EXPECT_EQ(node[0], 0x55667788);
    EXPECT_EQ(node[1], 0x11223344);
    EXPECT_EQ(node[7], 0xaabbccdd);
    EXPECT_EQ(node[8], 0);

    uint256 decoded;
    EXPECT_FALSE(decode_value(node, decoded));
    EXPECT_EQ(decoded, v);
}

TEST(node, decode_value_invalid)
{
    auto node = make_value(1);
    node[3] = uint64_t{1} << 32;
    uint256 v;
    EXPECT_EQ(decode_value(node, v), make_error_code(SMT_INVALID_DATA_SIZE));

    const auto leaf = make_leaf({}, {});
    EXPECT_EQ(decode_value(leaf, v), make_error_code(SMT_INVALID_DATA_SIZE));
}

TEST(node, decode_node)
{
    const auto leaf = make_leaf({1, 0, 0, 0}, {2, 0, 0, 0});
    NodeValue out{};
    EXPECT_FALSE(decode_node(leaf, out));
    EXPECT_EQ(out, leaf);

    const std::vector<uint64_t> short_node(11, 0);
    EXPECT_EQ(decode_node(short_node, out), make_error_code(SMT_INVALID_DATA_SIZE));

    std::vector<uint64_t> bad_capacity(leaf.begin(), leaf.end());
    bad_capacity[9] = 1;
    EXPECT_EQ(decode_node(bad_capacity, out), make_error_code(SMT_INVALID_DATA_SIZE));
}

TEST(node, hash_is_content_address)
{
    const auto a = make_value(1);
    const auto b = make_value(2);
    EXPECT_EQ(hash_node(a), hash_node(make_value(1)));
    EXPECT_NE(hash_node(a), hash_node(b));
    EXPECT_FALSE(hash_node(a).is_zero());

    // The leaf flag is part of the hashed content.
    EXPECT_NE(hash_node(make_leaf({}, {})), hash_node(NodeValue{}));
}

TEST(node, to_hex)
{
    NodeValue node{};
    node[0] = 0x1f;
    node[11] = 0xffffffffffffffff;
    const auto s = to_hex(node);
    EXPECT_EQ(s.size(), 12 * 16);
    EXPECT_EQ(s.substr(0, 16), "000000000000001f");
    EXPECT_EQ(s.substr(11 * 16), "ffffffffffffffff");
}

TEST(errors, category)
{
    EXPECT_STREQ(hashdb_category().name(), "hashdb");
    EXPECT_EQ(make_error_code(DB_KEY_NOT_FOUND).message(), "key not found in database");
    EXPECT_EQ(to_error_code({}), SUCCESS);
    EXPECT_EQ(to_error_code(make_error_code(SMT_INVALID_DATA_SIZE)), SMT_INVALID_DATA_SIZE);
    EXPECT_EQ(to_error_code(std::make_error_code(std::errc::timed_out)), DB_ERROR);
}

TEST(errors, wire_code)
{
    EXPECT_EQ(wire_code(SUCCESS), 1);
    EXPECT_EQ(wire_code(DB_KEY_NOT_FOUND), 2);
    EXPECT_EQ(wire_code(DB_ERROR), 3);
    EXPECT_EQ(wire_code(INTERNAL_ERROR), 4);
    EXPECT_EQ(wire_code(SMT_INVALID_DATA_SIZE), 14);
}
