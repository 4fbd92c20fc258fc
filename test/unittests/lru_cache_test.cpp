// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <hashdb/lru_cache.hpp>
#include <hashdb/node.hpp>

using namespace hashdb;

namespace
{
const Fea A{1, 0, 0, 0};
const Fea B{2, 0, 0, 0};
const Fea C{3, 0, 0, 0};
const Fea D{4, 0, 0, 0};
}  // namespace

TEST(lru_cache, not_found)
{
    LRUCache<Fea, int> c(1);
    EXPECT_EQ(c.get(A), std::nullopt);
    EXPECT_FALSE(c.contains(A));
    EXPECT_EQ(c.size(), 0);
}

TEST(lru_cache, zero_capacity)
{
    EXPECT_THROW(LRUCache<Fea, int>(0), std::invalid_argument);
}

TEST(lru_cache, evict_capacity1)
{
    LRUCache<Fea, int> c(1);
    c.put(A, 2);
    c.put(B, 3);
    c.put(C, 4);  // the second eviction reuses the node of the first one
    EXPECT_EQ(c.get(A), std::nullopt);
    EXPECT_EQ(c.get(B), std::nullopt);
    EXPECT_EQ(c.get(C), 4);
    EXPECT_EQ(c.size(), 1);
}

TEST(lru_cache, evict_least_recently_used)
{
    LRUCache<Fea, int> c(3);
    c.put(A, 1);
    c.put(B, 2);
    c.put(C, 3);
    EXPECT_EQ(c.get(A), 1);  // B is the least recently used now.

    c.put(D, 4);
    EXPECT_EQ(c.get(B), std::nullopt);
    EXPECT_EQ(c.get(A), 1);
    EXPECT_EQ(c.get(C), 3);
    EXPECT_EQ(c.get(D), 4);
}

TEST(lru_cache, update_refreshes_access)
{
    LRUCache<Fea, int> c(2);
    c.put(A, 1);
    c.put(B, 2);
    c.put(A, 3);
    c.put(C, 4);  // evicts B
    EXPECT_EQ(c.get(A), 3);
    EXPECT_EQ(c.get(C), 4);
    EXPECT_FALSE(c.contains(B));
}

TEST(lru_cache, contains_does_not_refresh)
{
    LRUCache<Fea, int> c(2);
    c.put(A, 1);
    c.put(B, 2);
    EXPECT_TRUE(c.contains(A));
    c.put(C, 3);  // A is still the least recently used one.
    EXPECT_FALSE(c.contains(A));
    EXPECT_TRUE(c.contains(B));
}

TEST(lru_cache, node_values)
{
    LRUCache<Fea, NodeValue> c(4);
    for (uint64_t i = 1; i <= 8; ++i)
    {
        const auto node = make_value(i);
        c.put(hash_node(node), node);
    }
    EXPECT_EQ(c.size(), 4);
    EXPECT_EQ(c.capacity(), 4);
    EXPECT_FALSE(c.contains(hash_node(make_value(4))));
    EXPECT_EQ(c.get(hash_node(make_value(8))), make_value(8));

    c.clear();
    EXPECT_EQ(c.size(), 0);
    EXPECT_FALSE(c.contains(hash_node(make_value(8))));
}
