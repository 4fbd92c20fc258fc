// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <hashdb/database.hpp>
#include <hashdb/errors.hpp>

using namespace hashdb;
using namespace hashdb::test;

namespace
{
std::pair<Fea, NodeValue> entry(uint64_t i)
{
    const auto node = make_value(i);
    return {hash_node(node), node};
}

std::vector<uint64_t> limbs(const NodeValue& node)
{
    return {node.begin(), node.end()};
}

class database : public testing::Test
{
protected:
    Config config;
    MemoryDurableStore durable;
};
}  // namespace

TEST_F(database, read_missing)
{
    Database db{config, &durable};
    NodeValue node;
    bytes data;
    EXPECT_EQ(db.read_node(Fea{1, 0, 0, 0}, node, nullptr), make_error_code(DB_KEY_NOT_FOUND));
    EXPECT_EQ(db.read_program(Fea{1, 0, 0, 0}, data, nullptr), make_error_code(DB_KEY_NOT_FOUND));

    Database memory_db{config, nullptr};
    EXPECT_EQ(memory_db.read_node(Fea{1, 0, 0, 0}, node, nullptr),
        make_error_code(DB_KEY_NOT_FOUND));
}

TEST_F(database, zero_cache_capacity)
{
    config.program_cache_capacity = 0;
    EXPECT_THROW(Database(config, &durable), std::invalid_argument);
}

TEST_F(database, durable_read_fills_cache)
{
    const auto [hash, value] = entry(1);
    durable.put_node(hash, limbs(value));

    Database db{config, &durable};
    ReadLog log;
    NodeValue node;
    ASSERT_FALSE(db.read_node(hash, node, &log));
    EXPECT_EQ(node, value);
    EXPECT_EQ(durable.reads(), 1);
    ASSERT_EQ(log.entries().size(), 1);
    EXPECT_EQ(log.entries()[0].source, ReadSource::durable);

    // The second read is served by the cache and not logged.
    ReadLog log2;
    ASSERT_FALSE(db.read_node(hash, node, &log2));
    EXPECT_EQ(durable.reads(), 1);
    EXPECT_TRUE(log2.empty());
}

TEST_F(database, read_log_include_cached)
{
    config.read_log_include_cached = true;
    Database db{config, &durable};

    const auto e = entry(1);
    db.write_nodes({&e, 1}, false, std::nullopt);

    ReadLog log{config.read_log_include_cached};
    NodeValue node;
    ASSERT_FALSE(db.read_node(e.first, node, &log));
    ASSERT_EQ(log.entries().size(), 1);
    EXPECT_EQ(log.entries()[0].source, ReadSource::memory);
}

TEST_F(database, durable_errors)
{
    const auto [hash, value] = entry(1);
    durable.put_node(hash, limbs(value));
    durable.put_node(Fea{2, 0, 0, 0}, {1, 2, 3});

    Database db{config, &durable};
    NodeValue node;
    EXPECT_EQ(db.read_node(Fea{2, 0, 0, 0}, node, nullptr), make_error_code(SMT_INVALID_DATA_SIZE));

    durable.set_fail_reads(true);
    EXPECT_EQ(db.read_node(hash, node, nullptr), make_error_code(DB_ERROR));
}

TEST_F(database, write_buffer_first)
{
    Database db{config, &durable};
    const auto e = entry(5);
    db.write_nodes({&e, 1}, true, Fea{9, 0, 0, 0});

    ReadLog log{true};
    NodeValue node;
    ASSERT_FALSE(db.read_node(e.first, node, &log));
    EXPECT_EQ(node, e.second);
    EXPECT_EQ(log.entries()[0].source, ReadSource::write_buffer);
    EXPECT_EQ(durable.reads(), 0);
    EXPECT_EQ(db.pipeline().status().pending_to_flush_nodes, 1);
}

TEST_F(database, non_persistent_not_flushed)
{
    Database db{config, &durable};
    const auto e = entry(5);
    db.write_nodes({&e, 1}, false, std::nullopt);
    db.write_program(Fea{1, 0, 0, 0}, bytes{0xfe}, false);

    EXPECT_FALSE(db.pipeline().has_open_writes());
    NodeValue node;
    EXPECT_FALSE(db.read_node(e.first, node, nullptr));
    bytes data;
    EXPECT_FALSE(db.read_program(Fea{1, 0, 0, 0}, data, nullptr));
    EXPECT_EQ(data, bytes{0xfe});
}

TEST_F(database, ack_moves_to_cache)
{
    Database db{config, &durable};
    const auto e = entry(5);
    db.write_nodes({&e, 1}, true, std::nullopt);
    db.write_program(Fea{1, 0, 0, 0}, bytes{0x01, 0x02}, true);
    const auto id = db.pipeline().flush().flush_id;

    const auto batch = expect_ok(db.pipeline().claim(id));
    ASSERT_FALSE(durable.write_batch(*batch));
    ASSERT_FALSE(db.ack_flush(id));
    EXPECT_EQ(db.pipeline().stored_flush_id(), id);

    NodeValue node;
    ASSERT_FALSE(db.read_node(e.first, node, nullptr));
    bytes data;
    ASSERT_FALSE(db.read_program(Fea{1, 0, 0, 0}, data, nullptr));
    EXPECT_EQ(durable.reads(), 0);

    // Writing the node again classifies it as an update.
    db.write_nodes({&e, 1}, true, std::nullopt);
    db.pipeline().flush();
    EXPECT_EQ(expect_ok(db.pipeline().claim(0))->nodes_update.size(), 1);
}

TEST_F(database, ack_without_durable_store)
{
    Database db{config, nullptr};
    const auto e = entry(5);
    db.write_nodes({&e, 1}, true, std::nullopt);
    const auto id = db.pipeline().flush().flush_id;

    EXPECT_EQ(db.ack_flush(id), make_error_code(INTERNAL_ERROR));
    ASSERT_NE(expect_ok(db.pipeline().claim(0)), nullptr);
    ASSERT_FALSE(db.ack_flush(id));

    NodeValue node;
    ASSERT_FALSE(db.read_node(e.first, node, nullptr));
    EXPECT_EQ(node, e.second);
}

TEST_F(database, load_nodes)
{
    Database db{config, &durable};
    const auto a = entry(1);
    const auto b = entry(2);
    ASSERT_FALSE(db.load_nodes(
        {{to_string(a.first), limbs(a.second)}, {to_string(b.first), limbs(b.second)}}, false));
    EXPECT_FALSE(db.pipeline().has_open_writes());

    NodeValue node;
    ASSERT_FALSE(db.read_node(b.first, node, nullptr));
    EXPECT_EQ(node, b.second);

    const auto c = entry(3);
    ASSERT_FALSE(db.load_nodes({{to_string(c.first), limbs(c.second)}}, true));
    EXPECT_EQ(db.pipeline().status().pending_to_flush_nodes, 1);
}

TEST_F(database, load_nodes_rejects_all_on_error)
{
    Database db{config, &durable};
    const auto a = entry(1);
    const auto b = entry(2);
    NodeValue node;

    // Content does not match the key.
    EXPECT_EQ(db.load_nodes(
                  {{to_string(a.first), limbs(a.second)}, {to_string(b.first), limbs(a.second)}},
                  false),
        make_error_code(INTERNAL_ERROR));
    EXPECT_EQ(db.read_node(a.first, node, nullptr), make_error_code(DB_KEY_NOT_FOUND));

    EXPECT_EQ(db.load_nodes({{"not a hash", limbs(a.second)}}, false),
        make_error_code(INTERNAL_ERROR));
    EXPECT_EQ(db.load_nodes({{to_string(a.first), {1, 2, 3}}}, false),
        make_error_code(SMT_INVALID_DATA_SIZE));
}

TEST_F(database, load_programs)
{
    Database db{config, &durable};
    ASSERT_FALSE(db.load_programs({{"0x01", bytes{0xaa}}, {std::string(64, 'f'), bytes{}}}, true));
    EXPECT_EQ(db.pipeline().status().pending_to_flush_programs, 2);

    bytes data;
    ASSERT_FALSE(db.read_program(Fea{1, 0, 0, 0}, data, nullptr));
    EXPECT_EQ(data, bytes{0xaa});

    EXPECT_EQ(db.load_programs({{"zz", bytes{}}}, false), make_error_code(INTERNAL_ERROR));
}
