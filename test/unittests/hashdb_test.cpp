// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <hashdb/durable_store.hpp>
#include <hashdb/hashdb.hpp>
#include <thread>

using namespace hashdb;
using namespace hashdb::test;
using namespace std::chrono_literals;

namespace
{
SetRequest set_request(const Fea& root, const Fea& key, std::string value, bool persistent = false)
{
    SetRequest req;
    req.old_root = root;
    req.key = key;
    req.value = std::move(value);
    req.persistent = persistent;
    return req;
}

GetRequest get_request(const Fea& root, const Fea& key)
{
    GetRequest req;
    req.root = root;
    req.key = key;
    return req;
}
}  // namespace

TEST(hashdb, set_get)
{
    HashDB db{Config{}};
    const auto k = random_key(1);

    const auto s = db.set(set_request({}, k, "5"));
    ASSERT_EQ(s.result, SUCCESS);
    EXPECT_EQ(s.mode, "insertNotFound");
    EXPECT_TRUE(s.is_old0);
    EXPECT_EQ(s.old_value, "0");
    EXPECT_EQ(s.new_value, "5");
    EXPECT_EQ(s.proof_hash_counter, 2);
    EXPECT_FALSE(s.new_root.is_zero());

    const auto g = db.get(get_request(s.new_root, k));
    ASSERT_EQ(g.result, SUCCESS);
    EXPECT_EQ(g.value, "5");
    EXPECT_TRUE(g.is_old0);
    EXPECT_EQ(g.root, s.new_root);

    const auto u = db.set(set_request(s.new_root, k, "0x10"));
    EXPECT_EQ(u.mode, "update");
    EXPECT_EQ(db.get(get_request(u.new_root, k)).value, "16");

    const auto d = db.set(set_request(u.new_root, k, ""));
    EXPECT_EQ(d.mode, "deleteLast");
    EXPECT_TRUE(d.new_root.is_zero());
}

TEST(hashdb, set_without_details)
{
    HashDB db{Config{}};
    const auto root = db.set(set_request({}, random_key(1), "1")).new_root;

    auto req = set_request(root, random_key(2), "2");
    req.details = false;
    const auto s = db.set(req);
    EXPECT_EQ(s.result, SUCCESS);
    EXPECT_FALSE(s.new_root.is_zero());
    EXPECT_TRUE(s.mode.empty());
    EXPECT_TRUE(s.siblings.empty());
    EXPECT_EQ(s.proof_hash_counter, 0);

    auto get_req = get_request(s.new_root, random_key(2));
    get_req.details = false;
    const auto g = db.get(get_req);
    EXPECT_EQ(g.value, "2");
    EXPECT_TRUE(g.siblings.empty());
}

TEST(hashdb, invalid_value)
{
    HashDB db{Config{}};
    for (const auto* value : {"abc", "-1", "0x1g",
             "0x10000000000000000000000000000000000000000000000000000000000000000"})
    {
        const auto s = db.set(set_request({}, random_key(1), value));
        EXPECT_EQ(s.result, INTERNAL_ERROR) << value;
        EXPECT_TRUE(s.new_root.is_zero());
    }
    EXPECT_FALSE(db.database().pipeline().has_open_writes());
}

TEST(hashdb, unknown_root)
{
    HashDB db{Config{}};
    const auto g = db.get(get_request(random_key(1), random_key(2)));
    EXPECT_EQ(g.result, DB_KEY_NOT_FOUND);
    const auto s = db.set(set_request(random_key(1), random_key(2), "1"));
    EXPECT_EQ(s.result, DB_KEY_NOT_FOUND);
}

TEST(hashdb, programs)
{
    HashDB db{Config{}};
    const Fea key{7, 0, 0, 0};
    EXPECT_EQ(db.set_program({key, bytes{0x60, 0x01}, false}).result, SUCCESS);

    const auto p = db.get_program({key});
    EXPECT_EQ(p.result, SUCCESS);
    EXPECT_EQ(p.data, (bytes{0x60, 0x01}));

    const auto missing = db.get_program({Fea{8, 0, 0, 0}});
    EXPECT_EQ(missing.result, DB_KEY_NOT_FOUND);
    EXPECT_TRUE(missing.data.empty());
}

TEST(hashdb, load_db)
{
    const auto k = random_key(1);
    const auto value = make_value(42);
    const auto leaf = make_leaf(k, hash_node(value));
    const auto root = hash_node(leaf);

    LoadDBRequest req;
    req.input_db[to_string(hash_node(value))] = std::vector<uint64_t>(value.begin(), value.end());
    req.input_db[to_string(root)] = std::vector<uint64_t>(leaf.begin(), leaf.end());

    HashDB db{Config{}};
    EXPECT_EQ(db.load_db(req).result, SUCCESS);
    EXPECT_EQ(db.get(get_request(root, k)).value, "42");

    LoadDBRequest bad;
    bad.input_db[to_string(random_key(9))] = {1, 2, 3};
    EXPECT_EQ(db.load_db(bad).result, SMT_INVALID_DATA_SIZE);
}

TEST(hashdb, load_program_db)
{
    LoadProgramDBRequest req;
    req.input_program_db["0x01"] = bytes{0xaa};
    req.input_program_db["not a hash"] = bytes{0xbb};

    HashDB db{Config{}};
    EXPECT_EQ(db.load_program_db(req).result, INTERNAL_ERROR);
    EXPECT_EQ(db.get_program({Fea{1, 0, 0, 0}}).result, DB_KEY_NOT_FOUND);

    req.input_program_db.erase("not a hash");
    EXPECT_EQ(db.load_program_db(req).result, SUCCESS);
    EXPECT_EQ(db.get_program({Fea{1, 0, 0, 0}}).data, bytes{0xaa});
}

TEST(hashdb, flush_protocol)
{
    HashDB db{Config{}};
    const auto s = db.set(set_request({}, random_key(1), "1", true));
    db.set_program({Fea{3, 0, 0, 0}, bytes{0x01}, true});

    auto status = db.get_flush_status();
    EXPECT_GT(status.pending_to_flush_nodes, 0);
    EXPECT_EQ(status.pending_to_flush_program, 1);
    EXPECT_EQ(status.last_flush_id, 0);

    const auto f = db.flush();
    EXPECT_EQ(f.result, SUCCESS);
    EXPECT_EQ(f.flush_id, 1);
    EXPECT_EQ(f.stored_flush_id, 0);

    const auto data = db.get_flush_data({0});
    ASSERT_EQ(data.result, SUCCESS);
    EXPECT_EQ(data.flush_id, 1);
    EXPECT_EQ(data.stored_flush_id, 0);
    EXPECT_EQ(data.nodes.size(), 2);
    EXPECT_TRUE(data.nodes_update.empty());
    ASSERT_EQ(data.program.size(), 1);
    EXPECT_EQ(data.program[0].value, "01");
    EXPECT_EQ(data.nodes_state_root, to_string(s.new_root));

    status = db.get_flush_status();
    EXPECT_EQ(status.storing_flush_id, 1);
    EXPECT_EQ(status.last_flush_id, 1);

    // Repeated requests return the same batch.
    const auto again = db.get_flush_data({1});
    EXPECT_EQ(again.nodes, data.nodes);
    EXPECT_EQ(again.program, data.program);

    const auto ack = db.ack_flush({1});
    EXPECT_EQ(ack.result, SUCCESS);
    EXPECT_EQ(ack.stored_flush_id, 1);

    const auto empty = db.get_flush_data({0});
    EXPECT_EQ(empty.result, SUCCESS);
    EXPECT_EQ(empty.flush_id, 0);
    EXPECT_EQ(empty.stored_flush_id, 1);
    EXPECT_EQ(db.get_flush_data({1}).result, DB_KEY_NOT_FOUND);

    // The acknowledged content is still readable.
    EXPECT_EQ(db.get(get_request(s.new_root, random_key(1))).value, "1");
    EXPECT_EQ(db.get_program({Fea{3, 0, 0, 0}}).data, bytes{0x01});
}

TEST(hashdb, ack_unclaimed)
{
    HashDB db{Config{}};
    db.set(set_request({}, random_key(1), "1", true));
    db.flush();
    EXPECT_EQ(db.ack_flush({1}).result, INTERNAL_ERROR);
    EXPECT_EQ(db.get_flush_status().stored_flush_id, 0);
}

TEST(hashdb, acknowledged_writes_survive_cache_eviction)
{
    Config config;
    config.node_cache_capacity = 1;
    HashDB db{config};

    const auto k1 = random_key(1);
    const auto k2 = random_key(2);
    const auto s1 = db.set(set_request({}, k1, "1", true));
    const auto s2 = db.set(set_request(s1.new_root, k2, "2", true));
    const auto f = db.flush();
    ASSERT_EQ(db.get_flush_data({0}).flush_id, f.flush_id);
    ASSERT_EQ(db.ack_flush({f.flush_id}).result, SUCCESS);

    // Every node of both versions is readable although the cache holds only one entry.
    EXPECT_EQ(db.get(get_request(s2.new_root, k1)).value, "1");
    EXPECT_EQ(db.get(get_request(s2.new_root, k2)).value, "2");
    EXPECT_EQ(db.get(get_request(s1.new_root, k1)).value, "1");
}

TEST(hashdb, zero_cache_capacity)
{
    Config config;
    config.node_cache_capacity = 0;
    EXPECT_THROW(HashDB{config}, std::invalid_argument);
}

TEST(hashdb, prover_id)
{
    Config config;
    config.prover_id = "prover-1";
    HashDB named{config};
    EXPECT_EQ(named.get_flush_status().prover_id, "prover-1");

    HashDB a{Config{}};
    HashDB b{Config{}};
    EXPECT_EQ(a.prover_id().size(), 36);
    EXPECT_NE(a.prover_id(), b.prover_id());
}

TEST(hashdb, flush_worker_requires_durable_store)
{
    Config config;
    config.flush_worker = true;
    EXPECT_THROW(HashDB{config}, std::invalid_argument);
}

TEST(hashdb, background_flush)
{
    Config config;
    config.flush_worker = true;
    MemoryDurableStore durable;
    HashDB db{config, &durable};

    const auto s = db.set(set_request({}, random_key(1), "1", true));
    const auto f = db.flush();

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (db.get_flush_status().stored_flush_id < f.flush_id &&
           std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);

    EXPECT_EQ(db.get_flush_status().stored_flush_id, f.flush_id);
    EXPECT_EQ(durable.state_root(), s.new_root);
}

TEST(hashdb, read_log)
{
    MemoryDurableStore durable;
    Fea root;
    {
        Config config;
        config.flush_worker = true;
        HashDB writer{config, &durable};
        root = writer.set(set_request({}, random_key(1), "1", true)).new_root;
        const auto id = writer.flush().flush_id;
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (writer.get_flush_status().stored_flush_id < id &&
               std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(1ms);
    }

    HashDB db{Config{}, &durable};
    auto req = get_request(root, random_key(1));
    req.get_db_read_log = true;
    const auto g = db.get(req);
    EXPECT_EQ(g.value, "1");
    EXPECT_EQ(g.db_read_log.size(), 2);
    EXPECT_TRUE(g.db_read_log.contains(to_string(root)));
}
