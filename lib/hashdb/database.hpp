// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "config.hpp"
#include "durable_store.hpp"
#include "flush_pipeline.hpp"
#include "lru_cache.hpp"
#include "read_log.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hashdb
{
/// The content-addressed node store and program store.
///
/// Lookups go through the tiers in order:
/// 1. the write buffer (persistent writes not acknowledged as stored yet),
/// 2. the memory store (non-persistent writes and bulk loads),
/// 3. the LRU cache of content known to be in the durable store,
/// 4. the durable store, filling the cache on success.
class Database
{
    const Config& m_config;
    DurableStore* m_durable;
    FlushPipeline m_pipeline;

    mutable std::shared_mutex m_memory_mutex;
    std::unordered_map<Fea, NodeValue> m_memory_nodes;
    std::unordered_map<Fea, bytes> m_memory_programs;

    std::mutex m_cache_mutex;
    LRUCache<Fea, NodeValue> m_node_cache;
    LRUCache<Fea, bytes> m_program_cache;

    std::optional<NodeValue> find_memory_node(const Fea& hash) const;
    std::optional<bytes> find_memory_program(const Fea& hash) const;

public:
    /// @param config   The configuration, must outlive the database.
    /// @param durable  The durable store or null to keep everything in memory.
    Database(const Config& config, DurableStore* durable);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Reads a node.
    ///
    /// @return DB_KEY_NOT_FOUND if no tier has it, DB_ERROR if the durable store failed,
    ///         SMT_INVALID_DATA_SIZE if the durable content is malformed.
    std::error_code read_node(const Fea& hash, NodeValue& node, ReadLog* log);

    std::error_code read_program(const Fea& hash, bytes& data, ReadLog* log);

    /// Stores the nodes created by one tree update in one step.
    ///
    /// @param persistent  Stage the nodes for flushing, otherwise keep them in memory only.
    /// @param state_root  The root produced by the update, recorded as the state to persist.
    void write_nodes(std::span<const std::pair<Fea, NodeValue>> nodes, bool persistent,
        const std::optional<Fea>& state_root);

    void write_program(const Fea& hash, bytes data, bool persistent);

    /// Imports externally supplied nodes.
    ///
    /// All entries are validated first and nothing is imported if any fails.
    /// @return SMT_INVALID_DATA_SIZE for an entry with wrong layout, INTERNAL_ERROR for a key
    ///         that is not a hash string or does not match the content hash.
    std::error_code load_nodes(
        const std::map<std::string, std::vector<uint64_t>>& input, bool persistent);

    /// Imports externally supplied programs. Keys are not verified against the content.
    std::error_code load_programs(const std::map<std::string, bytes>& input, bool persistent);

    /// Handles the report of the durable writer that all batches up to flush_id are committed.
    std::error_code ack_flush(uint64_t flush_id);

    [[nodiscard]] FlushPipeline& pipeline() noexcept { return m_pipeline; }
    [[nodiscard]] DurableStore* durable() const noexcept { return m_durable; }
};

}  // namespace hashdb
