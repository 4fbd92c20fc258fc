// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "node.hpp"
#include "read_log.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <variant>
#include <vector>

namespace hashdb
{
/// An insertion-ordered set of writes keyed by hash.
template <typename Value>
class WriteSet
{
    std::vector<std::pair<Fea, Value>> m_entries;
    std::unordered_map<Fea, size_t> m_index;

public:
    /// Inserts the write or replaces the value of an existing one.
    /// @return True if the hash was not in the set before.
    bool put(const Fea& hash, Value value)
    {
        if (const auto it = m_index.find(hash); it != m_index.end())
        {
            m_entries[it->second].second = std::move(value);
            return false;
        }
        m_index.emplace(hash, m_entries.size());
        m_entries.emplace_back(hash, std::move(value));
        return true;
    }

    [[nodiscard]] const Value* find(const Fea& hash) const noexcept
    {
        const auto it = m_index.find(hash);
        return it != m_index.end() ? &m_entries[it->second].second : nullptr;
    }

    [[nodiscard]] bool contains(const Fea& hash) const noexcept { return m_index.contains(hash); }
    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] auto begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_entries.end(); }
};

/// The numbered snapshot of writes handed over to the durable writer.
///
/// The contents are immutable once the batch is closed.
struct FlushBatch
{
    uint64_t flush_id = 0;

    WriteSet<NodeValue> nodes;
    WriteSet<NodeValue> nodes_update;
    WriteSet<bytes> programs;
    WriteSet<bytes> programs_update;

    /// The latest root produced by a persistent update when the batch was closed.
    Fea state_root;

    [[nodiscard]] size_t node_count() const noexcept { return nodes.size() + nodes_update.size(); }

    [[nodiscard]] size_t program_count() const noexcept
    {
        return programs.size() + programs_update.size();
    }

    [[nodiscard]] bool empty() const noexcept { return node_count() == 0 && program_count() == 0; }

    [[nodiscard]] const NodeValue* find_node(const Fea& hash) const noexcept
    {
        if (const auto* n = nodes.find(hash))
            return n;
        return nodes_update.find(hash);
    }

    [[nodiscard]] const bytes* find_program(const Fea& hash) const noexcept
    {
        if (const auto* p = programs.find(hash))
            return p;
        return programs_update.find(hash);
    }
};

enum class FlushState : uint8_t
{
    pending,  ///< Closed, waiting for the durable writer.
    storing,  ///< Claimed by the durable writer, commit in flight.
    stored,   ///< Acknowledged as committed.
};

struct StagedNode
{
    Fea hash;
    NodeValue node;

    /// The hash is known to be present in the durable store already.
    bool known_stored = false;
};

struct StagedProgram
{
    Fea hash;
    bytes data;
    bool known_stored = false;
};

struct FlushResult
{
    uint64_t flush_id = 0;
    uint64_t stored_flush_id = 0;
};

struct FlushStatus
{
    uint64_t stored_flush_id = 0;
    uint64_t storing_flush_id = 0;
    uint64_t last_flush_id = 0;
    uint64_t pending_to_flush_nodes = 0;
    uint64_t pending_to_flush_programs = 0;
    uint64_t storing_nodes = 0;
    uint64_t storing_programs = 0;
};

/// The write buffer and the queue of flush batches.
///
/// Persistent writes accumulate in the open batch. Flush() closes it under a new flush id;
/// the durable writer claims closed batches (PENDING -> STORING) and acknowledges them once
/// committed (STORING -> STORED). Every state change and every staging happens under one mutex,
/// so a write belongs to exactly one batch.
class FlushPipeline
{
    struct ClosedBatch
    {
        std::shared_ptr<const FlushBatch> batch;
        FlushState state = FlushState::pending;
    };

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::unique_ptr<FlushBatch> m_open;

    /// Closed batches not acknowledged yet, ordered by flush id.
    std::deque<ClosedBatch> m_closed;

    uint64_t m_last_flush_id = 0;
    uint64_t m_storing_flush_id = 0;
    uint64_t m_stored_flush_id = 0;
    Fea m_state_root;

    /// Close the open batch automatically once it holds this many nodes. Disabled if 0.
    const size_t m_auto_flush_threshold;

    FlushResult close_open_batch();

    [[nodiscard]] bool in_closed_batch(const Fea& hash, bool program) const noexcept;

public:
    explicit FlushPipeline(size_t auto_flush_threshold = 0);
    ~FlushPipeline() noexcept;

    FlushPipeline(const FlushPipeline&) = delete;
    FlushPipeline& operator=(const FlushPipeline&) = delete;

    /// Adds writes to the open batch in one critical section.
    ///
    /// @param state_root  The root to persist as the current state, if the writes produced one.
    void stage(std::span<const StagedNode> nodes, std::span<const StagedProgram> programs,
        const std::optional<Fea>& state_root = {});

    /// Closes the open batch and opens a new one.
    FlushResult flush();

    /// Claims a closed batch for storing. flush_id 0 selects the oldest unacknowledged batch.
    ///
    /// @return The batch, nullptr if flush_id is 0 and nothing is waiting,
    ///         or DB_KEY_NOT_FOUND for an acknowledged or unassigned flush id.
    std::variant<std::shared_ptr<const FlushBatch>, std::error_code> claim(uint64_t flush_id);

    /// Returns the batches an acknowledgement of flush_id would release, without releasing them.
    ///
    /// @return INTERNAL_ERROR if a batch up to flush_id has not been claimed.
    std::variant<std::vector<std::shared_ptr<const FlushBatch>>, std::error_code> collect_stored(
        uint64_t flush_id) const;

    /// Marks all batches up to flush_id as stored and drops them from the buffer.
    std::error_code release_stored(uint64_t flush_id);

    [[nodiscard]] std::optional<NodeValue> find_node(const Fea& hash) const;
    [[nodiscard]] std::optional<bytes> find_program(const Fea& hash) const;

    [[nodiscard]] FlushStatus status() const;

    [[nodiscard]] uint64_t stored_flush_id() const;

    /// Checks if the open batch holds any write.
    [[nodiscard]] bool has_open_writes() const;

    /// Blocks until a closed batch waits to be claimed, the timeout elapses or stop is set.
    ///
    /// @return True if a batch is waiting.
    bool wait_for_pending(std::chrono::milliseconds timeout, const std::atomic<bool>& stop);

    /// Wakes up all threads blocked in wait_for_pending().
    void notify_all();
};

}  // namespace hashdb
