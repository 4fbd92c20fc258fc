// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "flush_pipeline.hpp"
#include <atomic>
#include <chrono>
#include <shared_mutex>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace hashdb
{
/// The boundary to the long-term database that receives flushed batches.
///
/// Implementations must be safe to call from many threads. Reads of a missing hash return
/// DB_KEY_NOT_FOUND; any other failure is reported as DB_ERROR. The engine never retries.
class DurableStore
{
public:
    virtual ~DurableStore() = default;

    /// Reads the raw limbs of a node. The limbs are validated by the caller.
    virtual std::error_code read_node(
        const Fea& hash, std::vector<uint64_t>& limbs, std::chrono::milliseconds timeout) = 0;

    virtual std::error_code read_program(
        const Fea& hash, bytes& data, std::chrono::milliseconds timeout) = 0;

    /// Commits all writes of the batch and its state root atomically.
    virtual std::error_code write_batch(const FlushBatch& batch) = 0;
};

/// The durable store kept in process memory.
///
/// Used by tests and by the command line tool. Failures can be injected to exercise
/// the DB_ERROR paths.
class MemoryDurableStore : public DurableStore
{
    mutable std::shared_mutex m_mutex;
    std::unordered_map<Fea, std::vector<uint64_t>> m_nodes;
    std::unordered_map<Fea, bytes> m_programs;
    Fea m_state_root;
    uint64_t m_batches_written = 0;

    std::atomic<bool> m_fail_reads = false;
    std::atomic<bool> m_fail_writes = false;
    std::atomic<uint64_t> m_reads = 0;

public:
    std::error_code read_node(const Fea& hash, std::vector<uint64_t>& limbs,
        std::chrono::milliseconds timeout) override;

    std::error_code read_program(
        const Fea& hash, bytes& data, std::chrono::milliseconds timeout) override;

    std::error_code write_batch(const FlushBatch& batch) override;

    /// Stores raw node limbs directly, bypassing any validation.
    void put_node(const Fea& hash, std::vector<uint64_t> limbs);

    void put_program(const Fea& hash, bytes data);

    void set_fail_reads(bool fail) noexcept { m_fail_reads = fail; }
    void set_fail_writes(bool fail) noexcept { m_fail_writes = fail; }

    [[nodiscard]] bool contains_node(const Fea& hash) const;
    [[nodiscard]] bool contains_program(const Fea& hash) const;
    [[nodiscard]] size_t node_count() const;
    [[nodiscard]] Fea state_root() const;
    [[nodiscard]] uint64_t batches_written() const;

    /// The number of read_node() and read_program() calls served so far.
    [[nodiscard]] uint64_t reads() const noexcept { return m_reads; }
};

}  // namespace hashdb
