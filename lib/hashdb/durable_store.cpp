// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "durable_store.hpp"
#include "errors.hpp"
#include <mutex>

namespace hashdb
{
std::error_code MemoryDurableStore::read_node(
    const Fea& hash, std::vector<uint64_t>& limbs, std::chrono::milliseconds /*timeout*/)
{
    ++m_reads;
    if (m_fail_reads)
        return make_error_code(DB_ERROR);

    std::shared_lock lock{m_mutex};
    const auto it = m_nodes.find(hash);
    if (it == m_nodes.end())
        return make_error_code(DB_KEY_NOT_FOUND);
    limbs = it->second;
    return {};
}

std::error_code MemoryDurableStore::read_program(
    const Fea& hash, bytes& data, std::chrono::milliseconds /*timeout*/)
{
    ++m_reads;
    if (m_fail_reads)
        return make_error_code(DB_ERROR);

    std::shared_lock lock{m_mutex};
    const auto it = m_programs.find(hash);
    if (it == m_programs.end())
        return make_error_code(DB_KEY_NOT_FOUND);
    data = it->second;
    return {};
}

std::error_code MemoryDurableStore::write_batch(const FlushBatch& batch)
{
    if (m_fail_writes)
        return make_error_code(DB_ERROR);

    std::unique_lock lock{m_mutex};
    for (const auto* set : {&batch.nodes, &batch.nodes_update})
    {
        for (const auto& [hash, node] : *set)
            m_nodes.insert_or_assign(hash, std::vector<uint64_t>(node.begin(), node.end()));
    }
    for (const auto* set : {&batch.programs, &batch.programs_update})
    {
        for (const auto& [hash, data] : *set)
            m_programs.insert_or_assign(hash, data);
    }
    m_state_root = batch.state_root;
    ++m_batches_written;
    return {};
}

void MemoryDurableStore::put_node(const Fea& hash, std::vector<uint64_t> limbs)
{
    std::unique_lock lock{m_mutex};
    m_nodes.insert_or_assign(hash, std::move(limbs));
}

void MemoryDurableStore::put_program(const Fea& hash, bytes data)
{
    std::unique_lock lock{m_mutex};
    m_programs.insert_or_assign(hash, std::move(data));
}

bool MemoryDurableStore::contains_node(const Fea& hash) const
{
    std::shared_lock lock{m_mutex};
    return m_nodes.contains(hash);
}

bool MemoryDurableStore::contains_program(const Fea& hash) const
{
    std::shared_lock lock{m_mutex};
    return m_programs.contains(hash);
}

size_t MemoryDurableStore::node_count() const
{
    std::shared_lock lock{m_mutex};
    return m_nodes.size();
}

Fea MemoryDurableStore::state_root() const
{
    std::shared_lock lock{m_mutex};
    return m_state_root;
}

uint64_t MemoryDurableStore::batches_written() const
{
    std::shared_lock lock{m_mutex};
    return m_batches_written;
}

}  // namespace hashdb
