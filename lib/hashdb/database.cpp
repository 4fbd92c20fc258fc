// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "database.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace hashdb
{
Database::Database(const Config& config, DurableStore* durable)
  : m_config{config},
    m_durable{durable},
    m_pipeline{config.auto_flush_threshold},
    m_node_cache{config.node_cache_capacity},
    m_program_cache{config.program_cache_capacity}
{}

std::optional<NodeValue> Database::find_memory_node(const Fea& hash) const
{
    std::shared_lock lock{m_memory_mutex};
    if (const auto it = m_memory_nodes.find(hash); it != m_memory_nodes.end())
        return it->second;
    return {};
}

std::optional<bytes> Database::find_memory_program(const Fea& hash) const
{
    std::shared_lock lock{m_memory_mutex};
    if (const auto it = m_memory_programs.find(hash); it != m_memory_programs.end())
        return it->second;
    return {};
}

std::error_code Database::read_node(const Fea& hash, NodeValue& node, ReadLog* log)
{
    auto source = ReadSource::durable;
    std::optional<NodeValue> found;
    if ((found = m_pipeline.find_node(hash)))
        source = ReadSource::write_buffer;
    else if ((found = find_memory_node(hash)))
        source = ReadSource::memory;
    else
    {
        std::lock_guard lock{m_cache_mutex};
        if ((found = m_node_cache.get(hash)))
            source = ReadSource::cache;
    }

    if (found)
        node = *found;
    else
    {
        if (m_durable == nullptr)
            return make_error_code(DB_KEY_NOT_FOUND);

        std::vector<uint64_t> limbs;
        if (const auto ec = m_durable->read_node(hash, limbs, m_config.durable_timeout))
        {
            if (ec != make_error_code(DB_KEY_NOT_FOUND))
            {
                HASHDB_LOG(loggers::generic::get(), warning)
                    << "durable read of node " << hash << " failed: " << ec.message();
            }
            return ec;
        }
        if (const auto ec = decode_node(limbs, node))
        {
            HASHDB_LOG(loggers::generic::get(), warning)
                << "malformed node " << hash << " with " << limbs.size() << " limbs";
            return ec;
        }

        std::lock_guard lock{m_cache_mutex};
        m_node_cache.put(hash, node);
    }

    if (log != nullptr)
        log->add_node(hash, node, source);
    return {};
}

std::error_code Database::read_program(const Fea& hash, bytes& data, ReadLog* log)
{
    auto source = ReadSource::durable;
    std::optional<bytes> found;
    if ((found = m_pipeline.find_program(hash)))
        source = ReadSource::write_buffer;
    else if ((found = find_memory_program(hash)))
        source = ReadSource::memory;
    else
    {
        std::lock_guard lock{m_cache_mutex};
        if ((found = m_program_cache.get(hash)))
            source = ReadSource::cache;
    }

    if (found)
        data = std::move(*found);
    else
    {
        if (m_durable == nullptr)
            return make_error_code(DB_KEY_NOT_FOUND);

        if (const auto ec = m_durable->read_program(hash, data, m_config.durable_timeout))
        {
            if (ec != make_error_code(DB_KEY_NOT_FOUND))
            {
                HASHDB_LOG(loggers::generic::get(), warning)
                    << "durable read of program " << hash << " failed: " << ec.message();
            }
            return ec;
        }

        std::lock_guard lock{m_cache_mutex};
        m_program_cache.put(hash, data);
    }

    if (log != nullptr)
        log->add_program(hash, data, source);
    return {};
}

void Database::write_nodes(std::span<const std::pair<Fea, NodeValue>> nodes, bool persistent,
    const std::optional<Fea>& state_root)
{
    if (!persistent)
    {
        std::unique_lock lock{m_memory_mutex};
        for (const auto& [hash, node] : nodes)
            m_memory_nodes.insert_or_assign(hash, node);
        return;
    }

    std::vector<StagedNode> staged;
    staged.reserve(nodes.size());
    {
        std::lock_guard lock{m_cache_mutex};
        for (const auto& [hash, node] : nodes)
            staged.push_back({hash, node, m_node_cache.contains(hash)});
    }
    m_pipeline.stage(staged, {}, state_root);
}

void Database::write_program(const Fea& hash, bytes data, bool persistent)
{
    if (!persistent)
    {
        std::unique_lock lock{m_memory_mutex};
        m_memory_programs.insert_or_assign(hash, std::move(data));
        return;
    }

    bool known_stored = false;
    {
        std::lock_guard lock{m_cache_mutex};
        known_stored = m_program_cache.contains(hash);
    }
    const StagedProgram staged[]{{hash, std::move(data), known_stored}};
    m_pipeline.stage({}, staged);
}

std::error_code Database::load_nodes(
    const std::map<std::string, std::vector<uint64_t>>& input, bool persistent)
{
    std::vector<std::pair<Fea, NodeValue>> nodes;
    nodes.reserve(input.size());
    for (const auto& [key, limbs] : input)
    {
        const auto hash = from_string(key);
        if (!hash)
            return make_error_code(INTERNAL_ERROR);

        NodeValue node;
        if (const auto ec = decode_node(limbs, node))
            return ec;
        if (hash_node(node) != *hash)
        {
            HASHDB_LOG(loggers::generic::get(), warning)
                << "rejected node import: content does not match hash " << key;
            return make_error_code(INTERNAL_ERROR);
        }
        nodes.emplace_back(*hash, node);
    }

    {
        std::unique_lock lock{m_memory_mutex};
        for (const auto& [hash, node] : nodes)
            m_memory_nodes.insert_or_assign(hash, node);
    }
    if (persistent)
        write_nodes(nodes, true, std::nullopt);

    HASHDB_LOG(loggers::generic::get(), info)
        << "imported " << nodes.size() << " nodes" << (persistent ? " (persistent)" : "");
    return {};
}

std::error_code Database::load_programs(const std::map<std::string, bytes>& input, bool persistent)
{
    std::vector<StagedProgram> programs;
    programs.reserve(input.size());
    for (const auto& [key, data] : input)
    {
        const auto hash = from_string(key);
        if (!hash)
            return make_error_code(INTERNAL_ERROR);
        programs.push_back({*hash, data, false});
    }

    {
        std::unique_lock lock{m_memory_mutex};
        for (const auto& p : programs)
            m_memory_programs.insert_or_assign(p.hash, p.data);
    }
    if (persistent)
    {
        {
            std::lock_guard lock{m_cache_mutex};
            for (auto& p : programs)
                p.known_stored = m_program_cache.contains(p.hash);
        }
        m_pipeline.stage({}, programs);
    }

    HASHDB_LOG(loggers::generic::get(), info)
        << "imported " << programs.size() << " programs" << (persistent ? " (persistent)" : "");
    return {};
}

std::error_code Database::ack_flush(uint64_t flush_id)
{
    auto collected = m_pipeline.collect_stored(flush_id);
    if (const auto* ec = std::get_if<std::error_code>(&collected))
        return *ec;

    // Move the content to its next tier before it leaves the write buffer,
    // so that readers never observe a gap.
    for (const auto& batch : std::get<0>(collected))
    {
        if (m_durable != nullptr)
        {
            std::lock_guard lock{m_cache_mutex};
            for (const auto* set : {&batch->nodes, &batch->nodes_update})
            {
                for (const auto& [hash, node] : *set)
                    m_node_cache.put(hash, node);
            }
            for (const auto* set : {&batch->programs, &batch->programs_update})
            {
                for (const auto& [hash, data] : *set)
                    m_program_cache.put(hash, data);
            }
        }
        else
        {
            std::unique_lock lock{m_memory_mutex};
            for (const auto* set : {&batch->nodes, &batch->nodes_update})
            {
                for (const auto& [hash, node] : *set)
                    m_memory_nodes.insert_or_assign(hash, node);
            }
            for (const auto* set : {&batch->programs, &batch->programs_update})
            {
                for (const auto& [hash, data] : *set)
                    m_memory_programs.insert_or_assign(hash, data);
            }
        }
    }

    if (const auto ec = m_pipeline.release_stored(flush_id))
        return ec;
    HASHDB_LOG(loggers::generic::get(), info) << "flush " << flush_id << " acknowledged";
    return {};
}

}  // namespace hashdb
