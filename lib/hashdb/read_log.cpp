// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "read_log.hpp"

namespace hashdb
{
void ReadLog::add_node(const Fea& hash, const NodeValue& node, ReadSource source)
{
    if (source != ReadSource::durable && !m_include_cached)
        return;
    m_entries.push_back({hash, source, false, node, {}});
}

void ReadLog::add_program(const Fea& hash, bytes_view data, ReadSource source)
{
    if (source != ReadSource::durable && !m_include_cached)
        return;
    m_entries.push_back({hash, source, true, {}, bytes{data}});
}

std::map<std::string, std::vector<uint64_t>> ReadLog::nodes() const
{
    std::map<std::string, std::vector<uint64_t>> m;
    for (const auto& e : m_entries)
    {
        if (!e.is_program)
            m.emplace(to_string(e.hash), std::vector<uint64_t>(e.node.begin(), e.node.end()));
    }
    return m;
}

std::map<std::string, bytes> ReadLog::programs() const
{
    std::map<std::string, bytes> m;
    for (const auto& e : m_entries)
    {
        if (e.is_program)
            m.emplace(to_string(e.hash), e.program);
    }
    return m;
}

}  // namespace hashdb
