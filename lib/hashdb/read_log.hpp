// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "node.hpp"
#include <evmc/evmc.hpp>
#include <map>
#include <string>
#include <vector>

namespace hashdb
{
using evmc::bytes;
using evmc::bytes_view;

/// The store tier a read was served from.
enum class ReadSource : uint8_t
{
    write_buffer,
    memory,
    cache,
    durable,
};

/// The recorder of the store reads performed by a single operation.
///
/// Entries are kept in the order the traversal consulted them. A log is owned by one call and
/// is not synchronized.
class ReadLog
{
public:
    struct Entry
    {
        Fea hash;
        ReadSource source;
        bool is_program = false;
        NodeValue node{};
        bytes program;
    };

private:
    bool m_include_cached = false;
    std::vector<Entry> m_entries;

public:
    /// @param include_cached  Record also reads served by the in-memory tiers,
    ///                        not only durable store reads.
    explicit ReadLog(bool include_cached = false) noexcept : m_include_cached{include_cached} {}

    void add_node(const Fea& hash, const NodeValue& node, ReadSource source);
    void add_program(const Fea& hash, bytes_view data, ReadSource source);

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    /// Returns the node reads keyed by hash string.
    [[nodiscard]] std::map<std::string, std::vector<uint64_t>> nodes() const;

    /// Returns the program reads keyed by hash string.
    [[nodiscard]] std::map<std::string, bytes> programs() const;
};

}  // namespace hashdb
