// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace hashdb
{
/// Bounded map of content known to be in the durable store, evicting the least recently
/// used entry when full.
///
/// Lookups and updates are O(1). Not synchronized: the Database guards each cache with its
/// own mutex.
template <typename Key, typename Value>
class LRUCache
{
    /// Entries by usage, the front one is evicted first.
    using Entries = std::list<std::pair<Key, Value>>;

    const size_t m_capacity;
    Entries m_entries;
    std::unordered_map<Key, typename Entries::iterator> m_index;

    void touch(typename Entries::iterator it) noexcept
    {
        m_entries.splice(m_entries.end(), m_entries, it);
    }

public:
    /// @throws std::invalid_argument if capacity is 0.
    explicit LRUCache(size_t capacity) : m_capacity{capacity}
    {
        if (capacity == 0)
            throw std::invalid_argument("LRU cache capacity must not be 0");
        m_index.reserve(capacity);
    }

    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] size_t size() const noexcept { return m_index.size(); }

    void clear() noexcept
    {
        m_index.clear();
        m_entries.clear();
    }

    /// Checks for the key without counting it as a use.
    [[nodiscard]] bool contains(const Key& key) const noexcept { return m_index.contains(key); }

    /// Returns a copy of the cached value and marks the entry as recently used.
    std::optional<Value> get(const Key& key) noexcept
    {
        const auto it = m_index.find(key);
        if (it == m_index.end())
            return {};
        touch(it->second);
        return it->second->second;
    }

    void put(const Key& key, Value value)
    {
        if (const auto it = m_index.find(key); it != m_index.end())
        {
            it->second->second = std::move(value);
            touch(it->second);
            return;
        }

        if (m_index.size() < m_capacity)
        {
            m_entries.emplace_back(key, std::move(value));
            m_index.emplace(key, std::prev(m_entries.end()));
            return;
        }

        // Full: recycle the oldest list entry and its index node for the new key.
        const auto oldest = m_entries.begin();
        auto node = m_index.extract(oldest->first);
        oldest->first = key;
        oldest->second = std::move(value);
        touch(oldest);
        node.key() = key;
        node.mapped() = oldest;
        m_index.insert(std::move(node));
    }
};

}  // namespace hashdb
