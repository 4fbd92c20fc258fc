// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "database.hpp"
#include "node.hpp"
#include <system_error>
#include <variant>
#include <vector>

namespace hashdb
{
/// The case a tree update ended in.
enum class SetMode : uint8_t
{
    update,            ///< The leaf of the key got a new value.
    insert_found,      ///< A new leaf was added, splitting the path of another leaf.
    insert_not_found,  ///< A new leaf was put into an empty slot.
    delete_found,      ///< The leaf was removed and its sibling leaf moved up.
    delete_not_found,  ///< The leaf was removed, its slot is empty now.
    delete_last,       ///< The only leaf of the tree was removed.
    zero_to_zero,      ///< Zero was assigned to an absent key. Nothing changed.
};

/// Returns the protocol name of the mode, e.g. "insertNotFound".
const char* to_string(SetMode mode) noexcept;

struct SmtGetResult
{
    Fea root;
    Fea key;

    /// The children of the internal node at each level of the path, root first.
    std::vector<Children> siblings;

    /// The leaf of another key the search ended at.
    Fea ins_key;
    uint256 ins_value;

    /// False iff the search ended at a leaf of another key.
    bool is_old0 = true;

    uint256 value;
    uint64_t proof_hash_counter = 0;
};

struct SmtSetResult
{
    Fea old_root;
    Fea new_root;
    Fea key;

    /// The proof against old_root.
    std::vector<Children> siblings;

    Fea ins_key;
    uint256 ins_value;
    bool is_old0 = true;

    uint256 old_value;
    uint256 new_value;
    SetMode mode = SetMode::zero_to_zero;
    uint64_t proof_hash_counter = 0;
};

/// The sparse Merkle tree algorithms over the node store.
///
/// Trees are immutable: an update creates new nodes along the modified path and shares all
/// other subtrees with the old version. The object holds no state of its own, concurrent
/// calls on any roots are safe.
class Smt
{
    Database& m_db;

    struct Path;

    std::error_code read_value(const Fea& value_hash, uint256& value, ReadLog* log);

    std::error_code walk(const Fea& root, const Fea& key, ReadLog* log, Path& path);

public:
    explicit Smt(Database& db) noexcept : m_db{db} {}

    /// Looks up the key in the tree of the root and builds the (non-)membership proof.
    std::variant<SmtGetResult, std::error_code> get(const Fea& root, const Fea& key, ReadLog* log);

    /// Assigns the value to the key in the tree of old_root. Zero deletes the key.
    ///
    /// The new nodes are stored only if the whole update succeeded.
    /// @param persistent  Stage the new nodes for flushing, otherwise keep them in memory only.
    std::variant<SmtSetResult, std::error_code> set(const Fea& old_root, const Fea& key,
        const uint256& value, bool persistent, ReadLog* log);
};

}  // namespace hashdb
