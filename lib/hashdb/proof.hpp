// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "node.hpp"
#include <optional>
#include <span>

namespace hashdb
{
/// The leaf a proof ends at.
struct ProofLeaf
{
    Fea key;
    uint256 value;
};

/// Computes the root a Merkle proof commits to.
///
/// The path follows the bits of key. The terminal slot holds the given leaf,
/// or is empty if there is none. For a membership proof pass the key and its value,
/// for a non-membership proof ending at another leaf pass that leaf (ins_key/ins_value).
Fea compute_root(
    const Fea& key, std::span<const Children> siblings, const std::optional<ProofLeaf>& leaf);

/// Returns the number of hashes compute_root() evaluates for the proof.
[[nodiscard]] inline uint64_t proof_hash_count(size_t num_siblings, bool has_leaf) noexcept
{
    return num_siblings + (has_leaf ? 2 : 0);
}

}  // namespace hashdb
