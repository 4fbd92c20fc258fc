// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "fea.hpp"
#include <array>
#include <span>
#include <string>
#include <system_error>

namespace hashdb
{
/// The number of limbs of every stored tree node.
constexpr size_t NODE_SIZE = 12;

/// The serialized tree node: 8 data limbs followed by 4 capacity limbs.
///
/// internal: [left(4), right(4), 0, 0, 0, 0]
/// leaf:     [rkey(4), value_hash(4), 1, 0, 0, 0]
/// value:    [v0..v7 (32-bit chunks, least significant first), 0, 0, 0, 0]
using NodeValue = std::array<uint64_t, NODE_SIZE>;

/// The 8 data limbs of an internal node, i.e. both child hashes.
using Children = std::array<uint64_t, 8>;

/// Computes the content hash of a node: keccak256 of its 12 limbs in little-endian order.
Fea hash_node(const NodeValue& node) noexcept;

[[nodiscard]] inline bool is_leaf(const NodeValue& node) noexcept
{
    return node[8] == 1;
}

/// Returns the child hash on the given side (0 = left, 1 = right) of an internal node.
[[nodiscard]] inline Fea get_child(std::span<const uint64_t> node, unsigned bit) noexcept
{
    const auto* p = &node[bit * 4];
    return {p[0], p[1], p[2], p[3]};
}

inline void set_child(std::span<uint64_t> node, unsigned bit, const Fea& hash) noexcept
{
    for (size_t i = 0; i < 4; ++i)
        node[bit * 4 + i] = hash.fe[i];
}

NodeValue make_internal(const Children& children) noexcept;
NodeValue make_leaf(const Fea& rkey, const Fea& value_hash) noexcept;
NodeValue make_value(const uint256& value) noexcept;

[[nodiscard]] inline Fea leaf_rkey(const NodeValue& leaf) noexcept
{
    return get_child(leaf, 0);
}

[[nodiscard]] inline Fea leaf_value_hash(const NodeValue& leaf) noexcept
{
    return get_child(leaf, 1);
}

/// Validates raw limbs read from a store and copies them into a node.
///
/// @return SMT_INVALID_DATA_SIZE if the limb count is not NODE_SIZE or the capacity is neither
///         the internal/value nor the leaf one.
std::error_code decode_node(std::span<const uint64_t> limbs, NodeValue& node) noexcept;

/// Reassembles the leaf value out of a value node.
///
/// @return SMT_INVALID_DATA_SIZE if a chunk does not fit 32 bits or the capacity is not zero.
std::error_code decode_value(const NodeValue& node, uint256& value) noexcept;

/// Formats the limbs as concatenated 16-digit hex numbers.
std::string to_hex(const NodeValue& node);

}  // namespace hashdb
