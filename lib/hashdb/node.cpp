// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "node.hpp"
#include "errors.hpp"
#include <ethash/keccak.hpp>
#include <evmc/hex.hpp>
#include <algorithm>

namespace hashdb
{
namespace
{
constexpr Fea LEAF_CAPACITY{1, 0, 0, 0};

inline Fea capacity(const NodeValue& node) noexcept
{
    return {node[8], node[9], node[10], node[11]};
}
}  // namespace

Fea hash_node(const NodeValue& node) noexcept
{
    uint8_t buffer[NODE_SIZE * 8];
    for (size_t i = 0; i < NODE_SIZE; i += 4)
    {
        const Fea chunk{node[i], node[i + 1], node[i + 2], node[i + 3]};
        intx::le::unsafe::store(&buffer[i * 8], to_uint256(chunk));
    }

    const auto h = ethash::keccak256(buffer, sizeof(buffer));
    return to_fea(intx::le::load<uint256>(h.bytes));
}

NodeValue make_internal(const Children& children) noexcept
{
    NodeValue node{};
    std::copy(children.begin(), children.end(), node.begin());
    return node;
}

NodeValue make_leaf(const Fea& rkey, const Fea& value_hash) noexcept
{
    NodeValue node{};
    set_child(node, 0, rkey);
    set_child(node, 1, value_hash);
    node[8] = 1;
    return node;
}

NodeValue make_value(const uint256& value) noexcept
{
    NodeValue node{};
    for (size_t i = 0; i < 8; ++i)
        node[i] = static_cast<uint64_t>(value >> (i * 32)) & 0xffffffff;
    return node;
}

std::error_code decode_node(std::span<const uint64_t> limbs, NodeValue& node) noexcept
{
    if (limbs.size() != NODE_SIZE)
        return make_error_code(SMT_INVALID_DATA_SIZE);

    std::copy(limbs.begin(), limbs.end(), node.begin());
    if (const auto c = capacity(node); !c.is_zero() && c != LEAF_CAPACITY)
        return make_error_code(SMT_INVALID_DATA_SIZE);
    return {};
}

std::error_code decode_value(const NodeValue& node, uint256& value) noexcept
{
    if (!capacity(node).is_zero())
        return make_error_code(SMT_INVALID_DATA_SIZE);

    value = 0;
    for (size_t i = 0; i < 8; ++i)
    {
        if (node[i] > 0xffffffff)
            return make_error_code(SMT_INVALID_DATA_SIZE);
        value |= uint256{node[i]} << (i * 32);
    }
    return {};
}

std::string to_hex(const NodeValue& node)
{
    uint8_t buffer[NODE_SIZE * 8];
    for (size_t i = 0; i < NODE_SIZE; ++i)
        intx::be::unsafe::store(&buffer[i * 8], node[i]);
    return evmc::hex({buffer, sizeof(buffer)});
}

}  // namespace hashdb
