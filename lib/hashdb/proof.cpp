// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"
#include <algorithm>

namespace hashdb
{
Fea compute_root(
    const Fea& key, std::span<const Children> siblings, const std::optional<ProofLeaf>& leaf)
{
    const auto level = siblings.size();

    Fea hash;
    if (leaf.has_value())
    {
        const auto value_hash = hash_node(make_value(leaf->value));
        hash = hash_node(make_leaf(remove_key_bits(leaf->key, level), value_hash));
    }

    for (auto l = level; l-- > 0;)
    {
        auto children = siblings[l];
        set_child(children, key_bit(key, l), hash);
        if (std::ranges::all_of(children, [](uint64_t x) { return x == 0; }))
            hash = {};
        else
            hash = hash_node(make_internal(children));
    }
    return hash;
}

}  // namespace hashdb
