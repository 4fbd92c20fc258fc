// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "smt.hpp"
#include "errors.hpp"
#include "proof.hpp"
#include <algorithm>

namespace hashdb
{
namespace
{
/// Collects the nodes created by one update.
class NodeWriter
{
    std::vector<std::pair<Fea, NodeValue>> m_nodes;

public:
    Fea put(const NodeValue& node)
    {
        const auto hash = hash_node(node);
        m_nodes.emplace_back(hash, node);
        return hash;
    }

    /// Rebuilds the internal nodes above the given level, putting child into the path slot.
    /// An internal node left without children becomes the empty subtree.
    Fea build_path(const std::vector<Children>& siblings, const std::vector<uint8_t>& bits,
        size_t level, Fea child)
    {
        for (auto l = level; l-- > 0;)
        {
            auto children = siblings[l];
            set_child(children, bits[l], child);
            if (std::ranges::all_of(children, [](uint64_t x) { return x == 0; }))
                child = {};
            else
                child = put(make_internal(children));
        }
        return child;
    }

    [[nodiscard]] size_t size() const noexcept { return m_nodes.size(); }
    [[nodiscard]] const auto& nodes() const noexcept { return m_nodes; }
};

Children children_of(const NodeValue& node) noexcept
{
    Children children;
    std::copy_n(node.begin(), children.size(), children.begin());
    return children;
}
}  // namespace

const char* to_string(SetMode mode) noexcept
{
    switch (mode)
    {
    case SetMode::update:
        return "update";
    case SetMode::insert_found:
        return "insertFound";
    case SetMode::insert_not_found:
        return "insertNotFound";
    case SetMode::delete_found:
        return "deleteFound";
    case SetMode::delete_not_found:
        return "deleteNotFound";
    case SetMode::delete_last:
        return "deleteLast";
    case SetMode::zero_to_zero:
        return "zeroToZero";
    }
    return "unknown";
}

/// The result of the traversal shared by get and set.
struct Smt::Path
{
    std::vector<Children> siblings;
    std::vector<uint8_t> bits;

    bool leaf_found = false;
    Fea leaf_key;
    Fea leaf_value_hash;
    uint256 leaf_value;

    [[nodiscard]] size_t level() const noexcept { return siblings.size(); }

    /// The number of hashes a verifier computes to check the proof.
    [[nodiscard]] uint64_t proof_hashes() const noexcept
    {
        return proof_hash_count(siblings.size(), leaf_found);
    }
};

std::error_code Smt::read_value(const Fea& value_hash, uint256& value, ReadLog* log)
{
    NodeValue node;
    if (const auto ec = m_db.read_node(value_hash, node, log))
        return ec;
    return decode_value(node, value);
}

std::error_code Smt::walk(const Fea& root, const Fea& key, ReadLog* log, Path& path)
{
    auto hash = root;
    NodeValue node;
    while (!hash.is_zero())
    {
        if (const auto ec = m_db.read_node(hash, node, log))
            return ec;

        if (is_leaf(node))
        {
            path.leaf_found = true;
            path.leaf_key = join_key(path.bits, leaf_rkey(node));
            path.leaf_value_hash = leaf_value_hash(node);
            return read_value(path.leaf_value_hash, path.leaf_value, log);
        }

        const auto level = path.level();
        if (level == KEY_BITS)
            return make_error_code(INTERNAL_ERROR);

        const auto bit = key_bit(key, level);
        path.siblings.push_back(children_of(node));
        path.bits.push_back(static_cast<uint8_t>(bit));
        hash = get_child(node, bit);
    }
    return {};
}

std::variant<SmtGetResult, std::error_code> Smt::get(const Fea& root, const Fea& key, ReadLog* log)
{
    Path path;
    if (const auto ec = walk(root, key, log, path))
        return ec;

    SmtGetResult res;
    res.root = root;
    res.key = key;
    if (path.leaf_found)
    {
        if (path.leaf_key == key)
            res.value = path.leaf_value;
        else
        {
            res.ins_key = path.leaf_key;
            res.ins_value = path.leaf_value;
            res.is_old0 = false;
        }
    }
    res.proof_hash_counter = path.proof_hashes();
    res.siblings = std::move(path.siblings);
    return res;
}

std::variant<SmtSetResult, std::error_code> Smt::set(
    const Fea& old_root, const Fea& key, const uint256& value, bool persistent, ReadLog* log)
{
    Path path;
    if (const auto ec = walk(old_root, key, log, path))
        return ec;

    SmtSetResult res;
    res.old_root = old_root;
    res.key = key;
    res.new_value = value;

    const auto level = path.level();
    const bool key_found = path.leaf_found && path.leaf_key == key;
    if (key_found)
        res.old_value = path.leaf_value;
    else if (path.leaf_found)
    {
        res.ins_key = path.leaf_key;
        res.ins_value = path.leaf_value;
        res.is_old0 = false;
    }

    NodeWriter writer;
    if (value != 0)
    {
        const auto value_hash = writer.put(make_value(value));
        if (key_found)
        {
            res.mode = SetMode::update;
            const auto leaf = writer.put(make_leaf(remove_key_bits(key, level), value_hash));
            res.new_root = writer.build_path(path.siblings, path.bits, level, leaf);
        }
        else if (path.leaf_found)
        {
            res.mode = SetMode::insert_found;

            // Both keys share the path bits down to the found leaf and differ somewhere below.
            auto split = level;
            while (key_bit(key, split) == key_bit(path.leaf_key, split))
                ++split;

            const auto new_leaf = writer.put(make_leaf(remove_key_bits(key, split + 1), value_hash));
            const auto old_leaf = writer.put(
                make_leaf(remove_key_bits(path.leaf_key, split + 1), path.leaf_value_hash));

            const auto bit = key_bit(key, split);
            Children children{};
            set_child(children, bit, new_leaf);
            set_child(children, bit ^ 1, old_leaf);
            auto hash = writer.put(make_internal(children));

            for (auto l = split; l-- > level;)
            {
                Children single{};
                set_child(single, key_bit(key, l), hash);
                hash = writer.put(make_internal(single));
            }
            res.new_root = writer.build_path(path.siblings, path.bits, level, hash);
        }
        else
        {
            res.mode = SetMode::insert_not_found;
            const auto leaf = writer.put(make_leaf(remove_key_bits(key, level), value_hash));
            res.new_root = writer.build_path(path.siblings, path.bits, level, leaf);
        }
    }
    else if (key_found)
    {
        if (level == 0)
        {
            res.mode = SetMode::delete_last;
            res.new_root = {};
        }
        else
        {
            const unsigned bit = path.bits[level - 1];
            const auto sibling = get_child(path.siblings[level - 1], bit ^ 1);

            NodeValue sibling_node{};
            if (!sibling.is_zero())
            {
                if (const auto ec = m_db.read_node(sibling, sibling_node, log))
                    return ec;
            }

            if (!sibling.is_zero() && is_leaf(sibling_node))
            {
                res.mode = SetMode::delete_found;

                auto sibling_bits = path.bits;
                sibling_bits.back() = static_cast<uint8_t>(bit ^ 1);
                res.ins_key = join_key(sibling_bits, leaf_rkey(sibling_node));
                if (const auto ec = read_value(leaf_value_hash(sibling_node), res.ins_value, log))
                    return ec;
                res.is_old0 = false;

                // The remaining leaf moves up past every ancestor left with it as the only child.
                auto pos = level - 1;
                while (pos > 0 && get_child(path.siblings[pos - 1], path.bits[pos - 1] ^ 1).is_zero())
                    --pos;

                const auto leaf = writer.put(
                    make_leaf(remove_key_bits(res.ins_key, pos), leaf_value_hash(sibling_node)));
                res.new_root = writer.build_path(path.siblings, path.bits, pos, leaf);
            }
            else
            {
                res.mode = SetMode::delete_not_found;
                res.new_root = writer.build_path(path.siblings, path.bits, level, Fea{});
            }
        }
    }
    else
    {
        res.mode = SetMode::zero_to_zero;
        res.new_root = old_root;
    }

    res.proof_hash_counter = path.proof_hashes() + writer.size();
    res.siblings = std::move(path.siblings);

    if (res.mode != SetMode::zero_to_zero)
    {
        m_db.write_nodes(writer.nodes(), persistent,
            persistent ? std::optional<Fea>{res.new_root} : std::nullopt);
    }
    return res;
}

}  // namespace hashdb
