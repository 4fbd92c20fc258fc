// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <intx/intx.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace hashdb
{
using intx::uint256;

/// The number of bits of a tree key, i.e. the maximum depth of the tree.
constexpr size_t KEY_BITS = 256;

/// A 256-bit value expressed as four 64-bit limbs (a field element tuple).
///
/// The limb fe[0] is the least significant one. The same type is used for tree keys,
/// tree roots, node hashes and proof siblings.
struct Fea
{
    std::array<uint64_t, 4> fe{};

    constexpr Fea() noexcept = default;

    constexpr Fea(uint64_t fe0, uint64_t fe1, uint64_t fe2, uint64_t fe3) noexcept
      : fe{fe0, fe1, fe2, fe3}
    {}

    [[nodiscard]] constexpr bool is_zero() const noexcept
    {
        return (fe[0] | fe[1] | fe[2] | fe[3]) == 0;
    }

    [[nodiscard]] constexpr uint64_t operator[](size_t i) const noexcept { return fe[i]; }

    friend constexpr bool operator==(const Fea&, const Fea&) noexcept = default;
};

/// Converts the limbs to the 256-bit scalar they represent.
inline uint256 to_uint256(const Fea& f) noexcept
{
    return {f.fe[0], f.fe[1], f.fe[2], f.fe[3]};
}

/// Splits a 256-bit scalar into limbs.
inline Fea to_fea(const uint256& v) noexcept
{
    return {v[0], v[1], v[2], v[3]};
}

/// Formats the limbs as 64 lowercase hex digits of the scalar, most significant first.
std::string to_string(const Fea& f);

/// Parses a hash string produced by to_string(). A "0x" prefix and fewer than 64 digits are
/// accepted. Returns nullopt for anything else.
std::optional<Fea> from_string(std::string_view s) noexcept;

/// Returns the path bit of the key at the given tree level.
///
/// The limbs are interleaved: level i uses bit (i / 4) of limb (i % 4).
[[nodiscard]] constexpr unsigned key_bit(const Fea& key, size_t level) noexcept
{
    return static_cast<unsigned>((key.fe[level % 4] >> (level / 4)) & 1);
}

/// Removes the bits consumed by the first `num_bits` levels of the path,
/// producing the remaining key stored in a leaf at that depth.
Fea remove_key_bits(const Fea& key, size_t num_bits) noexcept;

/// Rebuilds a full key out of the path bits walked so far and the remaining key of a leaf.
Fea join_key(std::span<const uint8_t> path_bits, const Fea& rkey) noexcept;

std::ostream& operator<<(std::ostream& out, const Fea& f);

}  // namespace hashdb

template <>
struct std::hash<hashdb::Fea>
{
    size_t operator()(const hashdb::Fea& f) const noexcept
    {
        // Hashes are uniformly distributed already, the keys of a tree might be not.
        return static_cast<size_t>(f.fe[0] ^ (f.fe[1] * 0x9e3779b97f4a7c15) ^
                                   (f.fe[2] * 0xc2b2ae3d27d4eb4f) ^ (f.fe[3] * 0x165667b19e3779f9));
    }
};
