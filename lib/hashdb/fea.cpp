// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "fea.hpp"
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <algorithm>
#include <ostream>

namespace hashdb
{
namespace
{
/// The number of path bits taken from limb j by the first num_bits levels.
constexpr size_t consumed_bits(size_t num_bits, size_t j) noexcept
{
    return num_bits / 4 + (j < num_bits % 4 ? 1 : 0);
}
}  // namespace

std::string to_string(const Fea& f)
{
    const auto b = intx::be::store<evmc::bytes32>(to_uint256(f));
    return evmc::hex({b.bytes, sizeof(b.bytes)});
}

std::optional<Fea> from_string(std::string_view s) noexcept
{
    if (s.starts_with("0x") || s.starts_with("0X"))
        s.remove_prefix(2);
    if (s.empty() || s.size() > 64)
        return {};

    // Left-pad to the full width so odd digit counts decode too.
    char padded[64];
    const auto pad = sizeof(padded) - s.size();
    std::fill_n(padded, pad, '0');
    std::copy(s.begin(), s.end(), padded + pad);

    const auto b = evmc::from_hex<evmc::bytes32>({padded, sizeof(padded)});
    if (!b)
        return {};
    return to_fea(intx::be::load<uint256>(*b));
}

Fea remove_key_bits(const Fea& key, size_t num_bits) noexcept
{
    Fea r;
    for (size_t j = 0; j < 4; ++j)
    {
        const auto n = consumed_bits(num_bits, j);
        r.fe[j] = n < 64 ? key.fe[j] >> n : 0;
    }
    return r;
}

Fea join_key(std::span<const uint8_t> path_bits, const Fea& rkey) noexcept
{
    Fea acc;
    for (size_t i = 0; i < path_bits.size(); ++i)
    {
        if (path_bits[i] != 0)
            acc.fe[i % 4] |= uint64_t{1} << (i / 4);
    }

    Fea r;
    for (size_t j = 0; j < 4; ++j)
    {
        const auto n = consumed_bits(path_bits.size(), j);
        r.fe[j] = (n < 64 ? rkey.fe[j] << n : 0) | acc.fe[j];
    }
    return r;
}

std::ostream& operator<<(std::ostream& out, const Fea& f)
{
    return out << "0x" << to_string(f);
}

}  // namespace hashdb
