// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include <benchmark/benchmark.h>
#include <hashdb/smt.hpp>

using namespace hashdb;

namespace
{
Fea make_key(uint64_t i) noexcept
{
    return hash_node(make_value(i + 1));
}

void hash_node_internal(benchmark::State& state)
{
    Children children{};
    for (size_t i = 0; i < children.size(); ++i)
        children[i] = i * 0x0123456789abcdef;
    const auto node = make_internal(children);

    for ([[maybe_unused]] auto _ : state)
        benchmark::DoNotOptimize(hash_node(node));
}
BENCHMARK(hash_node_internal);

void smt_set(benchmark::State& state)
{
    const auto num_keys = static_cast<uint64_t>(state.range(0));
    const Config config;

    for ([[maybe_unused]] auto _ : state)
    {
        Database db{config, nullptr};
        Smt smt{db};
        Fea root;
        for (uint64_t i = 0; i < num_keys; ++i)
        {
            auto r = smt.set(root, make_key(i), i + 1, false, nullptr);
            if (std::holds_alternative<std::error_code>(r)) [[unlikely]]
            {
                state.SkipWithError("set failed");
                break;
            }
            root = std::get<SmtSetResult>(r).new_root;
        }
        benchmark::DoNotOptimize(root);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * num_keys));
}
BENCHMARK(smt_set)->Arg(100)->Arg(1000);

void smt_get(benchmark::State& state)
{
    const auto num_keys = static_cast<uint64_t>(state.range(0));
    const Config config;
    Database db{config, nullptr};
    Smt smt{db};

    Fea root;
    for (uint64_t i = 0; i < num_keys; ++i)
        root = std::get<SmtSetResult>(smt.set(root, make_key(i), i + 1, false, nullptr)).new_root;

    uint64_t i = 0;
    for ([[maybe_unused]] auto _ : state)
    {
        auto r = smt.get(root, make_key(i), nullptr);
        benchmark::DoNotOptimize(r);
        if (++i == num_keys)
            i = 0;
    }
}
BENCHMARK(smt_get)->Arg(1000);

}  // namespace
