// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <istream>

namespace hashdb
{
namespace json = nlohmann;

namespace
{
template <typename T>
void load_if_exists(const json::json& j, std::string_view key, T& out)
{
    if (const auto it = j.find(key); it != j.end())
        out = it->get<T>();
}

void load_ms_if_exists(const json::json& j, std::string_view key, std::chrono::milliseconds& out)
{
    if (const auto it = j.find(key); it != j.end())
        out = std::chrono::milliseconds{it->get<uint64_t>()};
}
}  // namespace

Config load_config(const json::json& j)
{
    if (!j.is_object())
        throw std::invalid_argument("config: JSON object expected");

    Config c;
    load_if_exists(j, "node_cache_capacity", c.node_cache_capacity);
    load_if_exists(j, "program_cache_capacity", c.program_cache_capacity);
    load_if_exists(j, "read_log_include_cached", c.read_log_include_cached);
    load_ms_if_exists(j, "durable_timeout_ms", c.durable_timeout);
    load_if_exists(j, "auto_flush_threshold", c.auto_flush_threshold);
    load_if_exists(j, "flush_worker", c.flush_worker);
    load_ms_if_exists(j, "flush_interval_ms", c.flush_interval);
    load_if_exists(j, "prover_id", c.prover_id);
    if (const auto it = j.find("log_level"); it != j.end())
        c.log_level = loggers::parse_level(it->get<std::string>());

    if (c.node_cache_capacity == 0 || c.program_cache_capacity == 0)
        throw std::invalid_argument("config: cache capacity must not be 0");
    return c;
}

Config load_config(std::istream& in)
{
    return load_config(json::json::parse(in));
}

}  // namespace hashdb
