// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "log.hpp"
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace hashdb
{
/// The engine configuration.
struct Config
{
    /// The capacity (entries) of the cache of nodes known to be in the durable store.
    size_t node_cache_capacity = 1 << 20;

    /// The capacity (entries) of the cache of programs known to be in the durable store.
    size_t program_cache_capacity = 1 << 12;

    /// Record reads served by the in-memory tiers in read logs too.
    bool read_log_include_cached = false;

    /// The timeout passed to every durable store read.
    std::chrono::milliseconds durable_timeout{5000};

    /// Close the open flush batch once it holds this many nodes. 0 disables it.
    size_t auto_flush_threshold = 0;

    /// Run the background durable writer (requires a durable store).
    bool flush_worker = false;

    /// The period of the automatic Flush() of the background writer. 0 disables it.
    std::chrono::milliseconds flush_interval{0};

    /// The instance id reported by GetFlushStatus. Generated if empty.
    std::string prover_id;

    loggers::level log_level = loggers::level::info;
};

/// Loads the configuration from a JSON object. Missing members keep their defaults.
///
/// @throws nlohmann::json::exception or std::invalid_argument for malformed members.
Config load_config(const nlohmann::json& j);

/// Parses a JSON document and loads the configuration from it.
Config load_config(std::istream& in);

}  // namespace hashdb
