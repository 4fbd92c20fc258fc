// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include <CLI/CLI.hpp>
#include <hashdb/hashdb.hpp>
#include <hashdb/json_codec.hpp>
#include <hashdb/log.hpp>
#include <hashdb/version.h>
#include <fstream>
#include <iostream>

namespace
{
/// Executes JSON-lines requests from the input, writing one JSON response per line.
/// @return The number of requests that could not be executed.
int run(hashdb::HashDB& db, std::istream& in, std::ostream& out)
{
    int failures = 0;
    std::string line;
    while (std::getline(in, line))
    {
        if (line.empty() || line.starts_with('#'))
            continue;

        try
        {
            const auto request = hashdb::json::json::parse(line);
            out << hashdb::execute(db, request).dump() << '\n';
        }
        catch (const std::exception& ex)
        {
            out << hashdb::json::json{{"error", ex.what()}}.dump() << '\n';
            ++failures;
        }
    }
    out.flush();
    return failures;
}
}  // namespace

int main(int argc, const char** argv)
{
    using namespace hashdb;

    try
    {
        CLI::App app{"hashdb command line driver"};
        app.set_version_flag("--version", "hashdb-cmd " HASHDB_VERSION);

        std::string config_file;
        app.add_option("--config", config_file, "Configuration file (JSON)")
            ->check(CLI::ExistingFile);

        std::string log_level;
        app.add_option("--log-level", log_level,
            "Minimum log level: debug, info, notice, warning, error");

        std::string input_file;
        app.add_option("--input", input_file, "File with JSON-lines requests, stdin by default")
            ->check(CLI::ExistingFile);

        CLI11_PARSE(app, argc, argv);

        Config config;
        if (!config_file.empty())
        {
            std::ifstream f{config_file};
            config = load_config(f);
        }
        if (!log_level.empty())
            config.log_level = loggers::parse_level(log_level);
        loggers::configure(config.log_level);

        // Only the background writer commits to the in-process durable store. Without it the
        // client drives the flush protocol and acknowledged writes stay in memory.
        MemoryDurableStore durable;
        HashDB db{config, config.flush_worker ? &durable : nullptr};

        int failures = 0;
        if (!input_file.empty())
        {
            std::ifstream f{input_file};
            failures = run(db, f, std::cout);
        }
        else
            failures = run(db, std::cin, std::cout);

        return failures == 0 ? 0 : 1;
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << "\n";
        return -1;
    }
}
