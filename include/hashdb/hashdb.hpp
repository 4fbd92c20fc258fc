// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <hashdb/config.hpp>
#include <hashdb/database.hpp>
#include <hashdb/durable_store.hpp>
#include <hashdb/errors.hpp>
#include <hashdb/fea.hpp>
#include <hashdb/smt.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hashdb
{
class FlushWorker;

/// The read log returned to the caller: raw node limbs keyed by hash string.
using DbReadLog = std::map<std::string, std::vector<uint64_t>>;

struct SetRequest
{
    Fea old_root;
    Fea key;

    /// The new value as a decimal or 0x-prefixed hex number. Zero (or empty) deletes the key.
    std::string value;

    bool persistent = false;

    /// Return the proof and the update details, not only the new root.
    bool details = true;

    bool get_db_read_log = false;
};

struct SetResponse
{
    Fea old_root;
    Fea new_root;
    Fea key;
    std::vector<Children> siblings;
    Fea ins_key;
    std::string ins_value;
    bool is_old0 = false;
    std::string old_value;
    std::string new_value;
    std::string mode;
    uint64_t proof_hash_counter = 0;
    DbReadLog db_read_log;
    ErrorCode result = SUCCESS;
};

struct GetRequest
{
    Fea root;
    Fea key;
    bool details = true;
    bool get_db_read_log = false;
};

struct GetResponse
{
    Fea root;
    Fea key;

    /// The proof members below are filled in (the request asked for details).
    bool details = false;

    std::vector<Children> siblings;
    Fea ins_key;
    std::string ins_value;
    bool is_old0 = false;
    std::string value;
    uint64_t proof_hash_counter = 0;
    DbReadLog db_read_log;
    ErrorCode result = SUCCESS;
};

struct SetProgramRequest
{
    Fea key;
    bytes data;
    bool persistent = false;
};

struct SetProgramResponse
{
    ErrorCode result = SUCCESS;
};

struct GetProgramRequest
{
    Fea key;
};

struct GetProgramResponse
{
    bytes data;
    ErrorCode result = SUCCESS;
};

struct LoadDBRequest
{
    std::map<std::string, std::vector<uint64_t>> input_db;
    bool persistent = false;
};

struct LoadDBResponse
{
    ErrorCode result = SUCCESS;
};

struct LoadProgramDBRequest
{
    std::map<std::string, bytes> input_program_db;
    bool persistent = false;
};

struct LoadProgramDBResponse
{
    ErrorCode result = SUCCESS;
};

struct FlushResponse
{
    uint64_t flush_id = 0;
    uint64_t stored_flush_id = 0;
    ErrorCode result = SUCCESS;
};

struct GetFlushStatusResponse
{
    uint64_t stored_flush_id = 0;
    uint64_t storing_flush_id = 0;
    uint64_t last_flush_id = 0;
    uint64_t pending_to_flush_nodes = 0;
    uint64_t pending_to_flush_program = 0;
    uint64_t storing_nodes = 0;
    uint64_t storing_program = 0;
    std::string prover_id;
};

struct GetFlushDataRequest
{
    /// The batch to return, 0 for the oldest one not acknowledged yet.
    uint64_t flush_id = 0;
};

/// A flushed entry: hash string and hex encoded content.
struct FlushData
{
    std::string key;
    std::string value;

    friend bool operator==(const FlushData&, const FlushData&) = default;
};

struct GetFlushDataResponse
{
    /// The id of the returned batch, 0 if there was none.
    uint64_t flush_id = 0;
    uint64_t stored_flush_id = 0;
    std::vector<FlushData> nodes;
    std::vector<FlushData> nodes_update;
    std::vector<FlushData> program;
    std::vector<FlushData> program_update;
    std::string nodes_state_root;
    ErrorCode result = SUCCESS;
};

struct AckFlushRequest
{
    uint64_t flush_id = 0;
};

struct AckFlushResponse
{
    uint64_t stored_flush_id = 0;
    ErrorCode result = SUCCESS;
};

/// The hash database service.
///
/// All methods are thread safe. Failures are reported in the result member of the responses.
class HashDB
{
    Config m_config;
    std::string m_prover_id;
    Database m_db;
    Smt m_smt;
    std::unique_ptr<FlushWorker> m_worker;

public:
    /// @param durable  The durable store, must outlive the service. Without it acknowledged
    ///                 writes stay in memory.
    explicit HashDB(Config config, DurableStore* durable = nullptr);
    ~HashDB() noexcept;

    HashDB(const HashDB&) = delete;
    HashDB& operator=(const HashDB&) = delete;

    SetResponse set(const SetRequest& req);
    GetResponse get(const GetRequest& req);
    SetProgramResponse set_program(const SetProgramRequest& req);
    GetProgramResponse get_program(const GetProgramRequest& req);
    LoadDBResponse load_db(const LoadDBRequest& req);
    LoadProgramDBResponse load_program_db(const LoadProgramDBRequest& req);
    FlushResponse flush();
    GetFlushStatusResponse get_flush_status();
    GetFlushDataResponse get_flush_data(const GetFlushDataRequest& req);

    /// Reports that the durable writer committed all batches up to the given flush id.
    AckFlushResponse ack_flush(const AckFlushRequest& req);

    [[nodiscard]] const std::string& prover_id() const noexcept { return m_prover_id; }
    [[nodiscard]] const Config& config() const noexcept { return m_config; }
    [[nodiscard]] Database& database() noexcept { return m_db; }
};

}  // namespace hashdb
