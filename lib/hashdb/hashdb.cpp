// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "flush_worker.hpp"
#include "log.hpp"
#include <hashdb/hashdb.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <evmc/hex.hpp>
#include <optional>
#include <stdexcept>

namespace hashdb
{
namespace
{
/// Parses a leaf value: a decimal or 0x-prefixed hex number. The empty string is 0.
std::optional<uint256> parse_value(const std::string& s)
{
    if (s.empty())
        return uint256{0};
    try
    {
        return intx::from_string<uint256>(s);
    }
    catch (const std::invalid_argument&)
    {
        return {};
    }
    catch (const std::out_of_range&)
    {
        return {};
    }
}

std::string make_prover_id()
{
    return boost::uuids::to_string(boost::uuids::random_generator{}());
}

template <typename Value, typename Encode>
std::vector<FlushData> to_flush_data(const WriteSet<Value>& set, Encode encode)
{
    std::vector<FlushData> out;
    out.reserve(set.size());
    for (const auto& [hash, value] : set)
        out.push_back({to_string(hash), encode(value)});
    return out;
}
}  // namespace

HashDB::HashDB(Config config, DurableStore* durable)
  : m_config{std::move(config)},
    m_prover_id{m_config.prover_id.empty() ? make_prover_id() : m_config.prover_id},
    m_db{m_config, durable},
    m_smt{m_db}
{
    if (m_config.flush_worker)
    {
        if (durable == nullptr)
            throw std::invalid_argument("flush worker requires a durable store");
        m_worker = std::make_unique<FlushWorker>(m_db, *durable, m_config.flush_interval);
        m_worker->start();
    }
    HASHDB_LOG(loggers::generic::get(), info)
        << "hash database " << m_prover_id << " started"
        << (durable != nullptr ? "" : " without durable store");
}

HashDB::~HashDB() noexcept
{
    if (m_worker)
        m_worker->stop();
}

SetResponse HashDB::set(const SetRequest& req)
{
    SetResponse res;
    res.old_root = req.old_root;
    res.key = req.key;

    const auto value = parse_value(req.value);
    if (!value)
    {
        HASHDB_LOG(loggers::generic::get(), warning) << "set: invalid value \"" << req.value << '"';
        res.result = INTERNAL_ERROR;
        return res;
    }

    ReadLog log{m_config.read_log_include_cached};
    auto r = m_smt.set(req.old_root, req.key, *value, req.persistent,
        req.get_db_read_log ? &log : nullptr);
    if (const auto* ec = std::get_if<std::error_code>(&r))
    {
        HASHDB_LOG(loggers::generic::get(), debug)
            << "set " << req.key << " on root " << req.old_root << " failed: " << ec->message();
        res.result = to_error_code(*ec);
        return res;
    }

    auto& s = std::get<SmtSetResult>(r);
    res.new_root = s.new_root;
    if (req.details)
    {
        res.siblings = std::move(s.siblings);
        res.ins_key = s.ins_key;
        res.ins_value = intx::to_string(s.ins_value);
        res.is_old0 = s.is_old0;
        res.old_value = intx::to_string(s.old_value);
        res.new_value = intx::to_string(s.new_value);
        res.mode = to_string(s.mode);
        res.proof_hash_counter = s.proof_hash_counter;
    }
    if (req.get_db_read_log)
        res.db_read_log = log.nodes();
    return res;
}

GetResponse HashDB::get(const GetRequest& req)
{
    GetResponse res;
    res.root = req.root;
    res.key = req.key;

    ReadLog log{m_config.read_log_include_cached};
    auto r = m_smt.get(req.root, req.key, req.get_db_read_log ? &log : nullptr);
    if (const auto* ec = std::get_if<std::error_code>(&r))
    {
        HASHDB_LOG(loggers::generic::get(), debug)
            << "get " << req.key << " on root " << req.root << " failed: " << ec->message();
        res.result = to_error_code(*ec);
        return res;
    }

    auto& g = std::get<SmtGetResult>(r);
    res.value = intx::to_string(g.value);
    if (req.details)
    {
        res.details = true;
        res.siblings = std::move(g.siblings);
        res.ins_key = g.ins_key;
        res.ins_value = intx::to_string(g.ins_value);
        res.is_old0 = g.is_old0;
        res.proof_hash_counter = g.proof_hash_counter;
    }
    if (req.get_db_read_log)
        res.db_read_log = log.nodes();
    return res;
}

SetProgramResponse HashDB::set_program(const SetProgramRequest& req)
{
    m_db.write_program(req.key, req.data, req.persistent);
    return {};
}

GetProgramResponse HashDB::get_program(const GetProgramRequest& req)
{
    GetProgramResponse res;
    if (const auto ec = m_db.read_program(req.key, res.data, nullptr))
    {
        res.data.clear();
        res.result = to_error_code(ec);
    }
    return res;
}

LoadDBResponse HashDB::load_db(const LoadDBRequest& req)
{
    return {to_error_code(m_db.load_nodes(req.input_db, req.persistent))};
}

LoadProgramDBResponse HashDB::load_program_db(const LoadProgramDBRequest& req)
{
    return {to_error_code(m_db.load_programs(req.input_program_db, req.persistent))};
}

FlushResponse HashDB::flush()
{
    const auto r = m_db.pipeline().flush();
    HASHDB_LOG(loggers::generic::get(), info)
        << "flush " << r.flush_id << " requested, stored flush " << r.stored_flush_id;
    return {r.flush_id, r.stored_flush_id, SUCCESS};
}

GetFlushStatusResponse HashDB::get_flush_status()
{
    const auto s = m_db.pipeline().status();
    GetFlushStatusResponse res;
    res.stored_flush_id = s.stored_flush_id;
    res.storing_flush_id = s.storing_flush_id;
    res.last_flush_id = s.last_flush_id;
    res.pending_to_flush_nodes = s.pending_to_flush_nodes;
    res.pending_to_flush_program = s.pending_to_flush_programs;
    res.storing_nodes = s.storing_nodes;
    res.storing_program = s.storing_programs;
    res.prover_id = m_prover_id;
    return res;
}

GetFlushDataResponse HashDB::get_flush_data(const GetFlushDataRequest& req)
{
    auto& pipeline = m_db.pipeline();

    GetFlushDataResponse res;
    auto claimed = pipeline.claim(req.flush_id);
    res.stored_flush_id = pipeline.stored_flush_id();
    if (const auto* ec = std::get_if<std::error_code>(&claimed))
    {
        res.result = to_error_code(*ec);
        return res;
    }

    const auto& batch = std::get<std::shared_ptr<const FlushBatch>>(claimed);
    if (batch == nullptr)
        return res;

    const auto encode_node = [](const NodeValue& node) { return to_hex(node); };
    const auto encode_program = [](const bytes& data) { return evmc::hex(data); };

    res.flush_id = batch->flush_id;
    res.nodes = to_flush_data(batch->nodes, encode_node);
    res.nodes_update = to_flush_data(batch->nodes_update, encode_node);
    res.program = to_flush_data(batch->programs, encode_program);
    res.program_update = to_flush_data(batch->programs_update, encode_program);
    res.nodes_state_root = to_string(batch->state_root);
    return res;
}

AckFlushResponse HashDB::ack_flush(const AckFlushRequest& req)
{
    AckFlushResponse res;
    res.result = to_error_code(m_db.ack_flush(req.flush_id));
    res.stored_flush_id = m_db.pipeline().stored_flush_id();
    return res;
}

}  // namespace hashdb
