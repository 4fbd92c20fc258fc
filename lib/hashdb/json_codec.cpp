// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "json_codec.hpp"
#include <evmc/hex.hpp>

namespace hashdb
{
using evmc::from_hex;

namespace
{
template <typename T>
void load_if_exists(const json::json& j, std::string_view key, T& out)
{
    if (const auto it = j.find(key); it != j.end())
        out = from_json<T>(*it);
}

void load_flag(const json::json& j, std::string_view key, bool& out)
{
    if (const auto it = j.find(key); it != j.end())
        out = it->get<bool>();
}

json::json to_json(const std::vector<Children>& siblings)
{
    auto j = json::json::object();
    for (size_t level = 0; level < siblings.size(); ++level)
        j[std::to_string(level)] = siblings[level];
    return j;
}

json::json to_json(const DbReadLog& log)
{
    auto j = json::json::object();
    for (const auto& [key, limbs] : log)
        j[key] = limbs;
    return j;
}

json::json to_json(const std::vector<FlushData>& list)
{
    auto j = json::json::array();
    for (const auto& d : list)
        j.push_back({{"key", d.key}, {"value", d.value}});
    return j;
}

json::json result(ErrorCode code)
{
    return {{"result", wire_code(code)}};
}
}  // namespace

template <>
uint64_t from_json<uint64_t>(const json::json& j)
{
    if (j.is_number_unsigned())
        return j.get<uint64_t>();
    if (j.is_number_integer() && j.get<int64_t>() >= 0)
        return static_cast<uint64_t>(j.get<int64_t>());
    if (!j.is_string())
        throw std::invalid_argument("from_json<uint64_t>: must be integer or string of integer");

    // Accept the string form the protobuf JSON mapping uses for 64-bit numbers.
    return intx::from_string<uint64_t>(j.get<std::string>());
}

template <>
Fea from_json<Fea>(const json::json& j)
{
    if (j.is_string())
    {
        const auto s = j.get<std::string>();
        const auto f = from_string(s);
        if (!f)
            throw std::invalid_argument("invalid hash: " + s);
        return *f;
    }

    Fea f;
    load_if_exists(j, "fe0", f.fe[0]);
    load_if_exists(j, "fe1", f.fe[1]);
    load_if_exists(j, "fe2", f.fe[2]);
    load_if_exists(j, "fe3", f.fe[3]);
    return f;
}

template <>
bytes from_json<bytes>(const json::json& j)
{
    const auto s = j.get<std::string>();
    auto data = from_hex(s);
    if (!data)
        throw std::invalid_argument("invalid hex: " + s);
    return std::move(*data);
}

template <>
SetRequest from_json<SetRequest>(const json::json& j)
{
    SetRequest r;
    load_if_exists(j, "old_root", r.old_root);
    r.key = from_json<Fea>(j.at("key"));
    r.value = j.at("value").get<std::string>();
    load_flag(j, "persistent", r.persistent);
    load_flag(j, "details", r.details);
    load_flag(j, "get_db_read_log", r.get_db_read_log);
    return r;
}

template <>
GetRequest from_json<GetRequest>(const json::json& j)
{
    GetRequest r;
    load_if_exists(j, "root", r.root);
    r.key = from_json<Fea>(j.at("key"));
    load_flag(j, "details", r.details);
    load_flag(j, "get_db_read_log", r.get_db_read_log);
    return r;
}

template <>
SetProgramRequest from_json<SetProgramRequest>(const json::json& j)
{
    SetProgramRequest r;
    r.key = from_json<Fea>(j.at("key"));
    r.data = from_json<bytes>(j.at("data"));
    load_flag(j, "persistent", r.persistent);
    return r;
}

template <>
GetProgramRequest from_json<GetProgramRequest>(const json::json& j)
{
    return {from_json<Fea>(j.at("key"))};
}

template <>
LoadDBRequest from_json<LoadDBRequest>(const json::json& j)
{
    LoadDBRequest r;
    for (const auto& [key, limbs] : j.at("input_db").items())
    {
        auto& out = r.input_db[key];
        for (const auto& limb : limbs)
            out.push_back(from_json<uint64_t>(limb));
    }
    load_flag(j, "persistent", r.persistent);
    return r;
}

template <>
LoadProgramDBRequest from_json<LoadProgramDBRequest>(const json::json& j)
{
    LoadProgramDBRequest r;
    for (const auto& [key, data] : j.at("input_program_db").items())
        r.input_program_db[key] = from_json<bytes>(data);
    load_flag(j, "persistent", r.persistent);
    return r;
}

template <>
GetFlushDataRequest from_json<GetFlushDataRequest>(const json::json& j)
{
    GetFlushDataRequest r;
    load_if_exists(j, "flush_id", r.flush_id);
    return r;
}

template <>
AckFlushRequest from_json<AckFlushRequest>(const json::json& j)
{
    return {from_json<uint64_t>(j.at("flush_id"))};
}

json::json to_json(const Fea& f)
{
    return {{"fe0", f.fe[0]}, {"fe1", f.fe[1]}, {"fe2", f.fe[2]}, {"fe3", f.fe[3]}};
}

json::json to_json(const SetResponse& r)
{
    auto j = result(r.result);
    if (r.result != SUCCESS)
        return j;

    j["old_root"] = to_json(r.old_root);
    j["new_root"] = to_json(r.new_root);
    j["key"] = to_json(r.key);
    if (!r.mode.empty())
    {
        j["siblings"] = to_json(r.siblings);
        j["ins_key"] = to_json(r.ins_key);
        j["ins_value"] = r.ins_value;
        j["is_old0"] = r.is_old0;
        j["old_value"] = r.old_value;
        j["new_value"] = r.new_value;
        j["mode"] = r.mode;
        j["proof_hash_counter"] = r.proof_hash_counter;
    }
    if (!r.db_read_log.empty())
        j["db_read_log"] = to_json(r.db_read_log);
    return j;
}

json::json to_json(const GetResponse& r)
{
    auto j = result(r.result);
    if (r.result != SUCCESS)
        return j;

    j["root"] = to_json(r.root);
    j["key"] = to_json(r.key);
    j["value"] = r.value;
    if (r.details)
    {
        j["siblings"] = to_json(r.siblings);
        j["ins_key"] = to_json(r.ins_key);
        j["ins_value"] = r.ins_value;
        j["is_old0"] = r.is_old0;
        j["proof_hash_counter"] = r.proof_hash_counter;
    }
    if (!r.db_read_log.empty())
        j["db_read_log"] = to_json(r.db_read_log);
    return j;
}

json::json to_json(const SetProgramResponse& r)
{
    return result(r.result);
}

json::json to_json(const GetProgramResponse& r)
{
    auto j = result(r.result);
    if (r.result == SUCCESS)
        j["data"] = evmc::hex(r.data);
    return j;
}

json::json to_json(const LoadDBResponse& r)
{
    return result(r.result);
}

json::json to_json(const LoadProgramDBResponse& r)
{
    return result(r.result);
}

json::json to_json(const FlushResponse& r)
{
    auto j = result(r.result);
    j["flush_id"] = r.flush_id;
    j["stored_flush_id"] = r.stored_flush_id;
    return j;
}

json::json to_json(const GetFlushStatusResponse& r)
{
    return {
        {"stored_flush_id", r.stored_flush_id},
        {"storing_flush_id", r.storing_flush_id},
        {"last_flush_id", r.last_flush_id},
        {"pending_to_flush_nodes", r.pending_to_flush_nodes},
        {"pending_to_flush_program", r.pending_to_flush_program},
        {"storing_nodes", r.storing_nodes},
        {"storing_program", r.storing_program},
        {"prover_id", r.prover_id},
    };
}

json::json to_json(const GetFlushDataResponse& r)
{
    auto j = result(r.result);
    j["stored_flush_id"] = r.stored_flush_id;
    if (r.result != SUCCESS)
        return j;

    j["flush_id"] = r.flush_id;
    j["nodes"] = to_json(r.nodes);
    j["nodes_update"] = to_json(r.nodes_update);
    j["program"] = to_json(r.program);
    j["program_update"] = to_json(r.program_update);
    j["nodes_state_root"] = r.nodes_state_root;
    return j;
}

json::json to_json(const AckFlushResponse& r)
{
    auto j = result(r.result);
    j["stored_flush_id"] = r.stored_flush_id;
    return j;
}

json::json execute(HashDB& db, const json::json& request)
{
    const auto op = request.at("op").get<std::string>();
    if (op == "set")
        return to_json(db.set(from_json<SetRequest>(request)));
    if (op == "get")
        return to_json(db.get(from_json<GetRequest>(request)));
    if (op == "set_program")
        return to_json(db.set_program(from_json<SetProgramRequest>(request)));
    if (op == "get_program")
        return to_json(db.get_program(from_json<GetProgramRequest>(request)));
    if (op == "load_db")
        return to_json(db.load_db(from_json<LoadDBRequest>(request)));
    if (op == "load_program_db")
        return to_json(db.load_program_db(from_json<LoadProgramDBRequest>(request)));
    if (op == "flush")
        return to_json(db.flush());
    if (op == "get_flush_status")
        return to_json(db.get_flush_status());
    if (op == "get_flush_data")
        return to_json(db.get_flush_data(from_json<GetFlushDataRequest>(request)));
    if (op == "ack_flush")
        return to_json(db.ack_flush(from_json<AckFlushRequest>(request)));
    throw std::invalid_argument("unknown operation: " + op);
}

}  // namespace hashdb
