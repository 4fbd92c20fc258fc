// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <hashdb/hashdb.hpp>
#include <nlohmann/json.hpp>

namespace hashdb
{
namespace json = nlohmann;

/// Decodes a request member. Throws nlohmann::json::exception or std::invalid_argument
/// for malformed input.
template <typename T>
T from_json(const json::json& j) = delete;

template <>
uint64_t from_json<uint64_t>(const json::json& j);
template <>
Fea from_json<Fea>(const json::json& j);
template <>
bytes from_json<bytes>(const json::json& j);
template <>
SetRequest from_json<SetRequest>(const json::json& j);
template <>
GetRequest from_json<GetRequest>(const json::json& j);
template <>
SetProgramRequest from_json<SetProgramRequest>(const json::json& j);
template <>
GetProgramRequest from_json<GetProgramRequest>(const json::json& j);
template <>
LoadDBRequest from_json<LoadDBRequest>(const json::json& j);
template <>
LoadProgramDBRequest from_json<LoadProgramDBRequest>(const json::json& j);
template <>
GetFlushDataRequest from_json<GetFlushDataRequest>(const json::json& j);
template <>
AckFlushRequest from_json<AckFlushRequest>(const json::json& j);

/// Encodes a Fea as the {fe0, fe1, fe2, fe3} object.
json::json to_json(const Fea& f);

json::json to_json(const SetResponse& r);
json::json to_json(const GetResponse& r);
json::json to_json(const SetProgramResponse& r);
json::json to_json(const GetProgramResponse& r);
json::json to_json(const LoadDBResponse& r);
json::json to_json(const LoadProgramDBResponse& r);
json::json to_json(const FlushResponse& r);
json::json to_json(const GetFlushStatusResponse& r);
json::json to_json(const GetFlushDataResponse& r);
json::json to_json(const AckFlushResponse& r);

/// Executes the request selected by its "op" member and returns the encoded response.
///
/// @throws std::invalid_argument for an unknown operation, nlohmann::json::exception or
///         std::invalid_argument for malformed members.
json::json execute(HashDB& db, const json::json& request);

}  // namespace hashdb
