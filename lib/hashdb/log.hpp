// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace hashdb::loggers
{
enum class level : std::uint32_t
{
    debug,
    info,
    notice,
    warning,
    error,
};
std::ostream& operator<<(std::ostream&, const level&);
std::istream& operator>>(std::istream& is, level& l);

/// Parses a level name.
/// @throws std::invalid_argument for an unknown name.
level parse_level(std::string_view name);

using common_logger = boost::log::sources::severity_logger_mt<level>;
BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

// Replaces the console sink. Records below min_level are dropped.
// Before the first call Boost.Log prints everything with its default sink.
void configure(level min_level);

}  // namespace hashdb::loggers

#define HASHDB_LOG(logger, log_level) BOOST_LOG_SEV(logger, ::hashdb::loggers::level::log_level)
