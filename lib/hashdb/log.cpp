// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace hashdb::loggers
{
BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

namespace
{
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", level)
BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp, "TimeStamp", boost::posix_time::ptime)

using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

std::mutex sink_mutex;
boost::shared_ptr<console_sink> current_sink;
}  // namespace

std::ostream& operator<<(std::ostream& os, const level& l)
{
    switch (l)
    {
    case level::debug:
        os << "debug";
        break;
    case level::info:
        os << "info";
        break;
    case level::notice:
        os << "notice";
        break;
    case level::warning:
        os << "warning";
        break;
    case level::error:
        os << "error";
        break;
    }
    return os;
}

std::istream& operator>>(std::istream& is, level& l)
{
    std::string s;
    if (is >> s)
    {
        try
        {
            l = parse_level(s);
        }
        catch (const std::invalid_argument&)
        {
            is.setstate(std::ios_base::failbit);
        }
    }
    return is;
}

level parse_level(std::string_view name)
{
    if (name == "debug")
        return level::debug;
    if (name == "info")
        return level::info;
    if (name == "notice")
        return level::notice;
    if (name == "warning")
        return level::warning;
    if (name == "error")
        return level::error;
    throw std::invalid_argument("unknown log level: " + std::string{name});
}

void configure(level min_level)
{
    namespace expr = boost::log::expressions;

    std::lock_guard lock{sink_mutex};
    auto core = boost::log::core::get();
    if (current_sink)
        core->remove_sink(current_sink);

    boost::log::add_common_attributes();
    current_sink = boost::log::add_console_log(std::clog,
        boost::log::keywords::format =
            (expr::stream << expr::format_date_time(timestamp, "%Y-%m-%d %H:%M:%S.%f") << " ["
                          << severity << "] " << expr::smessage));
    current_sink->set_filter(severity >= min_level);
}

}  // namespace hashdb::loggers
