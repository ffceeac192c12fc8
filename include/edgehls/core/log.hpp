// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <boost/log/trivial.hpp>
#include <optional>
#include <string>
#include <string_view>

/*
 * Thin wrapper around the Boost.Log trivial logger.
 *
 * init_logging() installs a console sink on stderr (and optionally a file
 * sink) and sets the severity filter. Before it runs, records go to the
 * Boost.Log default sink.
 */

#define EDGEHLS_FILENAME \
    (__builtin_strrchr(__FILE__, '/') ? __builtin_strrchr(__FILE__, '/') + 1 : __FILE__)

#define EDGEHLS_TRACE_BACK "[" << EDGEHLS_FILENAME << ":" << __LINE__ << "] "

#define EDGEHLS_LOG_TRACE   BOOST_LOG_TRIVIAL(trace) << EDGEHLS_TRACE_BACK
#define EDGEHLS_LOG_DEBUG   BOOST_LOG_TRIVIAL(debug)
#define EDGEHLS_LOG_INFO    BOOST_LOG_TRIVIAL(info)
#define EDGEHLS_LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define EDGEHLS_LOG_ERROR   BOOST_LOG_TRIVIAL(error) << EDGEHLS_TRACE_BACK

namespace edgehls::core {

enum class LogLevel {
    trace,
    debug,
    info,
    warning,
    error,
};

// Parse "trace", "debug", "info", "warning"/"warn", "error"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// Level from EDGEHLS_LOG_LEVEL, info when unset or unparsable
[[nodiscard]] LogLevel log_level_from_env() noexcept;

void init_logging(LogLevel level, const std::string& log_file = {});

void set_log_level(LogLevel level);

void flush_logs();

} // namespace edgehls::core
