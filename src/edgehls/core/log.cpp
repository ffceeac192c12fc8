// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/core/log.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace edgehls::core {

namespace {

namespace logging = boost::log;
namespace trivial = boost::log::trivial;
namespace expr = boost::log::expressions;
namespace kw = boost::log::keywords;

trivial::severity_level to_severity(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::trace:   return trivial::trace;
        case LogLevel::debug:   return trivial::debug;
        case LogLevel::info:    return trivial::info;
        case LogLevel::warning: return trivial::warning;
        case LogLevel::error:   return trivial::error;
    }
    return trivial::info;
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warning" || lower == "warn") return LogLevel::warning;
    if (lower == "error") return LogLevel::error;
    return std::nullopt;
}

LogLevel log_level_from_env() noexcept {
    const char* env = std::getenv("EDGEHLS_LOG_LEVEL");
    if (!env) {
        return LogLevel::info;
    }
    return parse_log_level(env).value_or(LogLevel::info);
}

void init_logging(LogLevel level, const std::string& log_file) {
    auto format = expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << "] [" << trivial::severity << "] " << expr::smessage;

    logging::add_console_log(std::clog, kw::format = format);

    if (!log_file.empty()) {
        logging::add_file_log(kw::file_name = log_file,
                              kw::rotation_size = 10 * 1024 * 1024,
                              kw::auto_flush = true,
                              kw::open_mode = std::ios_base::app,
                              kw::format = format);
    }

    logging::add_common_attributes();
    set_log_level(level);
}

void set_log_level(LogLevel level) {
    logging::core::get()->set_filter(trivial::severity >= to_severity(level));
}

void flush_logs() {
    logging::core::get()->flush();
}

} // namespace edgehls::core
