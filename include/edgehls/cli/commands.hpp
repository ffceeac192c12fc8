// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <edgehls/core/log.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <expected>

namespace edgehls::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    serve,
    transform,
    fetch
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::string config_file{"edgehls.json"};
    std::optional<std::uint16_t> port;
    std::uint32_t threads{8};
    std::string skip{"YES"};
    std::string target;  // transform: file, fetch: path?query
    std::optional<core::LogLevel> log_level;
    std::string error;   // Set when the arguments are unusable
    bool verbose{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Run the HTTP front end until interrupted
[[nodiscard]] CliResult serve(const CliArgs& args) noexcept;

// Transform a playlist file and print the result
[[nodiscard]] CliResult transform(const CliArgs& args) noexcept;

// Run one GET through the orchestrator against the configured backends
[[nodiscard]] CliResult fetch(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace edgehls::cli
