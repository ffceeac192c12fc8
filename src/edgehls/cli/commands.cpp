// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/cli/commands.hpp>
#include <edgehls/core/edge_config.hpp>
#include <edgehls/core/http_session.hpp>
#include <edgehls/delta/renderer.hpp>
#include <edgehls/edge/cache.hpp>
#include <edgehls/edge/fetcher.hpp>
#include <edgehls/edge/http_server.hpp>
#include <edgehls/edge/orchestrator.hpp>
#include <edgehls/version.hpp>
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace edgehls::core;

namespace edgehls::cli {

namespace {

template<typename T>
bool parse_number(std::string_view text, T& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

std::expected<EdgeConfig, std::error_code> load_config(const CliArgs& args) {
    auto config = EdgeConfig::load(args.config_file);
    if (!config) {
        std::cerr << "Error: " << args.config_file << ": " << config.error().message() << std::endl;
        return config;
    }
    if (auto ec = config->apply_env()) {
        std::cerr << "Error: environment override: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }
    if (args.port) {
        config->listen_port = *args.port;
    }
    return config;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value = [&](int& i, std::string_view arg) -> std::optional<std::string_view> {
        if (i + 1 < argc) {
            return std::string_view(argv[++i]);
        }
        args.error = "missing value for " + std::string(arg);
        return std::nullopt;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--log-level") {
            if (auto v = value(i, arg)) {
                args.log_level = parse_log_level(*v);
                if (!args.log_level) {
                    args.error = "unknown log level " + std::string(*v);
                }
            }
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value(i, arg)) {
                args.config_file = std::string(*v);
            }
        } else if (arg == "-p" || arg == "--port") {
            if (auto v = value(i, arg)) {
                std::uint16_t port = 0;
                if (!parse_number(*v, port) || port == 0) {
                    args.error = "invalid port " + std::string(*v);
                } else {
                    args.port = port;
                }
            }
        } else if (arg == "-t" || arg == "--threads") {
            if (auto v = value(i, arg)) {
                if (!parse_number(*v, args.threads) || args.threads == 0) {
                    args.error = "invalid thread count " + std::string(*v);
                }
            }
        } else if (arg == "-s" || arg == "--skip") {
            if (auto v = value(i, arg)) {
                args.skip = std::string(*v);
            }
        } else if (args.command == Command::none) {
            if (arg == "serve") {
                args.command = Command::serve;
            } else if (arg == "transform") {
                args.command = Command::transform;
            } else if (arg == "fetch") {
                args.command = Command::fetch;
            } else {
                args.error = "unknown command " + std::string(arg);
            }
        } else if (args.target.empty()) {
            args.target = std::string(arg);
        } else {
            args.error = "unexpected argument " + std::string(arg);
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult serve(const CliArgs& args) noexcept {
    auto config = load_config(args);
    if (!config) {
        return std::unexpected(config.error());
    }

    HttpSession::global_init();

    edge::MemoryCache cache(std::chrono::seconds(config->cache.stale_if_error), config->cache.max_entries);
    edge::CurlPlaylistFetcher fetcher(*config);
    edge::Orchestrator orchestrator(*config, fetcher, cache);

    try {
        edge::HttpServer server(orchestrator, args.threads);
        if (auto ec = server.listen(config->listen_port)) {
            std::cerr << "Error: cannot listen on port " << config->listen_port << ": "
                      << ec.message() << std::endl;
            HttpSession::global_cleanup();
            return std::unexpected(ec);
        }

        EDGEHLS_LOG_INFO << "edgehls " << version.to_string() << " serving " << config->backends.size()
                         << " backend(s), default " << config->default_backend;
        server.run();
    } catch (const std::exception& e) {
        EDGEHLS_LOG_ERROR << "server stopped: " << e.what();
        HttpSession::global_cleanup();
        return 1;
    }

    HttpSession::global_cleanup();
    return 0;
}

CliResult transform(const CliArgs& args) noexcept {
    if (args.target.empty()) {
        std::cerr << "Error: No playlist file specified" << std::endl;
        return 1;
    }

    const auto mode = delta::parse_skip_mode(args.skip);
    if (mode == delta::SkipMode::none) {
        std::cerr << "Error: --skip must be YES or v2" << std::endl;
        return 1;
    }

    std::ifstream file(args.target, std::ios::binary);
    if (!file) {
        std::cerr << "Error: cannot open " << args.target << std::endl;
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto outcome = delta::transform(ss.str(), mode);
    std::cout << outcome.body << std::flush;

    if (outcome.is_delta()) {
        std::cerr << "delta: skipped " << outcome.skipped_segments << " segment(s)" << std::endl;
    } else {
        std::cerr << "fallback: " << outcome.reason.message() << std::endl;
    }
    return 0;
}

CliResult fetch(const CliArgs& args) noexcept {
    if (args.target.empty()) {
        std::cerr << "Error: No request path specified" << std::endl;
        return 1;
    }

    auto config = load_config(args);
    if (!config) {
        return std::unexpected(config.error());
    }

    HttpSession::global_init();

    edge::MemoryCache cache(std::chrono::seconds(config->cache.stale_if_error), config->cache.max_entries);
    edge::CurlPlaylistFetcher fetcher(*config);
    edge::Orchestrator orchestrator(*config, fetcher, cache);

    auto response = orchestrator.handle(edge::EdgeRequest::from_target("GET", args.target));

    HttpSession::global_cleanup();

    std::cout << "Status: " << response.status << "\n";
    for (const auto& [name, value] : response.headers) {
        std::cout << name << ": " << value << "\n";
    }
    std::cout << "\n" << response.body << std::flush;

    return response.status >= 200 && response.status < 300 ? 0 : 1;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "edgehls " << program_name << " - LL-HLS delta update edge\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARG]\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  serve                   Run the HTTP front end\n";
    std::cout << "  transform <FILE>        Print the delta update of a local playlist\n";
    std::cout << "  fetch <PATH?QUERY>      Run one request against the configured backends\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "      --log-level <LVL>   trace, debug, info, warning or error\n";
    std::cout << "  -c, --config <FILE>     JSON configuration (default: edgehls.json)\n";
    std::cout << "  -p, --port <PORT>       Listen port, overrides the configuration\n";
    std::cout << "  -t, --threads <N>       Server worker threads (default: 8)\n";
    std::cout << "  -s, --skip <YES|v2>     Skip mode for transform (default: YES)\n";
    std::cout << "\n";
    std::cout << "ENVIRONMENT:\n";
    std::cout << "  EDGEHLS_BACKEND_<NAME>  Replace the URL of backend <name>\n";
    std::cout << "  EDGEHLS_LISTEN_PORT     Listen port\n";
    std::cout << "  EDGEHLS_LOG_LEVEL       Log level when --log-level is not given\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -c edge.json serve\n";
    std::cout << "  " << program_name << " -s v2 transform live.m3u8\n";
    std::cout << "  " << program_name << " -c edge.json fetch '/live/index.m3u8?_HLS_skip=YES'\n";
}

void print_version() noexcept {
    std::cout << "edgehls " << edgehls::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << " with C++23, Boost, libcurl\n";
}

} // namespace edgehls::cli
