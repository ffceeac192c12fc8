// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/cli/commands.hpp>
#include <edgehls/core/log.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace edgehls::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void edgehls_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    edgehls::core::flush_logs();
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(edgehls_terminate_handler);
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    auto level = args.log_level.value_or(
        args.verbose ? edgehls::core::LogLevel::debug : edgehls::core::log_level_from_env());
    edgehls::core::init_logging(level);

    CliResult result = 0;
    switch (args.command) {
        case Command::serve:
            result = serve(args);
            break;
        case Command::transform:
            result = transform(args);
            break;
        case Command::fetch:
            result = fetch(args);
            break;
        case Command::none:
            std::cerr << "Error: No command specified" << std::endl;
            std::cout << "Use -h for help" << std::endl;
            return 1;
    }

    edgehls::core::flush_logs();
    return result ? *result : 1;
}
