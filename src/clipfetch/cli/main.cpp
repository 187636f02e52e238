// Copyright (c) 2026 changcheng967. All rights reserved.

#include <clipfetch/cli/commands.hpp>
#include <clipfetch/core/curl_transport.hpp>
#include <clipfetch/core/log.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace clipfetch::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void clipfetch_terminate_handler() {
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
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(clipfetch_terminate_handler);

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
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }

    clipfetch::core::LogConfig log_config;
    if (args.verbose) {
        log_config.level = spdlog::level::debug;
    } else if (args.quiet) {
        log_config.level = spdlog::level::err;
    } else {
        log_config.level = spdlog::level::warn;
    }
    clipfetch::core::init_logging(log_config);

    clipfetch::core::CurlGlobal curl;

    CliResult result;
    switch (args.command) {
        case Command::download: result = download(args); break;
        case Command::info:     result = info(args); break;
        case Command::remove:   result = remove(args); break;
        case Command::status:   result = status(args); break;
        case Command::wipe:     result = wipe(args); break;
    }

    return result ? *result : 1;
}
