// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/cli/commands.hpp>
#include <haul/core/log.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace haul::cli;

// Terminate handler to catch exceptions in noexcept functions
static void haul_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

extern "C" void haul_sigint_handler(int) {
    interrupt();
}

int main(int argc, char* argv[]) {
    std::set_terminate(haul_terminate_handler);

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
        return 2;
    }
    if (args.urls.empty() && args.manifest_file.empty()) {
        std::cerr << "Error: No URL or manifest specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    auto config = resolve_config(args);
    if (!config) {
        return 2;
    }

    haul::core::set_log_level(config->log_level);
    if (args.verbose) {
        haul::core::set_log_level("debug");
    } else if (args.quiet) {
        haul::core::set_log_level("warn");
    }

    // Handle info mode
    if (args.info) {
        int exit_code = 0;
        for (const auto& url : args.urls) {
            if (!info(url, *config)) {
                exit_code = 1;
            }
        }
        return exit_code;
    }

    auto refs = resolve_refs(args);
    if (!refs) {
        return 2;
    }

    std::signal(SIGINT, haul_sigint_handler);
    std::signal(SIGTERM, haul_sigint_handler);

    auto result = download(*refs, *config, args.quiet);
    if (!result) {
        return 1;
    }
    return *result;
}
