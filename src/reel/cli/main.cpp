// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/logging.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace reel::cli;

// Terminate handler to report exceptions that escape noexcept functions
static void reel_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(reel_terminate_handler);

    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "Error: " << args.error() << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    if (args->help) {
        print_help(argv[0]);
        return 0;
    }
    if (args->version) {
        print_version();
        return 0;
    }

    auto level = args->verbose ? spdlog::level::debug
               : args->quiet   ? spdlog::level::warn
                               : spdlog::level::info;
    auto logger = reel::core::make_console_logger("reel", level);

    if (!reel::core::HttpSession::global_init()) {
        logger->critical("libcurl initialization failed");
        return 1;
    }

    reel::core::HttpSession session;
    auto result = run(*args, session, logger);

    reel::core::HttpSession::global_cleanup();
    return result ? *result : 1;
}
