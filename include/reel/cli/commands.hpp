// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/fetch_client.hpp>
#include <reel/core/logging.hpp>
#include <reel/core/options.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace reel::cli {

// CLI result: process exit code, or the error that ended the run
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_dir;
    std::vector<std::string> headers;   // Raw "Name: value" strings
    std::string merge_output;           // -m, empty when not merging
    std::uint32_t concurrency{0};       // 0 keeps the default
    bool play{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments; the error is a message for the user
[[nodiscard]] std::expected<CliArgs, std::string> parse_args(int argc, char* argv[]);

// Validated downloader options for parsed arguments
[[nodiscard]] std::expected<core::DownloaderOptions, std::error_code>
build_options(const CliArgs& args);

// Download, then play and/or merge as requested
[[nodiscard]] CliResult run(const CliArgs& args, core::FetchClient& client, core::LoggerPtr logger);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli
