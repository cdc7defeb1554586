// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/error.hpp>
#include <reel/media/media_downloader.hpp>
#include <reel/media/media_tool.hpp>
#include <reel/version.hpp>
#include <charconv>
#include <iostream>

namespace reel::cli {

//=============================================================================
// Argument parsing
//=============================================================================

std::expected<CliArgs, std::string> parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view flag) -> std::expected<std::string, std::string> {
        if (i + 1 >= argc) {
            return std::unexpected("missing value for " + std::string(flag));
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-p" || arg == "--play") {
            args.play = true;
        } else if (arg == "-D" || arg == "--dir") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            args.output_dir = std::move(*value);
        } else if (arg == "-H" || arg == "--header") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            args.headers.push_back(std::move(*value));
        } else if (arg == "-m" || arg == "--merge") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            args.merge_output = std::move(*value);
        } else if (arg == "-n" || arg == "--concurrency") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            std::uint32_t n = 0;
            auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), n);
            if (ec != std::errc{} || end != value->data() + value->size() || n == 0) {
                return std::unexpected("invalid concurrency: " + *value);
            }
            args.concurrency = n;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return std::unexpected("unknown option: " + std::string(arg));
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            return std::unexpected("unexpected argument: " + std::string(arg));
        }
    }

    if (args.url.empty()) {
        return std::unexpected(std::string("no URL specified"));
    }
    if (args.output_dir.empty()) {
        return std::unexpected(std::string("no output directory specified (-D)"));
    }
    return args;
}

std::expected<core::DownloaderOptions, std::error_code> build_options(const CliArgs& args) {
    auto options = core::DownloaderOptions::create(args.url);
    if (!options) {
        return std::unexpected(options.error());
    }

    for (const auto& line : args.headers) {
        auto header = core::parse_header_line(line);
        if (!header) {
            return std::unexpected(header.error());
        }
        if (auto added = options->add_header(header->first, header->second); !added) {
            return std::unexpected(added.error());
        }
    }

    if (args.concurrency > 0) {
        if (auto set = options->max_concurrency(args.concurrency); !set) {
            return std::unexpected(set.error());
        }
    }

    options->save_dir(args.output_dir);
    return options;
}

//=============================================================================
// Commands
//=============================================================================

CliResult run(const CliArgs& args, core::FetchClient& client, core::LoggerPtr logger) {
    logger = core::or_null(std::move(logger));

    auto options = build_options(args);
    if (!options) {
        logger->error("invalid arguments: {}", options.error().message());
        return std::unexpected(options.error());
    }

    media::MediaDownloader downloader(std::move(*options), client, logger);

    ProgressBar bar(0, "Downloading");
    if (!args.quiet) {
        downloader.callback([&bar](std::size_t completed, std::size_t total) {
            bar.total(total);
            bar.update(completed);
        });
    }

    if (auto ec = downloader.download()) {
        if (!args.quiet) bar.clear();
        logger->error("download failed: {}", ec.message());
        return std::unexpected(ec);
    }
    if (!args.quiet && downloader.stats().total > 0) {
        bar.finish();
    }

    const auto& stats = downloader.stats();
    logger->info("{} segments ready ({} fetched, {} reused){}", stats.completed, stats.fetched,
                 stats.skipped, downloader.resumed() ? ", resumed" : "");

    auto tool = media::MediaTool::from_index(downloader.index_path());
    if (!tool) {
        logger->error("invalid index path {}: {}", downloader.index_path().string(), tool.error().message());
        return std::unexpected(tool.error());
    }
    tool->verbose(args.verbose);

    if (args.play) {
        if (auto played = tool->play(); !played) {
            logger->error("player exited with status {}: {}", played.error().exit_status, played.error().output);
            return std::unexpected(played.error().code);
        }
    }

    if (!args.merge_output.empty()) {
        if (auto merged = tool->merge_to(args.merge_output); !merged) {
            logger->error("ffmpeg exited with status {}: {}", merged.error().exit_status, merged.error().output);
            return std::unexpected(merged.error().code);
        }
        logger->info("merged into {}", args.merge_output);

        if (auto ec = tool->clean_segments()) {
            logger->error("cannot remove segment files: {}", ec.message());
            return std::unexpected(ec);
        }
    }

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "reel " << reel::version.to_string() << " - resumable HLS downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] -D <DIR> <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -D, --dir <DIR>          Save segments and index.m3u8 to DIR\n";
    std::cout << "  -H, --header <H>         Extra request header \"Name: value\" (repeatable)\n";
    std::cout << "  -n, --concurrency <N>    Parallel segment downloads (default: 10)\n";
    std::cout << "  -m, --merge <FILE>       Merge into FILE with ffmpeg, then delete segments\n";
    std::cout << "  -p, --play               Play the download with mpv or ffplay\n";
    std::cout << "  -v, --verbose            Debug logging, show external tool output\n";
    std::cout << "  -q, --quiet              Warnings only, no progress bar\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "      --version            Show version information\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -D show https://example.com/live/master.m3u8\n";
    std::cout << "  " << program_name << " -D show -H \"Referer: https://example.com\" -m show.mp4 <URL>\n";
    std::cout << "\n";
    std::cout << "Re-running the same command resumes an interrupted download.\n";
}

void print_version() noexcept {
    std::cout << "reel " << reel::version.to_string() << std::endl;
    std::cout << "Built " << reel::BUILD_DATE << " with C++23, libcurl, Boost.Asio, spdlog\n";
}

} // namespace reel::cli
