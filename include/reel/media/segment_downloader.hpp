// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/fetch_client.hpp>
#include <reel/core/logging.hpp>
#include <reel/media/playlist_resolver.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace reel::media {

// Outcome of one segment batch
struct DownloadStats {
    std::size_t keys{0};          // Key files fetched or already present
    std::size_t total{0};         // Distinct segment files scheduled
    std::size_t completed{0};     // fetched + skipped
    std::size_t fetched{0};
    std::size_t skipped{0};       // Already on disk
};

// Called from worker threads, one call at a time, after each finished segment
using SegmentProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

// Materializes every key and segment of a playlist as files in one directory
class SegmentDownloader {
public:
    enum class UnitResult { fetched, present };

    SegmentDownloader(core::FetchClient& client,
                      core::HeaderMap headers,
                      std::uint32_t max_concurrency = core::DEFAULT_CONCURRENCY,
                      core::LoggerPtr logger = {});

    // Non-copyable
    SegmentDownloader(const SegmentDownloader&) = delete;
    SegmentDownloader& operator=(const SegmentDownloader&) = delete;

    void callback(SegmentProgressCallback cb) noexcept { callback_ = std::move(cb); }

    // Keys first and serially, then segments with at most max_concurrency
    // fetches in flight. The first failure stops new work; the error is
    // returned once every started task has finished.
    [[nodiscard]] std::expected<DownloadStats, std::error_code>
    download(const ResolvedPlaylist& playlist, const std::filesystem::path& dir);

    // Fetch `uri` into dir/basename(uri) unless that file already exists
    [[nodiscard]] std::expected<UnitResult, std::error_code>
    download_unit(const std::string& uri, const std::filesystem::path& dir);

private:
    void report_progress(std::size_t completed, std::size_t total) noexcept;

    core::FetchClient& client_;
    core::HeaderMap headers_;
    std::uint32_t max_concurrency_;
    core::LoggerPtr logger_;

    SegmentProgressCallback callback_;
    std::mutex callback_mutex_;  // Serializes callback_ invocations
};

} // namespace reel::media
