// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/fetch_client.hpp>
#include <reel/core/logging.hpp>
#include <reel/core/options.hpp>
#include <reel/media/segment_downloader.hpp>
#include <filesystem>
#include <system_error>

namespace reel::media {

// Downloads one HLS stream into a save directory and leaves a local
// index next to the segments. Re-running against an unchanged remote
// playlist reuses every file already on disk.
class MediaDownloader {
public:
    MediaDownloader(core::DownloaderOptions options,
                    core::FetchClient& client,
                    core::LoggerPtr logger = {});

    // Non-copyable
    MediaDownloader(const MediaDownloader&) = delete;
    MediaDownloader& operator=(const MediaDownloader&) = delete;

    // Resolve, check the record, fetch missing files, write the local index
    [[nodiscard]] std::error_code download();

    // Set progress callback
    void callback(SegmentProgressCallback cb) noexcept { callback_ = std::move(cb); }

    [[nodiscard]] const core::DownloaderOptions& options() const noexcept { return options_; }
    [[nodiscard]] std::filesystem::path index_path() const;

    // Statistics of the last successful segment batch
    [[nodiscard]] const DownloadStats& stats() const noexcept { return stats_; }

    // True when the last run reused an existing save directory
    [[nodiscard]] bool resumed() const noexcept { return resumed_; }

private:
    // Keep the directory if its record matches `checksum`, otherwise wipe it
    // and write a fresh record
    [[nodiscard]] std::error_code prepare_directory(const std::string& checksum);

    core::DownloaderOptions options_;
    core::FetchClient& client_;
    core::LoggerPtr logger_;

    SegmentProgressCallback callback_;
    DownloadStats stats_;
    bool resumed_{false};
};

} // namespace reel::media
