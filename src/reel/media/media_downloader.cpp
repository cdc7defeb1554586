// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/media_downloader.hpp>
#include <reel/core/download_record.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/media/manifest_writer.hpp>
#include <reel/media/playlist_resolver.hpp>

namespace reel::media {

MediaDownloader::MediaDownloader(core::DownloaderOptions options,
                                 core::FetchClient& client,
                                 core::LoggerPtr logger)
    : options_(std::move(options))
    , client_(client)
    , logger_(core::or_null(std::move(logger))) {}

std::filesystem::path MediaDownloader::index_path() const {
    return options_.save_dir() / options_.index_name();
}

std::error_code MediaDownloader::prepare_directory(const std::string& checksum) {
    const auto& dir = options_.save_dir();

    if (auto ec = disk::ensure_directory(dir)) {
        logger_->error("cannot create {}: {}", dir.string(), ec.message());
        return ec;
    }

    auto record = core::DownloadRecord::load(dir);
    if (record && record->m3u8_sum == checksum) {
        resumed_ = true;
        logger_->info("resuming download in {}", dir.string());
        return {};
    }

    if (!record) {
        logger_->warn("no usable record in {} ({}), starting over", dir.string(), record.error().message());
    } else {
        logger_->warn("playlist changed since last run, clearing {}", dir.string());
    }

    if (auto ec = disk::reset_directory(dir)) {
        logger_->error("cannot clear {}: {}", dir.string(), ec.message());
        return ec;
    }

    core::DownloadRecord fresh{options_.target_str(), options_.headers(), checksum};
    if (auto ec = fresh.save(dir)) {
        logger_->error("cannot save record: {}", ec.message());
        return ec;
    }
    logger_->info("record saved to {}", core::DownloadRecord::record_path(dir).string());
    return {};
}

std::error_code MediaDownloader::download() {
    stats_ = {};
    resumed_ = false;

    PlaylistResolver resolver(client_, options_.headers(), logger_, options_.max_redirects());
    auto playlist = resolver.resolve(options_.target());
    if (!playlist) {
        return playlist.error();
    }

    if (auto ec = prepare_directory(playlist->checksum())) {
        return ec;
    }

    SegmentDownloader segments(client_, options_.headers(), options_.max_concurrency(), logger_);
    segments.callback(callback_);

    auto stats = segments.download(*playlist, options_.save_dir());
    if (!stats) {
        return stats.error();
    }
    stats_ = *stats;

    const auto index = index_path();
    if (auto ec = write_local_manifest(std::move(*playlist), index)) {
        logger_->error("cannot write {}: {}", index.string(), ec.message());
        return ec;
    }
    logger_->info("local playlist written to {}", index.string());
    return {};
}

} // namespace reel::media
