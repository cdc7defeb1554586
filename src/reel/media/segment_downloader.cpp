// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/segment_downloader.hpp>
#include <reel/core/error.hpp>
#include <reel/core/permit_pool.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/file_writer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <map>
#include <vector>

namespace reel::media {

namespace fs = std::filesystem;

SegmentDownloader::SegmentDownloader(core::FetchClient& client,
                                     core::HeaderMap headers,
                                     std::uint32_t max_concurrency,
                                     core::LoggerPtr logger)
    : client_(client)
    , headers_(std::move(headers))
    , max_concurrency_(std::max<std::uint32_t>(max_concurrency, 1))
    , logger_(core::or_null(std::move(logger))) {}

std::expected<SegmentDownloader::UnitResult, std::error_code>
SegmentDownloader::download_unit(const std::string& uri, const fs::path& dir) {
    const std::string name = core::local_file_name(uri);
    if (name.empty()) {
        return std::unexpected(make_error_code(core::Errc::unresolvable_uri));
    }
    const fs::path path = dir / name;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        return UnitResult::present;
    }
    if (ec) {
        return std::unexpected(disk::errno_to_error_code(ec.value(), disk::DiskErrc::read_error));
    }

    auto bytes = client_.fetch(uri, headers_);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    if (auto write_ec = disk::write_atomic(path, *bytes)) {
        return std::unexpected(write_ec);
    }
    return UnitResult::fetched;
}

std::expected<DownloadStats, std::error_code>
SegmentDownloader::download(const ResolvedPlaylist& playlist, const fs::path& dir) {
    DownloadStats stats;

    auto keys = playlist.key_uris();
    if (!keys) {
        return std::unexpected(keys.error());
    }
    auto uris = playlist.segment_uris();
    if (!uris) {
        return std::unexpected(uris.error());
    }

    // Local name -> the URI that owns it. Keys and segments share the directory.
    std::map<std::string, std::string> owners;
    auto claim = [&](const std::string& uri) -> std::expected<bool, std::error_code> {
        auto name = core::local_file_name(uri);
        if (name.empty()) {
            logger_->error("{} has no file name", uri);
            return std::unexpected(make_error_code(core::Errc::unresolvable_uri));
        }
        auto [it, inserted] = owners.emplace(std::move(name), uri);
        if (!inserted && it->second != uri) {
            logger_->error("{} and {} would both be saved as {}", it->second, uri, it->first);
            return std::unexpected(make_error_code(core::Errc::local_name_collision));
        }
        return inserted;
    };

    for (const auto& key : *keys) {
        auto claimed = claim(key);
        if (!claimed) {
            return std::unexpected(claimed.error());
        }
    }

    // Each URI is fetched once even if the playlist lists it again
    std::vector<std::string> units;
    units.reserve(uris->size());
    for (auto& uri : *uris) {
        auto claimed = claim(uri);
        if (!claimed) {
            return std::unexpected(claimed.error());
        }
        if (*claimed) {
            units.push_back(std::move(uri));
        } else {
            logger_->debug("duplicate segment {} scheduled once", uri);
        }
    }

    // Keys must be on disk before any segment, players decrypt on load
    for (const auto& key : *keys) {
        auto result = download_unit(key, dir);
        if (!result) {
            logger_->error("key {} failed: {}", key, result.error().message());
            return std::unexpected(result.error());
        }
        ++stats.keys;
        logger_->info("key downloaded: {}", core::local_file_name(key));
    }

    stats.total = units.size();
    if (units.empty()) {
        return stats;
    }

    core::PermitPool permits(max_concurrency_);
    std::atomic<std::size_t> completed{0};
    std::atomic<std::size_t> fetched{0};
    std::atomic<std::size_t> skipped{0};

    std::mutex error_mutex;
    std::error_code first_error;

    const auto workers = std::min<std::size_t>(max_concurrency_, units.size());
    boost::asio::thread_pool pool(workers);

    for (const auto& uri : units) {
        boost::asio::post(pool, [&, total = stats.total, uri_ptr = &uri] {
            auto permit = permits.acquire();
            if (!permit) {
                // Batch already failed; not an error of this task
                return;
            }

            auto result = download_unit(*uri_ptr, dir);
            if (!result) {
                {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = result.error();
                    }
                }
                permits.close();
                logger_->error("segment {} failed: {}", *uri_ptr, result.error().message());
                return;
            }

            if (*result == UnitResult::fetched) {
                fetched.fetch_add(1, std::memory_order_relaxed);
            } else {
                skipped.fetch_add(1, std::memory_order_relaxed);
                logger_->debug("segment {} already present", core::local_file_name(*uri_ptr));
            }
            report_progress(completed.fetch_add(1, std::memory_order_acq_rel) + 1, total);
        });
    }

    pool.join();

    if (first_error) {
        return std::unexpected(first_error);
    }

    stats.completed = completed.load();
    stats.fetched = fetched.load();
    stats.skipped = skipped.load();
    logger_->info("segments downloaded: {} fetched, {} already present", stats.fetched, stats.skipped);
    return stats;
}

void SegmentDownloader::report_progress(std::size_t completed, std::size_t total) noexcept {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) {
        callback_(completed, total);
    }
}

} // namespace reel::media
