// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/fetch_client.hpp>
#include <reel/core/logging.hpp>
#include <reel/core/url.hpp>
#include <reel/media/hls_parser.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace reel::media {

// A media playlist together with the URL it was finally fetched from and a
// checksum of its raw bytes
class ResolvedPlaylist {
public:
    ResolvedPlaylist(core::Url base_url, HLSMediaPlaylist media, std::string checksum);

    [[nodiscard]] const core::Url& base_url() const noexcept { return base_url_; }
    [[nodiscard]] const HLSMediaPlaylist& media() const noexcept { return media_; }
    [[nodiscard]] const std::string& checksum() const noexcept { return checksum_; }

    // Hand the playlist structure over to its final consumer
    [[nodiscard]] HLSMediaPlaylist release() && noexcept { return std::move(media_); }

    // Absolute http(s) URIs pass through, anything else is resolved against base_url()
    [[nodiscard]] std::expected<std::string, std::error_code>
    resolve_uri(std::string_view uri) const;

    // Distinct key URIs in playlist order, so the first segment's key leads
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code> key_uris() const;

    // Absolute segment URIs in playlist order
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code> segment_uris() const;

private:
    core::Url base_url_;
    HLSMediaPlaylist media_;
    std::string checksum_;
};

// Follows master playlists down to a concrete media playlist
class PlaylistResolver {
public:
    PlaylistResolver(core::FetchClient& client,
                     core::HeaderMap headers,
                     core::LoggerPtr logger = {},
                     std::uint32_t max_redirects = core::MAX_PLAYLIST_REDIRECTS);

    [[nodiscard]] std::expected<ResolvedPlaylist, std::error_code> resolve(const core::Url& start);

    // Highest resolution when every variant declares one, otherwise highest
    // bandwidth. Equal resolutions fall back to bandwidth; full ties keep the
    // earliest variant. nullptr when `variants` is empty.
    [[nodiscard]] static const HLSVariant* select_variant(const std::vector<HLSVariant>& variants) noexcept;

private:
    core::FetchClient& client_;
    core::HeaderMap headers_;
    core::LoggerPtr logger_;
    std::uint32_t max_redirects_;
};

} // namespace reel::media
