// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/playlist_resolver.hpp>
#include <reel/core/checksum.hpp>
#include <reel/core/error.hpp>
#include <algorithm>
#include <set>

namespace reel::media {

//=============================================================================
// ResolvedPlaylist
//=============================================================================

ResolvedPlaylist::ResolvedPlaylist(core::Url base_url, HLSMediaPlaylist media, std::string checksum)
    : base_url_(std::move(base_url))
    , media_(std::move(media))
    , checksum_(std::move(checksum)) {}

std::expected<std::string, std::error_code>
ResolvedPlaylist::resolve_uri(std::string_view uri) const {
    if (core::is_absolute_http(uri)) {
        return std::string(uri);
    }
    auto resolved = base_url_.resolve(uri);
    if (!resolved) {
        return std::unexpected(make_error_code(core::Errc::unresolvable_uri));
    }
    return resolved->full();
}

std::expected<std::vector<std::string>, std::error_code> ResolvedPlaylist::key_uris() const {
    std::vector<std::string> uris;
    std::set<std::string> seen;

    for (const auto& segment : media_.segments) {
        if (!segment.key || !segment.key->uri || segment.key->method == "NONE") {
            continue;
        }
        auto uri = resolve_uri(*segment.key->uri);
        if (!uri) {
            return std::unexpected(uri.error());
        }
        if (seen.insert(*uri).second) {
            uris.push_back(std::move(*uri));
        }
    }
    return uris;
}

std::expected<std::vector<std::string>, std::error_code> ResolvedPlaylist::segment_uris() const {
    std::vector<std::string> uris;
    uris.reserve(media_.segments.size());

    for (const auto& segment : media_.segments) {
        auto uri = resolve_uri(segment.uri);
        if (!uri) {
            return std::unexpected(uri.error());
        }
        uris.push_back(std::move(*uri));
    }
    return uris;
}

//=============================================================================
// PlaylistResolver
//=============================================================================

PlaylistResolver::PlaylistResolver(core::FetchClient& client,
                                   core::HeaderMap headers,
                                   core::LoggerPtr logger,
                                   std::uint32_t max_redirects)
    : client_(client)
    , headers_(std::move(headers))
    , logger_(core::or_null(std::move(logger)))
    , max_redirects_(max_redirects) {}

const HLSVariant* PlaylistResolver::select_variant(const std::vector<HLSVariant>& variants) noexcept {
    if (variants.empty()) {
        return nullptr;
    }

    const bool all_sized = std::all_of(variants.begin(), variants.end(),
                                       [](const HLSVariant& v) { return v.resolution.has_value(); });

    auto better = [all_sized](const HLSVariant& a, const HLSVariant& b) {
        if (all_sized && a.resolution->pixels() != b.resolution->pixels()) {
            return a.resolution->pixels() > b.resolution->pixels();
        }
        return a.bandwidth > b.bandwidth;
    };

    const HLSVariant* best = &variants.front();
    for (const auto& candidate : variants) {
        if (better(candidate, *best)) {
            best = &candidate;
        }
    }
    return best;
}

std::expected<ResolvedPlaylist, std::error_code> PlaylistResolver::resolve(const core::Url& start) {
    core::Url current = start;
    std::uint32_t redirects = 0;

    for (;;) {
        const std::string url = current.full();
        auto bytes = client_.fetch(url, headers_);
        if (!bytes) {
            logger_->error("fetch playlist {} failed: {}", url, bytes.error().message());
            return std::unexpected(bytes.error());
        }

        auto parsed = HLSParser::parse(*bytes);
        if (!parsed) {
            logger_->error("parse playlist {} failed: {}", url, parsed.error().message());
            return std::unexpected(parsed.error());
        }

        if (auto* master = std::get_if<HLSMasterPlaylist>(&*parsed)) {
            const HLSVariant* variant = select_variant(master->variants);
            if (!variant) {
                return std::unexpected(make_error_code(core::Errc::no_variants));
            }
            if (redirects >= max_redirects_) {
                logger_->error("master playlist chain exceeds {} hops at {}", max_redirects_, url);
                return std::unexpected(make_error_code(core::Errc::redirect_limit));
            }

            auto next = current.resolve(variant->uri);
            if (!next) {
                return std::unexpected(make_error_code(core::Errc::unresolvable_uri));
            }
            ++redirects;
            current = std::move(*next);
            logger_->info("master playlist, selected {} bps variant, redirect to {}",
                          variant->bandwidth, current.full());
            continue;
        }

        auto sum = core::md5_hex(*bytes);
        if (!sum) {
            return std::unexpected(sum.error());
        }

        auto& media = std::get<HLSMediaPlaylist>(*parsed);
        logger_->debug("media playlist {} with {} segments, checksum {}",
                       url, media.segments.size(), *sum);
        return ResolvedPlaylist(std::move(current), std::move(media), std::move(*sum));
    }
}

} // namespace reel::media
