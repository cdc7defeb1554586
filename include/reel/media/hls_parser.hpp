// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace reel::media {

struct HLSResolution {
    std::uint32_t width{0};
    std::uint32_t height{0};

    [[nodiscard]] std::uint64_t pixels() const noexcept {
        return static_cast<std::uint64_t>(width) * height;
    }
};

// EXT-X-KEY attributes
struct HLSKey {
    std::string method;
    std::optional<std::string> uri;
    std::string iv;
    std::string key_format;
};

// HLS (HTTP Live Streaming) media segment. `tags` holds every directive line
// between the previous segment URI and this one, verbatim and in order.
struct HLSSegment {
    std::string uri;
    double duration{0.0};          // Segment duration in seconds
    std::string title;
    std::optional<HLSKey> key;     // Set when an EXT-X-KEY precedes this segment
    std::vector<std::string> tags;
};

// HLS variant (for adaptive bitrate)
struct HLSVariant {
    std::uint64_t bandwidth{0};     // Bitrate in bps
    std::optional<HLSResolution> resolution;
    std::optional<double> frame_rate;
    std::string codecs;
    std::string uri;
};

// Playlist types
enum class HLSPlaylistType {
    unknown,
    vod,          // Video on demand
    event,        // Event
};

struct HLSMediaPlaylist {
    std::vector<std::string> header;     // Playlist-level lines before the first segment
    std::vector<HLSSegment> segments;
    std::vector<std::string> trailer;    // Lines after the last segment URI
    HLSPlaylistType type{HLSPlaylistType::unknown};
    double target_duration{0.0};
    std::uint64_t media_sequence{0};
    bool end_list{false};
};

struct HLSMasterPlaylist {
    std::vector<HLSVariant> variants;
};

using HLSPlaylist = std::variant<HLSMasterPlaylist, HLSMediaPlaylist>;

// Attribute name -> value, quoted strings unquoted
using AttributeList = std::map<std::string, std::string>;

// HLS M3U8 parser
class HLSParser {
public:
    // Parse playlist bytes as a master or media playlist
    [[nodiscard]] static std::expected<HLSPlaylist, std::error_code>
    parse(std::string_view content) noexcept;

    // Parse bytes that must hold a media playlist
    [[nodiscard]] static std::expected<HLSMediaPlaylist, std::error_code>
    parse_media(std::string_view content) noexcept;

    // Serialize a media playlist back to M3U8 text
    [[nodiscard]] static std::string write(const HLSMediaPlaylist& playlist);

    // Parse an attribute list such as `BANDWIDTH=1,CODECS="a,b"`
    [[nodiscard]] static AttributeList parse_attributes(std::string_view attributes);

    // Copy of `tag_line` with its URI="..." attribute value replaced
    [[nodiscard]] static std::string replace_uri_attribute(std::string_view tag_line,
                                                           std::string_view uri);

    // Check if URL is an HLS playlist
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;
};

} // namespace reel::media
