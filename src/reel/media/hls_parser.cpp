// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/hls_parser.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace reel::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF:";
constexpr std::string_view TAG_TARGET_DURATION = "#EXT-X-TARGETDURATION:";
constexpr std::string_view TAG_MEDIA_SEQUENCE = "#EXT-X-MEDIA-SEQUENCE:";
constexpr std::string_view TAG_PLAYLIST_TYPE = "#EXT-X-PLAYLIST-TYPE:";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";
constexpr std::string_view TAG_KEY = "#EXT-X-KEY:";

// Tags that only appear in master playlists
constexpr std::array<std::string_view, 5> MASTER_TAGS = {
    "#EXT-X-STREAM-INF:",
    "#EXT-X-I-FRAME-STREAM-INF:",
    "#EXT-X-MEDIA:",
    "#EXT-X-SESSION-DATA:",
    "#EXT-X-SESSION-KEY:",
};

// Tags that apply to the next media segment
constexpr std::array<std::string_view, 8> SEGMENT_TAGS = {
    "#EXTINF:",
    "#EXT-X-BYTERANGE:",
    "#EXT-X-KEY:",
    "#EXT-X-MAP:",
    "#EXT-X-PROGRAM-DATE-TIME:",
    "#EXT-X-DATERANGE:",
    "#EXT-X-BITRATE:",
    "#EXT-X-CUE",
};

std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        auto line = content.substr(start, end - start);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
            line.remove_suffix(1);
        }
        while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
            line.remove_prefix(1);
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
        start = end + 1;
    }
    return lines;
}

bool starts_with_any(std::string_view line, const auto& prefixes) noexcept {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [line](std::string_view p) { return line.starts_with(p); });
}

std::optional<std::uint64_t> parse_uint(std::string_view text) noexcept {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string owned(text);
    char* end = nullptr;
    double value = std::strtod(owned.c_str(), &end);
    if (end != owned.c_str() + owned.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<HLSResolution> parse_resolution(std::string_view text) noexcept {
    auto x = text.find_first_of("xX");
    if (x == std::string_view::npos) {
        return std::nullopt;
    }
    auto width = parse_uint(text.substr(0, x));
    auto height = parse_uint(text.substr(x + 1));
    if (!width || !height) {
        return std::nullopt;
    }
    return HLSResolution{static_cast<std::uint32_t>(*width), static_cast<std::uint32_t>(*height)};
}

std::expected<HLSMasterPlaylist, std::error_code>
parse_master(const std::vector<std::string_view>& lines) {
    HLSMasterPlaylist playlist;
    std::optional<HLSVariant> pending;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto line = lines[i];

        if (line.starts_with(TAG_STREAM_INF)) {
            if (pending) {
                // Two STREAM-INF tags in a row, the first has no URI
                return std::unexpected(make_error_code(core::Errc::parse_error));
            }
            auto attrs = HLSParser::parse_attributes(line.substr(TAG_STREAM_INF.size()));

            HLSVariant variant;
            auto bw = attrs.find("BANDWIDTH");
            if (bw == attrs.end()) {
                return std::unexpected(make_error_code(core::Errc::parse_error));
            }
            auto bandwidth = parse_uint(bw->second);
            if (!bandwidth) {
                return std::unexpected(make_error_code(core::Errc::parse_error));
            }
            variant.bandwidth = *bandwidth;

            if (auto res = attrs.find("RESOLUTION"); res != attrs.end()) {
                variant.resolution = parse_resolution(res->second);
                if (!variant.resolution) {
                    return std::unexpected(make_error_code(core::Errc::parse_error));
                }
            }
            if (auto fr = attrs.find("FRAME-RATE"); fr != attrs.end()) {
                variant.frame_rate = parse_double(fr->second);
            }
            if (auto codecs = attrs.find("CODECS"); codecs != attrs.end()) {
                variant.codecs = codecs->second;
            }
            pending = std::move(variant);
        } else if (line.front() != '#') {
            // URIs outside a STREAM-INF pair carry no variant information
            if (pending) {
                pending->uri = std::string(line);
                playlist.variants.push_back(std::move(*pending));
                pending.reset();
            }
        }
    }

    if (pending) {
        return std::unexpected(make_error_code(core::Errc::parse_error));
    }
    return playlist;
}

std::expected<HLSMediaPlaylist, std::error_code>
parse_media_lines(const std::vector<std::string_view>& lines) {
    HLSMediaPlaylist playlist;
    HLSSegment current;
    bool segment_started = false;

    for (auto line : lines) {
        if (line.front() != '#') {
            current.uri = std::string(line);
            playlist.segments.push_back(std::move(current));
            current = HLSSegment{};
            segment_started = false;
            continue;
        }

        if (line.starts_with(TAG_TARGET_DURATION)) {
            auto value = parse_double(line.substr(TAG_TARGET_DURATION.size()));
            if (!value) {
                return std::unexpected(make_error_code(core::Errc::parse_error));
            }
            playlist.target_duration = *value;
        } else if (line.starts_with(TAG_MEDIA_SEQUENCE)) {
            auto value = parse_uint(line.substr(TAG_MEDIA_SEQUENCE.size()));
            if (!value) {
                return std::unexpected(make_error_code(core::Errc::parse_error));
            }
            playlist.media_sequence = *value;
        } else if (line.starts_with(TAG_PLAYLIST_TYPE)) {
            auto type = line.substr(TAG_PLAYLIST_TYPE.size());
            if (type == "VOD") {
                playlist.type = HLSPlaylistType::vod;
            } else if (type == "EVENT") {
                playlist.type = HLSPlaylistType::event;
            }
        } else if (line == TAG_ENDLIST) {
            playlist.end_list = true;
        } else if (line.starts_with(TAG_EXTINF)) {
            auto value = line.substr(TAG_EXTINF.size());
            auto comma = value.find(',');
            if (comma != std::string_view::npos) {
                current.title = std::string(value.substr(comma + 1));
                value = value.substr(0, comma);
            }
            auto duration = parse_double(value);
            if (!duration) {
                return std::unexpected(make_error_code(core::Errc::parse_error));
            }
            current.duration = *duration;
        } else if (line.starts_with(TAG_KEY)) {
            auto attrs = HLSParser::parse_attributes(line.substr(TAG_KEY.size()));
            auto method = attrs.find("METHOD");
            if (method == attrs.end()) {
                return std::unexpected(make_error_code(core::Errc::parse_error));
            }
            HLSKey key;
            key.method = method->second;
            if (auto uri = attrs.find("URI"); uri != attrs.end()) {
                key.uri = uri->second;
            }
            if (auto iv = attrs.find("IV"); iv != attrs.end()) {
                key.iv = iv->second;
            }
            if (auto fmt = attrs.find("KEYFORMAT"); fmt != attrs.end()) {
                key.key_format = fmt->second;
            }
            current.key = std::move(key);
        }

        if (starts_with_any(line, SEGMENT_TAGS) ||
            line == "#EXT-X-DISCONTINUITY" || line == "#EXT-X-GAP") {
            segment_started = true;
        }

        if (!segment_started && playlist.segments.empty()) {
            playlist.header.emplace_back(line);
        } else {
            current.tags.emplace_back(line);
        }
    }

    // Whatever follows the last URI (usually EXT-X-ENDLIST)
    playlist.trailer = std::move(current.tags);
    return playlist;
}

std::expected<std::vector<std::string_view>, std::error_code>
checked_lines(std::string_view content) {
    // UTF-8 byte order mark
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.remove_prefix(3);
    }
    auto lines = split_lines(content);
    if (lines.empty() || lines.front() != TAG_HEADER) {
        return std::unexpected(make_error_code(core::Errc::parse_error));
    }
    return lines;
}

} // namespace

bool HLSParser::is_hls_url(std::string_view url) noexcept {
    // Check for .m3u8 extension, ignoring query parameters
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    constexpr std::string_view EXT = ".m3u8";
    if (url.size() < EXT.size()) {
        return false;
    }
    auto tail = url.substr(url.size() - EXT.size());
    return std::equal(tail.begin(), tail.end(), EXT.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

std::expected<HLSPlaylist, std::error_code>
HLSParser::parse(std::string_view content) noexcept {
    try {
        auto lines = checked_lines(content);
        if (!lines) {
            return std::unexpected(lines.error());
        }

        bool is_master = std::any_of(lines->begin(), lines->end(), [](std::string_view line) {
            return starts_with_any(line, MASTER_TAGS);
        });

        if (is_master) {
            auto master = parse_master(*lines);
            if (!master) return std::unexpected(master.error());
            return HLSPlaylist{std::move(*master)};
        }

        auto media = parse_media_lines(*lines);
        if (!media) return std::unexpected(media.error());
        return HLSPlaylist{std::move(*media)};
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<HLSMediaPlaylist, std::error_code>
HLSParser::parse_media(std::string_view content) noexcept {
    auto parsed = parse(content);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (auto* media = std::get_if<HLSMediaPlaylist>(&*parsed)) {
        return std::move(*media);
    }
    return std::unexpected(make_error_code(core::Errc::parse_error));
}

std::string HLSParser::write(const HLSMediaPlaylist& playlist) {
    std::string out;
    auto emit = [&out](std::string_view line) {
        out += line;
        out += '\n';
    };

    for (const auto& line : playlist.header) emit(line);
    for (const auto& segment : playlist.segments) {
        for (const auto& line : segment.tags) emit(line);
        emit(segment.uri);
    }
    for (const auto& line : playlist.trailer) emit(line);
    return out;
}

AttributeList HLSParser::parse_attributes(std::string_view attributes) {
    AttributeList result;
    std::size_t pos = 0;

    while (pos < attributes.size()) {
        while (pos < attributes.size() && (attributes[pos] == ',' || attributes[pos] == ' ')) {
            ++pos;
        }
        auto eq = attributes.find('=', pos);
        if (eq == std::string_view::npos) {
            break;
        }
        std::string name(attributes.substr(pos, eq - pos));
        pos = eq + 1;

        std::string value;
        if (pos < attributes.size() && attributes[pos] == '"') {
            auto close = attributes.find('"', pos + 1);
            if (close == std::string_view::npos) {
                close = attributes.size();
            }
            value = std::string(attributes.substr(pos + 1, close - pos - 1));
            pos = close + 1;
        } else {
            auto comma = attributes.find(',', pos);
            if (comma == std::string_view::npos) {
                comma = attributes.size();
            }
            value = std::string(attributes.substr(pos, comma - pos));
            pos = comma;
        }
        result[std::move(name)] = std::move(value);
    }
    return result;
}

std::string HLSParser::replace_uri_attribute(std::string_view tag_line, std::string_view uri) {
    // Find URI= at an attribute boundary, outside quoted values
    bool quoted = false;
    for (std::size_t i = 0; i < tag_line.size(); ++i) {
        char c = tag_line[i];
        if (c == '"') {
            quoted = !quoted;
            continue;
        }
        if (quoted || !tag_line.substr(i).starts_with("URI=\"")) {
            continue;
        }
        if (i > 0 && tag_line[i - 1] != ':' && tag_line[i - 1] != ',') {
            continue;
        }
        auto value_start = i + 5;
        auto value_end = tag_line.find('"', value_start);
        if (value_end == std::string_view::npos) {
            break;
        }
        std::string out(tag_line.substr(0, value_start));
        out += uri;
        out += tag_line.substr(value_end);
        return out;
    }
    return std::string(tag_line);
}

} // namespace reel::media
