// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/manifest_writer.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/file_writer.hpp>

namespace reel::media {

namespace {

constexpr std::string_view KEY_TAG = "#EXT-X-KEY:";

} // namespace

std::string localize_key_line(std::string_view line) {
    if (!line.starts_with(KEY_TAG)) {
        return std::string(line);
    }
    auto attrs = HLSParser::parse_attributes(line.substr(KEY_TAG.size()));
    auto it = attrs.find("URI");
    if (it == attrs.end()) {
        return std::string(line);
    }
    return HLSParser::replace_uri_attribute(line, core::local_file_name(it->second));
}

HLSMediaPlaylist localize(ResolvedPlaylist playlist) {
    HLSMediaPlaylist media = std::move(playlist).release();

    for (auto& line : media.header) {
        line = localize_key_line(line);
    }
    for (auto& segment : media.segments) {
        for (auto& line : segment.tags) {
            line = localize_key_line(line);
        }
        if (segment.key && segment.key->uri) {
            segment.key->uri = core::local_file_name(*segment.key->uri);
        }
        segment.uri = core::local_file_name(segment.uri);
    }
    return media;
}

std::error_code write_local_manifest(ResolvedPlaylist playlist, const std::filesystem::path& path) {
    const auto text = HLSParser::write(localize(std::move(playlist)));
    return disk::write_atomic(path, text);
}

} // namespace reel::media
