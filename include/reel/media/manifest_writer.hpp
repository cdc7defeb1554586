// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/media/hls_parser.hpp>
#include <reel/media/playlist_resolver.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace reel::media {

// Media playlist that refers to its segments and keys by basename, so it
// plays from the directory the files were saved to
[[nodiscard]] HLSMediaPlaylist localize(ResolvedPlaylist playlist);

// EXT-X-KEY line with its URI attribute cut down to a basename. Other lines
// and key lines without a URI come back unchanged.
[[nodiscard]] std::string localize_key_line(std::string_view line);

// localize() the playlist and write it atomically to `path`
[[nodiscard]] std::error_code write_local_manifest(ResolvedPlaylist playlist,
                                                   const std::filesystem::path& path);

} // namespace reel::media
