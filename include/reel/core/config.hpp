// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace reel::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 10;
constexpr std::uint32_t MAX_PLAYLIST_REDIRECTS = 8;                 // master -> variant hops

constexpr std::string_view INDEX_FILE_NAME = "index.m3u8";
constexpr std::string_view RECORD_FILE_NAME = "record.json";
constexpr std::string_view PARTIAL_SUFFIX = ".writing";

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;                         // HTTP 3xx, handled by curl

} // namespace reel::core
