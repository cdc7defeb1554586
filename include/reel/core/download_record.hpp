// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/fetch_client.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace reel::core {

// Identity of the download a directory holds, persisted as record.json.
// A directory is trusted only while m3u8_sum matches the remote playlist.
struct DownloadRecord {
    std::string target;
    HeaderMap headers;
    std::string m3u8_sum;

    // Location of the record inside a save directory
    [[nodiscard]] static std::filesystem::path record_path(const std::filesystem::path& dir);

    // Write the record as pretty-printed JSON
    [[nodiscard]] std::error_code save(const std::filesystem::path& dir) const noexcept;

    // record_missing when absent, record_corrupt when unreadable or malformed
    [[nodiscard]] static std::expected<DownloadRecord, std::error_code>
    load(const std::filesystem::path& dir) noexcept;

    bool operator==(const DownloadRecord&) const = default;
};

} // namespace reel::core
