// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/fetch_client.hpp>
#include <reel/core/url.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace reel::core {

// Download configuration. Every fallible setter validates immediately and
// leaves the options untouched on error.
class DownloaderOptions {
public:
    [[nodiscard]] static std::expected<DownloaderOptions, std::error_code>
    create(std::string_view target_url) noexcept;

    // Name must be an RFC 7230 token, value must not contain CR or LF.
    // Adding a name that matches an existing one ignoring case replaces it.
    [[nodiscard]] std::expected<void, std::error_code>
    add_header(std::string_view name, std::string_view value);

    [[nodiscard]] std::expected<void, std::error_code> max_concurrency(std::uint32_t n) noexcept;
    [[nodiscard]] std::uint32_t max_concurrency() const noexcept { return max_concurrency_; }

    void max_redirects(std::uint32_t n) noexcept { max_redirects_ = n; }
    [[nodiscard]] std::uint32_t max_redirects() const noexcept { return max_redirects_; }

    void save_dir(std::filesystem::path dir) noexcept { save_dir_ = std::move(dir); }
    [[nodiscard]] const std::filesystem::path& save_dir() const noexcept { return save_dir_; }

    // Plain file name, no directory components. The record file name and
    // names ending in the partial-write suffix are refused.
    [[nodiscard]] std::expected<void, std::error_code> index_name(std::string_view name);
    [[nodiscard]] const std::string& index_name() const noexcept { return index_name_; }

    [[nodiscard]] const Url& target() const noexcept { return target_; }
    [[nodiscard]] const std::string& target_str() const noexcept { return target_str_; }
    [[nodiscard]] const HeaderMap& headers() const noexcept { return headers_; }

private:
    DownloaderOptions() = default;

    Url target_;
    std::string target_str_;
    HeaderMap headers_;
    std::filesystem::path save_dir_{"."};
    std::string index_name_{std::string(INDEX_FILE_NAME)};
    std::uint32_t max_concurrency_{DEFAULT_CONCURRENCY};
    std::uint32_t max_redirects_{MAX_PLAYLIST_REDIRECTS};
};

// Split a "Name: value" command line header
[[nodiscard]] std::expected<std::pair<std::string, std::string>, std::error_code>
parse_header_line(std::string_view line);

} // namespace reel::core
