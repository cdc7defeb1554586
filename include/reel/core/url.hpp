// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace reel::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://[userinfo@]host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    // RFC 3986 section 5 reference resolution against this URL
    [[nodiscard]] std::expected<Url, std::error_code> resolve(std::string_view reference) const noexcept;

    Url() = default;

private:
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// True for references that already carry an http:// or https:// scheme
[[nodiscard]] bool is_absolute_http(std::string_view uri) noexcept;

// Last path component of a URI or relative reference, query and fragment dropped.
// Empty when the reference ends in '/'.
[[nodiscard]] std::string uri_basename(std::string_view uri);

// Name a URI is saved under: its basename, with a non-empty query folded into
// a 16 hex digit FNV-1a suffix ahead of the extension ("get.php?seg=1" becomes
// "get-<hash>.php"). The fragment never contributes. Empty when the basename is.
[[nodiscard]] std::string local_file_name(std::string_view uri);

// Removes "." and ".." segments from an absolute path
[[nodiscard]] std::string remove_dot_segments(std::string_view path);

} // namespace reel::core
