// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/fetch_client.hpp>
#include <cstdint>
#include <string>
#include <expected>

namespace reel::core {

// libcurl-backed fetch client. Each call uses its own easy handle, so a
// single session can serve all download workers.
class HttpSession final : public FetchClient {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    // GET the whole body of `url`
    [[nodiscard]] std::expected<std::string, std::error_code>
    fetch(const std::string& url, const HeaderMap& headers) override;

    // Global initialization (call once at startup), false if libcurl refused
    [[nodiscard]] static bool global_init() noexcept;
    static void global_cleanup() noexcept;

    // Translate a libcurl result code into an Errc value
    [[nodiscard]] static std::error_code curl_error(int curl_code) noexcept;

    // Translate an HTTP status into an Errc value; empty for 1xx-3xx
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;
};

} // namespace reel::core
