// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace reel::core {

enum class Errc {
    success = 0,
    // transport
    network_error,
    timeout,
    not_found,
    server_error,
    http_error,
    ssl_error,
    dns_error,
    too_many_http_redirects,
    // manifest
    parse_error,
    // resolution
    invalid_url,
    no_variants,
    redirect_limit,
    unresolvable_uri,
    local_name_collision,
    // download record
    record_missing,
    record_corrupt,
    // configuration
    invalid_header,
    invalid_option,
    // external tools
    external_process_failed,
};

// Coarse classification used by callers that only care about the failure family
enum class ErrorKind {
    fetch = 1,
    parse,
    resolution,
    io,
    cache,
    external_process,
    config,
};

namespace detail {

struct ErrorKindCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::kind";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ErrorKind>(ev)) {
            case ErrorKind::fetch:             return "Fetch error";
            case ErrorKind::parse:             return "Parse error";
            case ErrorKind::resolution:        return "Resolution error";
            case ErrorKind::io:                return "I/O error";
            case ErrorKind::cache:             return "Cache error";
            case ErrorKind::external_process:  return "External process error";
            case ErrorKind::config:            return "Configuration error";
            default:                           return "Unknown error kind";
        }
    }
};

} // namespace detail

inline const detail::ErrorKindCategory& error_kind_category() noexcept {
    static detail::ErrorKindCategory category;
    return category;
}

inline std::error_condition make_error_condition(ErrorKind k) noexcept {
    return {static_cast<int>(k), error_kind_category()};
}

namespace detail {

struct ErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::core";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::success:                  return "Success";
            case Errc::network_error:            return "Network error";
            case Errc::timeout:                  return "Operation timed out";
            case Errc::not_found:                return "Resource not found (404)";
            case Errc::server_error:             return "Server error (5xx)";
            case Errc::http_error:               return "HTTP request rejected";
            case Errc::ssl_error:                return "SSL/TLS error";
            case Errc::dns_error:                return "DNS resolution failed";
            case Errc::too_many_http_redirects:  return "Too many HTTP redirects";
            case Errc::parse_error:              return "Malformed playlist";
            case Errc::invalid_url:              return "Invalid URL";
            case Errc::no_variants:              return "Master playlist has no variant stream";
            case Errc::redirect_limit:           return "Master playlist chain too deep";
            case Errc::unresolvable_uri:         return "Cannot resolve playlist URI";
            case Errc::local_name_collision:     return "Different playlist URIs map to one local file";
            case Errc::record_missing:           return "Download record not found";
            case Errc::record_corrupt:           return "Download record is malformed";
            case Errc::invalid_header:           return "Invalid HTTP header";
            case Errc::invalid_option:           return "Invalid option";
            case Errc::external_process_failed:  return "External process failed";
            default:                             return "Unknown error";
        }
    }

    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<Errc>(ev)) {
            case Errc::network_error:
            case Errc::timeout:
            case Errc::not_found:
            case Errc::server_error:
            case Errc::http_error:
            case Errc::ssl_error:
            case Errc::dns_error:
            case Errc::too_many_http_redirects:
                return make_error_condition(ErrorKind::fetch);
            case Errc::parse_error:
                return make_error_condition(ErrorKind::parse);
            case Errc::invalid_url:
            case Errc::no_variants:
            case Errc::redirect_limit:
            case Errc::unresolvable_uri:
            case Errc::local_name_collision:
                return make_error_condition(ErrorKind::resolution);
            case Errc::record_missing:
            case Errc::record_corrupt:
                return make_error_condition(ErrorKind::cache);
            case Errc::invalid_header:
            case Errc::invalid_option:
                return make_error_condition(ErrorKind::config);
            case Errc::external_process_failed:
                return make_error_condition(ErrorKind::external_process);
            default:
                return {ev, *this};
        }
    }
};

} // namespace detail

inline const detail::ErrcCategory& errc_category() noexcept {
    static detail::ErrcCategory category;
    return category;
}

inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), errc_category()};
}

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::Errc> : true_type {};

template<>
struct is_error_condition_enum<reel::core::ErrorKind> : true_type {};

} // namespace std
