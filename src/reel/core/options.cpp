// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/options.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace reel::core {

namespace {

bool is_token_char(unsigned char c) noexcept {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

std::expected<DownloaderOptions, std::error_code>
DownloaderOptions::create(std::string_view target_url) noexcept {
    auto url = Url::parse(target_url);
    if (!url) {
        return std::unexpected(url.error());
    }
    if (!url->is_http()) {
        return std::unexpected(make_error_code(Errc::invalid_url));
    }

    try {
        DownloaderOptions options;
        options.target_ = std::move(*url);
        options.target_str_ = std::string(target_url);
        return options;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<void, std::error_code>
DownloaderOptions::add_header(std::string_view name, std::string_view value) {
    if (name.empty() ||
        !std::all_of(name.begin(), name.end(), [](char c) { return is_token_char(static_cast<unsigned char>(c)); })) {
        return std::unexpected(make_error_code(Errc::invalid_header));
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        return std::unexpected(make_error_code(Errc::invalid_header));
    }

    // Header names are case-insensitive; the latest spelling wins
    std::erase_if(headers_, [name](const auto& entry) { return iequals(entry.first, name); });
    headers_[std::string(name)] = std::string(value);
    return {};
}

std::expected<void, std::error_code> DownloaderOptions::max_concurrency(std::uint32_t n) noexcept {
    if (n == 0) {
        return std::unexpected(make_error_code(Errc::invalid_option));
    }
    max_concurrency_ = n;
    return {};
}

std::expected<void, std::error_code> DownloaderOptions::index_name(std::string_view name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string_view::npos) {
        return std::unexpected(make_error_code(Errc::invalid_option));
    }
    // Would overwrite the download record or look like an unfinished write
    if (name == RECORD_FILE_NAME || name.ends_with(PARTIAL_SUFFIX)) {
        return std::unexpected(make_error_code(Errc::invalid_option));
    }
    index_name_ = std::string(name);
    return {};
}

std::expected<std::pair<std::string, std::string>, std::error_code>
parse_header_line(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return std::unexpected(make_error_code(Errc::invalid_header));
    }
    auto name = trim(line.substr(0, colon));
    auto value = trim(line.substr(colon + 1));
    if (name.empty()) {
        return std::unexpected(make_error_code(Errc::invalid_header));
    }
    return std::pair<std::string, std::string>{std::string(name), std::string(value)};
}

} // namespace reel::core
