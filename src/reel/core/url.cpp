// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace reel::core {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Length of a leading "scheme:" (without the colon), or 0 if the reference has none
std::size_t scheme_length(std::string_view ref) noexcept {
    if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref.front()))) {
        return 0;
    }
    for (std::size_t i = 1; i < ref.size(); ++i) {
        char c = ref[i];
        if (c == ':') {
            return i;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return 0;
        }
    }
    return 0;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(Errc::invalid_url));
        }
        url.scheme_ = to_lower(url_str.substr(0, scheme_end));

        auto rest_start = scheme_end + 3;

        auto path_start = url_str.find('/', rest_start);
        auto query_start = url_str.find('?', rest_start);
        auto fragment_start = url_str.find('#', rest_start);
        if (path_start == std::string_view::npos) path_start = url_str.length();
        if (query_start == std::string_view::npos) query_start = url_str.length();
        if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

        // '?' inside a fragment does not start a query
        if (query_start > fragment_start) {
            query_start = url_str.length();
        }

        auto host_end = std::min({path_start, query_start, fragment_start});
        auto authority = url_str.substr(rest_start, host_end - rest_start);

        auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            url.userinfo_ = std::string(authority.substr(0, at_pos));
            authority.remove_prefix(at_pos + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(Errc::invalid_url));
            }
            url.host_ = to_lower(authority.substr(0, bracket_end + 1));
            if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
                url.port_ = std::string(authority.substr(bracket_end + 2));
            }
        } else {
            auto colon_pos = authority.rfind(':');
            if (colon_pos != std::string_view::npos) {
                url.host_ = to_lower(authority.substr(0, colon_pos));
                url.port_ = std::string(authority.substr(colon_pos + 1));
            } else {
                url.host_ = to_lower(authority);
            }
        }

        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(Errc::invalid_url));
        }

        if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(Errc::invalid_url));
        }

        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    return uri_basename(path_);
}

std::expected<Url, std::error_code> Url::resolve(std::string_view reference) const noexcept {
    try {
        auto scheme_len = scheme_length(reference);
        if (scheme_len > 0) {
            auto absolute = Url::parse(reference);
            if (!absolute || !absolute->is_http()) {
                return std::unexpected(make_error_code(Errc::unresolvable_uri));
            }
            return absolute;
        }

        if (reference.starts_with("//")) {
            auto absolute = Url::parse(scheme_ + ":" + std::string(reference));
            if (!absolute) {
                return std::unexpected(make_error_code(Errc::unresolvable_uri));
            }
            return absolute;
        }

        std::string_view ref_path = reference;
        std::string_view ref_query;
        std::string_view ref_fragment;
        bool has_query = false;

        auto hash = ref_path.find('#');
        if (hash != std::string_view::npos) {
            ref_fragment = ref_path.substr(hash + 1);
            ref_path = ref_path.substr(0, hash);
        }
        auto qmark = ref_path.find('?');
        if (qmark != std::string_view::npos) {
            has_query = true;
            ref_query = ref_path.substr(qmark + 1);
            ref_path = ref_path.substr(0, qmark);
        }

        Url target = *this;
        target.fragment_ = std::string(ref_fragment);

        if (ref_path.empty()) {
            if (has_query) {
                target.query_ = std::string(ref_query);
            }
            return target;
        }

        target.query_ = std::string(ref_query);
        if (ref_path.front() == '/') {
            target.path_ = remove_dot_segments(ref_path);
        } else {
            std::string merged;
            auto last_slash = path_.rfind('/');
            if (last_slash == std::string::npos) {
                merged = "/";
            } else {
                merged = path_.substr(0, last_slash + 1);
            }
            merged += ref_path;
            target.path_ = remove_dot_segments(merged);
        }
        return target;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

bool is_absolute_http(std::string_view uri) noexcept {
    auto scheme_len = scheme_length(uri);
    if (scheme_len == 0 || uri.substr(scheme_len).substr(0, 3) != "://") {
        return false;
    }
    auto scheme = uri.substr(0, scheme_len);
    auto equals_nocase = [](std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    };
    return equals_nocase(scheme, "http") || equals_nocase(scheme, "https");
}

std::string uri_basename(std::string_view uri) {
    auto cut = uri.find_first_of("?#");
    if (cut != std::string_view::npos) {
        uri = uri.substr(0, cut);
    }
    // Skip the authority of absolute URLs so "http://host" yields nothing
    auto scheme_sep = uri.find("://");
    if (scheme_sep != std::string_view::npos) {
        auto path_start = uri.find('/', scheme_sep + 3);
        if (path_start == std::string_view::npos) {
            return {};
        }
        uri = uri.substr(path_start);
    }
    auto last_slash = uri.rfind('/');
    if (last_slash != std::string_view::npos) {
        uri = uri.substr(last_slash + 1);
    }
    if (uri == "." || uri == "..") {
        return {};
    }
    return std::string(uri);
}

std::string remove_dot_segments(std::string_view path) {
    std::string input(path);
    std::string output;
    output.reserve(input.size());

    while (!input.empty()) {
        if (input.starts_with("../")) {
            input.erase(0, 3);
        } else if (input.starts_with("./")) {
            input.erase(0, 2);
        } else if (input.starts_with("/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (input.starts_with("/../") || input == "/..") {
            input = input.size() == 3 ? std::string("/") : input.substr(3);
            auto last = output.rfind('/');
            output.erase(last == std::string::npos ? 0 : last);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            auto next = input.find('/', input.front() == '/' ? 1 : 0);
            if (next == std::string::npos) {
                output += input;
                input.clear();
            } else {
                output += input.substr(0, next);
                input.erase(0, next);
            }
        }
    }
    return output;
}

std::string local_file_name(std::string_view uri) {
    std::string name = uri_basename(uri);
    if (name.empty()) {
        return name;
    }

    auto hash_pos = uri.find('#');
    if (hash_pos != std::string_view::npos) {
        uri = uri.substr(0, hash_pos);
    }
    auto query_pos = uri.find('?');
    if (query_pos == std::string_view::npos || query_pos + 1 == uri.size()) {
        return name;
    }
    const std::string_view query = uri.substr(query_pos + 1);

    // FNV-1a 64
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : query) {
        h ^= static_cast<std::uint64_t>(c);
        h *= 1099511628211ull;
    }
    std::ostringstream suffix;
    suffix << '-' << std::hex << std::nouppercase << std::setw(16) << std::setfill('0') << h;

    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        dot = name.size();
    }
    name.insert(dot, suffix.str());
    return name;
}

} // namespace reel::core
