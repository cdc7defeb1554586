// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/http_session.hpp>
#include <reel/core/config.hpp>
#include <curl/curl.h>
#include <string>

namespace reel::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list cleanup
struct CurlHeaderList {
    curl_slist* ptr = nullptr;

    CurlHeaderList() = default;
    ~CurlHeaderList() { if (ptr) curl_slist_free_all(ptr); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    bool append(const std::string& line) noexcept {
        curl_slist* next = curl_slist_append(ptr, line.c_str());
        if (!next) return false;
        ptr = next;
        return true;
    }
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    try {
        body->append(ptr, total);
    } catch (const std::bad_alloc&) {
        // Short count aborts the transfer with CURLE_WRITE_ERROR
        return 0;
    }
    return total;
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<std::string, std::error_code>
HttpSession::fetch(const std::string& url, const HeaderMap& headers) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(Errc::network_error));
    }

    CurlHeaderList header_list;
    for (const auto& [name, value] : headers) {
        if (!header_list.append(name + ": " + value)) {
            return std::unexpected(make_error_code(Errc::network_error));
        }
    }

    std::string body;
    body.reserve(READ_BUFFER_SIZE);

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, header_list.ptr);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

    // HTTP/2
    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(curl_error(static_cast<int>(result)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (auto ec = status_error(http_code)) {
        return std::unexpected(ec);
    }

    return body;
}

std::error_code HttpSession::curl_error(int curl_code) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(Errc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(Errc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(Errc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(Errc::too_many_http_redirects);
        default:
            return make_error_code(Errc::network_error);
    }
}

std::error_code HttpSession::status_error(long http_code) noexcept {
    if (http_code < 400) {
        return {};
    }
    if (http_code == 404) {
        return make_error_code(Errc::not_found);
    }
    if (http_code >= 500) {
        return make_error_code(Errc::server_error);
    }
    return make_error_code(Errc::http_error);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

bool HttpSession::global_init() noexcept {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace reel::core
