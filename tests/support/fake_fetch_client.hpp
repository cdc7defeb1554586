// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/fetch_client.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace reel::test {

// In-memory FetchClient. Unknown URLs answer not_found.
class FakeFetchClient : public core::FetchClient {
public:
    void serve(const std::string& url, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        bodies_[url] = std::move(body);
        errors_.erase(url);
    }

    void fail(const std::string& url, std::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_[url] = ec;
        bodies_.erase(url);
    }

    // Every successful response waits this long before returning
    void latency(std::chrono::milliseconds delay) noexcept { latency_ = delay; }

    std::expected<std::string, std::error_code>
    fetch(const std::string& url, const core::HeaderMap& headers) override {
        std::string body;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[url];
            ++total_calls_;
            last_headers_ = headers;

            if (auto err = errors_.find(url); err != errors_.end()) {
                return std::unexpected(err->second);
            }
            auto it = bodies_.find(url);
            if (it == bodies_.end()) {
                return std::unexpected(make_error_code(core::Errc::not_found));
            }
            body = it->second;
        }

        auto running = in_flight_.fetch_add(1) + 1;
        auto peak = peak_in_flight_.load();
        while (running > peak && !peak_in_flight_.compare_exchange_weak(peak, running)) {
        }
        if (latency_.count() > 0) {
            std::this_thread::sleep_for(latency_);
        }
        in_flight_.fetch_sub(1);
        return body;
    }

    [[nodiscard]] std::size_t calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] std::size_t total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_calls_;
    }

    // Requests whose URL ends in `suffix`, e.g. ".ts"
    [[nodiscard]] std::size_t calls_ending_with(std::string_view suffix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& [url, n] : calls_) {
            if (url.ends_with(suffix)) count += n;
        }
        return count;
    }

    [[nodiscard]] core::HeaderMap last_headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_headers_;
    }

    [[nodiscard]] std::size_t peak_in_flight() const noexcept { return peak_in_flight_.load(); }

    void reset_counts() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
        total_calls_ = 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> bodies_;
    std::map<std::string, std::error_code> errors_;
    std::map<std::string, std::size_t> calls_;
    std::size_t total_calls_{0};
    core::HeaderMap last_headers_;
    std::chrono::milliseconds latency_{0};
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> peak_in_flight_{0};
};

} // namespace reel::test
