// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::cli {

// Segment counter bar for the terminal
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total = 0, std::string_view label = {});

    // Redraw when the whole-percent value changes
    void update(std::uint64_t completed) noexcept;

    // Draw 100% and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    // Status line for `completed` units after `elapsed_sec` seconds
    [[nodiscard]] std::string render(std::uint64_t completed, double elapsed_sec) const;

    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::uint64_t total_{0};
    std::int64_t last_percent_{-1};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point started_{std::chrono::steady_clock::now()};
};

} // namespace reel::cli
