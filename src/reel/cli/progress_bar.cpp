// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace reel::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t completed) noexcept {
    if (total_ == 0 || finished_) return;

    const auto percent = static_cast<std::int64_t>(
        std::min<std::uint64_t>(completed, total_) * 100 / total_);
    if (percent <= last_percent_) return;
    last_percent_ = percent;

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    std::cout << '\r' << render(completed, elapsed) << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (total_ > 0) {
        update(total_);
    }
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << '\r' << std::string(72, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render(std::uint64_t completed, double elapsed_sec) const {
    completed = std::min(completed, total_);
    const double percent = total_ == 0 ? 100.0
                                       : static_cast<double>(completed) * 100.0 / static_cast<double>(total_);

    std::ostringstream line;
    if (!label_.empty()) {
        line << label_ << ": ";
    }
    line << render_bar(percent) << ' '
         << std::setw(3) << static_cast<int>(percent) << "% "
         << '(' << completed << '/' << total_ << " segments)";

    // ETA from the average rate so far
    if (elapsed_sec > 0.0 && completed > 0 && completed < total_) {
        const double rate = static_cast<double>(completed) / elapsed_sec;
        const auto eta = static_cast<std::uint64_t>(static_cast<double>(total_ - completed) / rate);
        line << " " << std::fixed << std::setprecision(1) << rate << " seg/s"
             << " ETA: " << format_time(eta);
    }
    line << "   ";
    return line.str();
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = std::clamp(static_cast<int>(std::round(BAR_WIDTH * percent / 100.0)), 0, BAR_WIDTH);

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += filled < BAR_WIDTH ? ">" : "=";
    bar.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
    } else if (minutes > 0) {
        ss << minutes << "m " << secs << "s";
    } else {
        ss << secs << "s";
    }
    return ss.str();
}

} // namespace reel::cli
