// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace reel::media {

// Non-zero exit (or failed launch) of an external program
struct ProcessFailure {
    std::error_code code;
    int exit_status{-1};    // -1 when the program never ran or was killed
    std::string output;     // Captured stderr, empty in verbose mode
};

// Runs ffmpeg / mpv / ffplay against a downloaded local index
class MediaTool {
public:
    // Split `index` into the directory to run in and the index file name
    [[nodiscard]] static std::expected<MediaTool, std::error_code>
    from_index(const std::filesystem::path& index);

    // Let child processes write to the terminal instead of capturing stderr
    void verbose(bool enabled) noexcept { verbose_ = enabled; }
    [[nodiscard]] bool verbose() const noexcept { return verbose_; }

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
    [[nodiscard]] const std::string& index_file() const noexcept { return index_file_; }

    // Remux every segment into one container file
    [[nodiscard]] std::expected<void, ProcessFailure> merge_to(const std::filesystem::path& output) const;

    [[nodiscard]] std::expected<void, ProcessFailure> play() const;

    // Delete the segment and key files the index refers to
    [[nodiscard]] std::error_code clean_segments() const;

    [[nodiscard]] std::vector<std::string> merge_command(const std::filesystem::path& output) const;
    [[nodiscard]] std::vector<std::string> play_command() const;

private:
    MediaTool(std::filesystem::path directory, std::string index_file);

    [[nodiscard]] std::expected<void, ProcessFailure> run(const std::vector<std::string>& argv) const;

    std::filesystem::path directory_;
    std::string index_file_;
    bool verbose_{false};
};

} // namespace reel::media
