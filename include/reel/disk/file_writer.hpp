// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstddef>
#include <filesystem>
#include <string_view>

namespace reel::disk {

// Sequential writer over a POSIX file descriptor
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate `path` for writing
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Append all of `data`, retrying short writes
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush file contents to durable storage
    [[nodiscard]] std::error_code sync() noexcept;

    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::filesystem::path path_;
};

// Sibling path a file is staged under before it is renamed into place
[[nodiscard]] std::filesystem::path partial_path(const std::filesystem::path& path);

// Write `bytes` to `<path>.writing`, fsync it, then rename over `path`.
// A reader never observes a partially written file at `path`.
[[nodiscard]] std::error_code write_atomic(const std::filesystem::path& path,
                                           std::string_view bytes) noexcept;

// Create `dir` and any missing parents
[[nodiscard]] std::error_code ensure_directory(const std::filesystem::path& dir) noexcept;

// Create `dir` if needed and remove everything inside it. `dir` itself is kept.
[[nodiscard]] std::error_code reset_directory(const std::filesystem::path& dir) noexcept;

} // namespace reel::disk
