// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/file_writer.hpp>
#include <reel/core/config.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace reel::disk {

namespace fs = std::filesystem;

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code FileWriter::open(const fs::path& path) noexcept {
    if (fd_ >= 0) {
        return make_error_code(DiskErrc::create_failed);
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::create_failed);
    }
    fd_ = fd;
    path_ = path;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::write_error);
    }

    const auto* cursor = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd_, cursor, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        cursor += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::sync_error);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::sync_error);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (fd_ < 0) {
        return {};
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

//=============================================================================
// Helpers
//=============================================================================

fs::path partial_path(const fs::path& path) {
    fs::path staged = path;
    staged += core::PARTIAL_SUFFIX;
    return staged;
}

std::error_code write_atomic(const fs::path& path, std::string_view bytes) noexcept {
    try {
        const fs::path staged = partial_path(path);

        FileWriter writer;
        if (auto ec = writer.open(staged)) {
            return ec;
        }

        std::error_code ec = writer.write(bytes.data(), bytes.size());
        if (!ec) ec = writer.sync();
        if (auto close_ec = writer.close(); !ec) ec = close_ec;
        if (ec) {
            std::error_code ignored;
            fs::remove(staged, ignored);
            return ec;
        }

        if (::rename(staged.c_str(), path.c_str()) != 0) {
            auto rename_ec = errno_to_error_code(errno, DiskErrc::rename_error);
            std::error_code ignored;
            fs::remove(staged, ignored);
            return rename_ec;
        }
        return {};
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

std::error_code ensure_directory(const fs::path& dir) noexcept {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return errno_to_error_code(ec.value(), DiskErrc::create_failed);
    }
    return {};
}

std::error_code reset_directory(const fs::path& dir) noexcept {
    if (auto ec = ensure_directory(dir)) {
        return ec;
    }

    // Empty it in place; dir may be "." or the working directory itself
    std::vector<fs::path> entries;
    try {
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            return errno_to_error_code(ec.value(), DiskErrc::remove_error);
        }
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    for (const auto& entry : entries) {
        std::error_code ec;
        fs::remove_all(entry, ec);
        if (ec) {
            return errno_to_error_code(ec.value(), DiskErrc::remove_error);
        }
    }
    return {};
}

} // namespace reel::disk
