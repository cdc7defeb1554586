// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <system_error>

namespace reel::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    create_failed,
    write_error,
    read_error,
    sync_error,
    rename_error,
    remove_error,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::disk_full:       return "Disk full";
            case DiskErrc::invalid_path:    return "Invalid path";
            case DiskErrc::create_failed:   return "Cannot create file or directory";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::sync_error:      return "Sync to disk failed";
            case DiskErrc::rename_error:    return "Rename failed";
            case DiskErrc::remove_error:    return "Remove failed";
            default:                        return "Unknown error";
        }
    }

    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override {
        if (ev == 0) {
            return {0, *this};
        }
        return core::make_error_condition(core::ErrorKind::io);
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map errno from a failed POSIX call, falling back to `fallback` for anything unlisted
[[nodiscard]] std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept;

} // namespace reel::disk

namespace std {

template<>
struct is_error_code_enum<reel::disk::DiskErrc> : true_type {};

} // namespace std
