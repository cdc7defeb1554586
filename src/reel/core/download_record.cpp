// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/download_record.hpp>
#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace reel::core {

namespace fs = std::filesystem;

std::filesystem::path DownloadRecord::record_path(const fs::path& dir) {
    return dir / RECORD_FILE_NAME;
}

std::error_code DownloadRecord::save(const fs::path& dir) const noexcept {
    try {
        nlohmann::json doc = {
            {"target", target},
            {"headers", headers},
            {"m3u8_sum", m3u8_sum},
        };
        return disk::write_atomic(record_path(dir), doc.dump(2) + "\n");
    } catch (const nlohmann::json::exception&) {
        // Header values that are not valid UTF-8 cannot be serialized
        return make_error_code(disk::DiskErrc::write_error);
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

std::expected<DownloadRecord, std::error_code>
DownloadRecord::load(const fs::path& dir) noexcept {
    try {
        std::ifstream file(record_path(dir), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(Errc::record_missing));
        }

        auto doc = nlohmann::json::parse(file);

        DownloadRecord record;
        doc.at("target").get_to(record.target);
        doc.at("headers").get_to(record.headers);
        doc.at("m3u8_sum").get_to(record.m3u8_sum);
        return record;
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(make_error_code(Errc::record_corrupt));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace reel::core
