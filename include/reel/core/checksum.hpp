// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace reel::core {

// Lowercase hex MD5 of `data`. Used to detect remote playlist changes,
// not as a security boundary.
[[nodiscard]] std::expected<std::string, std::error_code> md5_hex(std::string_view data) noexcept;

} // namespace reel::core
