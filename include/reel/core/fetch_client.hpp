// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <expected>
#include <map>
#include <string>

namespace reel::core {

// Request headers sent with every fetch, ordered by name
using HeaderMap = std::map<std::string, std::string>;

// Retrieves a whole resource into memory.
// Implementations must be safe to call from several threads at once.
class FetchClient {
public:
    virtual ~FetchClient() = default;

    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    fetch(const std::string& url, const HeaderMap& headers) = 0;
};

} // namespace reel::core
