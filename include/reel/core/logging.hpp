// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace reel::core {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

// Logger that discards everything; used when a component is given none
[[nodiscard]] LoggerPtr null_logger();

// Colored stderr logger for the command line tool
[[nodiscard]] LoggerPtr make_console_logger(const std::string& name, spdlog::level::level_enum level);

// `logger` itself, or the shared null logger when it is empty
[[nodiscard]] inline LoggerPtr or_null(LoggerPtr logger) {
    return logger ? std::move(logger) : null_logger();
}

} // namespace reel::core
