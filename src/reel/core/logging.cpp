// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/logging.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace reel::core {

LoggerPtr null_logger() {
    static LoggerPtr logger =
        std::make_shared<spdlog::logger>("reel-null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

LoggerPtr make_console_logger(const std::string& name, spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(level);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    return logger;
}

} // namespace reel::core
