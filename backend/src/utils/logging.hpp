#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // Call once at startup, after the config is resolved.
    inline void init(const std::string& path, spdlog::level::level_enum level)
    {
        auto file_logger = spdlog::basic_logger_mt("budget_file_logger", path);

        spdlog::set_default_logger(file_logger);

        // Pattern is set once for every logger
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
