#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lungrisk {

inline constexpr const char* kLoggerName = "lungrisk";

// Colored stderr logger as spdlog default; level from LUNGRISK_LOG_LEVEL
inline void initLogging() {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) logger = spdlog::stderr_color_mt(kLoggerName);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    const char* env = std::getenv("LUNGRISK_LOG_LEVEL");
    if (env == nullptr) return;
    const std::string name(env);
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Ignoring unknown LUNGRISK_LOG_LEVEL '{}'", name);
        return;
    }
    spdlog::set_level(level);
}

} // namespace lungrisk
