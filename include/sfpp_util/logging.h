#pragma once

#include <sfpp_util/config.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace sfpp_util {

/**
 * Process-wide "sfpp" logger shared by every conversion module.
 * Conversions log at debug level; invalid UTF-8 repairs log at error level.
 */
class Logging {
public:
    static constexpr const char* LOGGER_NAME = "sfpp";
    static constexpr const char* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v";

    static void init(const std::string& level = "info",
                     bool console = true,
                     bool file = false,
                     const std::string& filePath = "logs/sfpp.log",
                     size_t maxSizeMb = 5,
                     size_t maxFiles = 3);

    /// Same as init() with the "logging" section of Config
    static void initFromConfig(const Config::LoggingConfig& cfg = Config::logging());

    /// Lazily initializes with defaults
    static std::shared_ptr<spdlog::logger> get();

    // Drop the logger so the next init() builds fresh sinks
    static void shutdown();

    /// Unknown names map to info
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sfpp_util
