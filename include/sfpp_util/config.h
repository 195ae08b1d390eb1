#pragma once

#include "sfpp/core/conversion_options.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace sfpp_util {

class Config {
public:
    struct LoggingConfig {
        std::string level = "info";
        bool console = true;
        bool file = false;
        std::string filePath = "logs/sfpp.log";
        size_t rotateMaxSizeMb = 5;
        size_t rotateMaxFiles = 3;
    };

    struct ConversionConfig {
        bool higherPrecision = false;
        bool mapValuesNullable = false;
        bool utf8Validation = false;
        std::string timestampOption = "nanosecond";   // nanosecond|microsecond|millisecond|second|original
        int maxStructuredDepth = 64;
    };

    struct SessionConfig {
        std::string timezone;                          // empty = host zone
        std::map<std::string, std::string> parameters; // DATE_OUTPUT_FORMAT etc.
    };

    static bool load(const std::string& jsonPath);
    static void reset();

    static LoggingConfig& logging() { return instance().logging_; }
    static ConversionConfig& conversion() { return instance().conversion_; }
    static SessionConfig& session() { return instance().session_; }

    /// Options threaded through conversion calls
    static sfpp::core::ConversionOptions conversionOptions();

    /// Session parameters with TIMEZONE folded in
    static std::map<std::string, std::string> sessionParameters();

    /// @throws std::invalid_argument on an unknown name
    static sfpp::core::TimestampOption parseTimestampOption(const std::string& name);

private:
    Config() = default;
    static Config& instance();

    void loadFromEnv();
    void loadFromJson(const nlohmann::json& j);

    LoggingConfig logging_;
    ConversionConfig conversion_;
    SessionConfig session_;
};

}  // namespace sfpp_util
