#include <sfpp_util/config.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace sfpp_util {

namespace {
    bool envFlag(const char* val) {
        std::string s(val);
        return s == "true" || s == "1" || s == "TRUE" || s == "on";
    }
}

Config& Config::instance() {
    static Config cfg;
    return cfg;
}

bool Config::load(const std::string& jsonPath) {
    auto& cfg = instance();

    std::ifstream file(jsonPath);
    if (file.is_open()) {
        nlohmann::json j;
        file >> j;
        cfg.loadFromJson(j);
    }

    cfg.loadFromEnv();
    return true;
}

void Config::reset() {
    auto& cfg = instance();
    cfg.logging_ = LoggingConfig{};
    cfg.conversion_ = ConversionConfig{};
    cfg.session_ = SessionConfig{};
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& jlog = j["logging"];
        if (jlog.contains("level")) logging_.level = jlog["level"];
        if (jlog.contains("console")) logging_.console = jlog["console"];
        if (jlog.contains("file")) logging_.file = jlog["file"];
        if (jlog.contains("file_path")) logging_.filePath = jlog["file_path"];
        if (jlog.contains("rotate_max_size_mb")) logging_.rotateMaxSizeMb = jlog["rotate_max_size_mb"];
        if (jlog.contains("rotate_max_files")) logging_.rotateMaxFiles = jlog["rotate_max_files"];
    }

    if (j.contains("conversion")) {
        auto& jconv = j["conversion"];
        if (jconv.contains("higher_precision")) conversion_.higherPrecision = jconv["higher_precision"];
        if (jconv.contains("map_values_nullable")) conversion_.mapValuesNullable = jconv["map_values_nullable"];
        if (jconv.contains("utf8_validation")) conversion_.utf8Validation = jconv["utf8_validation"];
        if (jconv.contains("timestamp_option")) conversion_.timestampOption = jconv["timestamp_option"];
        if (jconv.contains("max_structured_depth")) conversion_.maxStructuredDepth = jconv["max_structured_depth"];
    }

    if (j.contains("session")) {
        auto& jsess = j["session"];
        if (jsess.contains("timezone")) session_.timezone = jsess["timezone"];
        if (jsess.contains("parameters")) {
            for (auto& [name, value] : jsess["parameters"].items()) {
                session_.parameters[name] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    }
}

void Config::loadFromEnv() {
    if (const char* val = std::getenv("SFPP_LOG_LEVEL")) logging_.level = val;
    if (const char* val = std::getenv("SFPP_HIGHER_PRECISION")) conversion_.higherPrecision = envFlag(val);
    if (const char* val = std::getenv("SFPP_MAP_VALUES_NULLABLE")) conversion_.mapValuesNullable = envFlag(val);
    if (const char* val = std::getenv("SFPP_UTF8_VALIDATION")) conversion_.utf8Validation = envFlag(val);
    if (const char* val = std::getenv("SFPP_TIMESTAMP_OPTION")) conversion_.timestampOption = val;
    if (const char* val = std::getenv("SFPP_MAX_STRUCTURED_DEPTH")) {
        conversion_.maxStructuredDepth = std::stoi(val);
    }
    if (const char* val = std::getenv("SFPP_TIMEZONE")) session_.timezone = val;
}

sfpp::core::TimestampOption Config::parseTimestampOption(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "nanosecond" || lower == "ns") return sfpp::core::TimestampOption::Nanosecond;
    if (lower == "microsecond" || lower == "us") return sfpp::core::TimestampOption::Microsecond;
    if (lower == "millisecond" || lower == "ms") return sfpp::core::TimestampOption::Millisecond;
    if (lower == "second" || lower == "s") return sfpp::core::TimestampOption::Second;
    if (lower == "original") return sfpp::core::TimestampOption::Original;
    throw std::invalid_argument("Unknown timestamp option: " + name);
}

sfpp::core::ConversionOptions Config::conversionOptions() {
    const auto& conv = conversion();
    sfpp::core::ConversionOptions options;
    options.higherPrecision = conv.higherPrecision;
    options.mapValuesNullable = conv.mapValuesNullable;
    options.utf8Validation = conv.utf8Validation;
    options.timestampOption = parseTimestampOption(conv.timestampOption);
    options.maxStructuredDepth = conv.maxStructuredDepth;
    return options;
}

std::map<std::string, std::string> Config::sessionParameters() {
    auto params = session().parameters;
    if (!session().timezone.empty()) {
        params["timezone"] = session().timezone;
    }
    return params;
}

}  // namespace sfpp_util
