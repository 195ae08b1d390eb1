#include <sfpp_util/logging.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace sfpp_util {

std::shared_ptr<spdlog::logger> Logging::logger_;

spdlog::level::level_enum Logging::parseLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str answers "off" for any name it does not know
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

void Logging::init(const std::string& level,
                   bool console,
                   bool file,
                   const std::string& filePath,
                   size_t maxSizeMb,
                   size_t maxFiles) {
    const auto logLevel = parseLevel(level);

    if (auto registered = spdlog::get(LOGGER_NAME)) {
        registered->set_level(logLevel);
        logger_ = std::move(registered);
        spdlog::set_default_logger(logger_);
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (file) {
        const std::filesystem::path logPath(filePath);
        if (logPath.has_parent_path()) {
            std::filesystem::create_directories(logPath.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filePath, maxSizeMb * 1024 * 1024, maxFiles));
    }

    auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    created->set_level(logLevel);
    created->set_pattern(PATTERN);
    created->flush_on(spdlog::level::err);

    spdlog::register_logger(created);
    spdlog::set_default_logger(created);
    logger_ = std::move(created);
}

void Logging::initFromConfig(const Config::LoggingConfig& cfg) {
    init(cfg.level, cfg.console, cfg.file, cfg.filePath, cfg.rotateMaxSizeMb, cfg.rotateMaxFiles);
}

std::shared_ptr<spdlog::logger> Logging::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

void Logging::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::drop(LOGGER_NAME);
    logger_.reset();
}

}  // namespace sfpp_util
