#include "strand/common/log/strand_log_config.h"
#include <iostream>

namespace strand {
namespace common {
namespace log {

namespace {

bool ReadLevel(const nlohmann::json& json, const char* key, LogLevel& level) {
    if (!json.contains(key)) {
        return true;
    }
    
    const auto level_str = json[key].get<std::string>();
    auto parsed = ParseLogLevel(level_str);
    if (!parsed) {
        std::cerr << "Unknown log level '" << level_str << "' for key " << key << std::endl;
        return false;
    }
    level = *parsed;
    return true;
}

} // anonymous namespace

bool StrandLogConfig::LoadFromJson(const nlohmann::json& config) {
    try {
        LogLevel global_level = LogLevel::INFO;
        if (config.contains("global") && !ReadLevel(config["global"], "log_level", global_level)) {
            return false;
        }
        
        std::vector<LoggerConfig> loggers;
        for (const auto& logger_json : config.value("loggers", nlohmann::json::array())) {
            LoggerConfig logger;
            logger.name = logger_json.at("name").get<std::string>();
            logger.level = global_level;
            if (!ReadLevel(logger_json, "level", logger.level)) {
                return false;
            }
            logger.file = logger_json.value("file", std::string());
            logger.console = logger_json.value("console", false);
            
            if (logger.name.empty()) {
                std::cerr << "Logger name must not be empty" << std::endl;
                return false;
            }
            loggers.push_back(std::move(logger));
        }
        
        logger_configs_ = std::move(loggers);
        global_log_level_ = global_level;
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid log config: " << e.what() << std::endl;
        return false;
    }
}

const LoggerConfig* StrandLogConfig::GetLoggerConfig(const std::string& name) const {
    for (const auto& config : logger_configs_) {
        if (config.name == name) {
            return &config;
        }
    }
    return nullptr;
}

std::optional<LogLevel> ParseLogLevel(const std::string& level_str) {
    if (level_str == "trace") return LogLevel::TRACE;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "warn") return LogLevel::WARN;
    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "critical") return LogLevel::CRITICAL;
    if (level_str == "off") return LogLevel::OFF;
    return std::nullopt;
}

::spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return ::spdlog::level::trace;
        case LogLevel::DEBUG: return ::spdlog::level::debug;
        case LogLevel::INFO: return ::spdlog::level::info;
        case LogLevel::WARN: return ::spdlog::level::warn;
        case LogLevel::ERROR: return ::spdlog::level::err;
        case LogLevel::CRITICAL: return ::spdlog::level::critical;
        case LogLevel::OFF: return ::spdlog::level::off;
        default: return ::spdlog::level::info;
    }
}

} // namespace log
} // namespace common
} // namespace strand
