#include "strand/common/log/strand_log_manager.h"
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>

namespace strand {
namespace common {
namespace log {

StrandLogManager& StrandLogManager::Instance() {
    static StrandLogManager instance;
    return instance;
}

bool StrandLogManager::InitializeFromString(const std::string& json_config) {
    try {
        return InitializeFromJson(nlohmann::json::parse(json_config));
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Failed to parse log config: " << e.what() << std::endl;
        return false;
    }
}

bool StrandLogManager::InitializeFromJson(const nlohmann::json& json_config) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (initialized_) {
        return true;
    }
    
    StrandLogConfig config;
    if (!config.LoadFromJson(json_config)) {
        return false;
    }
    
    // 先全部创建成功再安装，避免半初始化状态
    std::vector<std::shared_ptr<::spdlog::logger>> created;
    for (const auto& logger_config : config.GetLoggerConfigs()) {
        auto logger = CreateLogger(logger_config);
        if (!logger) {
            std::cerr << "Failed to create logger: " << logger_config.name << std::endl;
            return false;
        }
        created.push_back(std::move(logger));
    }
    
    config_ = std::move(config);
    for (auto& logger : created) {
        Install(std::move(logger));
    }
    initialized_ = true;
    return true;
}

std::shared_ptr<::spdlog::logger> StrandLogManager::GetLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        return it->second;
    }
    
    // 未配置的日志器不带sink
    LoggerConfig silent;
    silent.name = name;
    silent.level = config_.GetGlobalLogLevel();
    
    auto logger = CreateLogger(silent);
    if (logger) {
        Install(logger);
    }
    return logger;
}

void StrandLogManager::RegisterLogger(std::shared_ptr<::spdlog::logger> logger) {
    if (!logger) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    Install(std::move(logger));
}

void StrandLogManager::SetGlobalLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    config_.SetGlobalLogLevel(level);
    for (auto& pair : loggers_) {
        pair.second->set_level(ToSpdlogLevel(level));
    }
}

void StrandLogManager::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    for (auto& pair : loggers_) {
        pair.second->flush();
        ::spdlog::drop(pair.first);
    }
    
    loggers_.clear();
    config_ = StrandLogConfig{};
    initialized_ = false;
}

bool StrandLogManager::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::shared_ptr<::spdlog::logger> StrandLogManager::CreateLogger(const LoggerConfig& config) {
    try {
        std::vector<::spdlog::sink_ptr> sinks;
        
        if (!config.file.empty()) {
            const std::filesystem::path file_path(config.file);
            if (file_path.has_parent_path()) {
                std::filesystem::create_directories(file_path.parent_path());
            }
            sinks.push_back(std::make_shared<::spdlog::sinks::daily_file_sink_mt>(
                file_path.string(), 0, 0  // 每天0点0分创建新文件
            ));
        }
        
        if (config.console) {
            sinks.push_back(std::make_shared<::spdlog::sinks::stdout_color_sink_mt>());
        }
        
        auto logger = std::make_shared<::spdlog::logger>(config.name, sinks.begin(), sinks.end());
        logger->set_level(ToSpdlogLevel(config.level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        return logger;
        
    } catch (const std::exception& e) {
        std::cerr << "Exception creating logger " << config.name << ": " << e.what() << std::endl;
        return nullptr;
    }
}

void StrandLogManager::Install(std::shared_ptr<::spdlog::logger> logger) {
    const std::string name = logger->name();
    ::spdlog::drop(name);
    ::spdlog::register_logger(logger);
    loggers_[name] = std::move(logger);
}

std::function<void(const std::string&)> MakeLoggerSink(const std::string& logger_name, LogLevel level) {
    const auto spdlog_level = ToSpdlogLevel(level);
    return [logger_name, spdlog_level](const std::string& statement) {
        if (auto logger = STRAND_GET_LOGGER(logger_name)) {
            logger->log(spdlog_level, "{}", statement);
        }
    };
}

} // namespace log
} // namespace common
} // namespace strand
