#pragma once

#include "strand_log_common.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace strand {
namespace common {
namespace log {

/**
 * @brief 日志配置，对应JSON中的"logging"段
 *
 * {
 *   "global": { "log_level": "info" },
 *   "loggers": [ { "name": "injector", "level": "debug", "file": "logs/injector.log", "console": false } ]
 * }
 */
class StrandLogConfig {
public:
    /**
     * @brief 从JSON加载，失败时保持原有配置不变
     * @return 是否加载成功
     */
    bool LoadFromJson(const nlohmann::json& config);
    
    const std::vector<LoggerConfig>& GetLoggerConfigs() const { return logger_configs_; }
    const LoggerConfig* GetLoggerConfig(const std::string& name) const;
    
    LogLevel GetGlobalLogLevel() const { return global_log_level_; }
    void SetGlobalLogLevel(LogLevel level) { global_log_level_ = level; }

private:
    std::vector<LoggerConfig> logger_configs_;
    LogLevel global_log_level_{LogLevel::INFO};
};

} // namespace log
} // namespace common
} // namespace strand
