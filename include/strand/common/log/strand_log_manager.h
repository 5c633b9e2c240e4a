#pragma once

#include "strand_log_common.h"
#include "strand_log_config.h"
#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace strand {
namespace common {
namespace log {

/**
 * @brief 进程内日志器管理
 *
 * 只有配置中显式给出file的日志器才会写文件。
 * 未配置的日志器按需创建，没有sink，不产生任何输出。
 */
class StrandLogManager {
public:
    static StrandLogManager& Instance();
    
    bool InitializeFromString(const std::string& json_config);
    bool InitializeFromJson(const nlohmann::json& json_config);
    
    std::shared_ptr<::spdlog::logger> GetLogger(const std::string& name);
    
    /**
     * @brief 注册外部创建的日志器（例如测试中使用的内存sink）
     * @param logger 日志器实例，同名日志器会被替换
     */
    void RegisterLogger(std::shared_ptr<::spdlog::logger> logger);
    
    void SetGlobalLogLevel(LogLevel level);
    void Shutdown();
    
    bool IsInitialized() const;
    
    const StrandLogConfig& GetConfig() const { return config_; }

private:
    StrandLogManager() = default;
    ~StrandLogManager() = default;
    StrandLogManager(const StrandLogManager&) = delete;
    StrandLogManager& operator=(const StrandLogManager&) = delete;
    
    std::shared_ptr<::spdlog::logger> CreateLogger(const LoggerConfig& config);
    void Install(std::shared_ptr<::spdlog::logger> logger);
    
    StrandLogConfig config_;
    std::unordered_map<std::string, std::shared_ptr<::spdlog::logger>> loggers_;
    mutable std::mutex mutex_;
    bool initialized_{false};
};

/**
 * @brief 把指定名称的日志器适配为单行事件回调
 * @param logger_name 日志器名称
 * @param level 事件写入的级别
 */
std::function<void(const std::string&)> MakeLoggerSink(const std::string& logger_name,
                                                       LogLevel level = LogLevel::DEBUG);

// 便捷宏定义
#define STRAND_LOG_MANAGER() strand::common::log::StrandLogManager::Instance()
#define STRAND_GET_LOGGER(name) STRAND_LOG_MANAGER().GetLogger(name)

// 便捷日志宏
#define STRAND_LOG_DEBUG(logger_name, ...) if(auto logger = STRAND_GET_LOGGER(logger_name)) logger->debug(__VA_ARGS__)
#define STRAND_LOG_INFO(logger_name, ...) if(auto logger = STRAND_GET_LOGGER(logger_name)) logger->info(__VA_ARGS__)
#define STRAND_LOG_WARN(logger_name, ...) if(auto logger = STRAND_GET_LOGGER(logger_name)) logger->warn(__VA_ARGS__)

} // namespace log
} // namespace common
} // namespace strand
