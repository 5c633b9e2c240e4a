#pragma once

#include "injector_types.h"
#include "strand/common/log/strand_log_common.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace strand {
namespace core {
namespace injector {

/**
 * @brief 注入器配置，对应JSON中的"injector"段
 */
struct InjectorSettings {
    CycleCheckMode check_for_cycles = CycleCheckMode::SIMPLE;
    bool log_events = false;                                     // 是否把事件写入日志器
    std::string logger = "injector";                             // 事件日志器名称
    common::log::LogLevel log_level = common::log::LogLevel::DEBUG;
};

/**
 * @brief 注入器配置管理类
 */
class InjectorConfig {
public:
    InjectorConfig() = default;
    ~InjectorConfig() = default;
    
    // 禁止拷贝和赋值
    InjectorConfig(const InjectorConfig&) = delete;
    InjectorConfig& operator=(const InjectorConfig&) = delete;
    
    /**
     * @brief 从JSON文件加载配置
     * @param config_file 配置文件路径
     * @return 是否加载成功
     */
    bool LoadFromFile(const std::string& config_file);
    
    /**
     * @brief 从JSON字符串加载配置
     * @param json_content JSON字符串内容
     * @return 是否加载成功
     */
    bool LoadFromString(const std::string& json_content);
    
    /**
     * @brief 验证配置是否有效
     */
    bool Validate() const;
    
    bool IsLoaded() const { return loaded_; }
    
    const InjectorSettings& GetSettings() const { return settings_; }
    
    /**
     * @brief 获取"logging"段，交给StrandLogManager初始化
     */
    std::optional<nlohmann::json> GetLoggingSection() const;
    
    /**
     * @brief 生成注入器选项
     *
     * log_events为true时，事件通过MakeLoggerSink写入配置的日志器。
     */
    InjectorOptions ToOptions() const;

private:
    bool ParseInjectorSection(const nlohmann::json& json);
    
    InjectorSettings settings_;
    nlohmann::json raw_config_;
    bool loaded_ = false;
};

} // namespace injector
} // namespace core
} // namespace strand
