#pragma once

#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace strand {
namespace common {
namespace log {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/**
 * @brief 单个日志器的输出配置
 *
 * file为空时不写文件；file和console都未配置时日志器没有sink，输出被丢弃。
 */
struct LoggerConfig {
    std::string name;
    LogLevel level = LogLevel::INFO;
    std::string file;       // 按天分割的日志文件路径
    bool console = false;   // 是否同时输出到stdout
};

::spdlog::level::level_enum ToSpdlogLevel(LogLevel level);

/**
 * @brief 解析日志级别字符串（trace/debug/info/warn/error/critical/off）
 * @return 未知字符串返回nullopt
 */
std::optional<LogLevel> ParseLogLevel(const std::string& level_str);

} // namespace log
} // namespace common
} // namespace strand
