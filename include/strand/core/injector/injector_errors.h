#pragma once

#include "injector_types.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace strand {
namespace core {
namespace injector {

/**
 * @brief 注入器错误码
 */
enum class InjectorErrorCode {
    CYCLIC_DEPENDENCY,
    UNDEFINED_DEPENDENCY
};

/**
 * @brief 注入器异常基类
 */
class InjectorException : public std::runtime_error {
public:
    InjectorException(InjectorErrorCode code, const std::string& message)
        : std::runtime_error(message), error_code_(code) {}

    InjectorErrorCode GetErrorCode() const { return error_code_; }

private:
    InjectorErrorCode error_code_;
};

/**
 * @brief 依赖图中存在环
 *
 * SIMPLE模式下只表示存在环；DETAILED模式下携带规范化后的环列表：
 * 每个环内部按名称排序，环之间先按大小、再按逗号拼接后的名称排序。
 */
class CyclicDependencyError : public InjectorException {
public:
    static constexpr const char* STANDARD_MESSAGE = "At least one cycle found in provided dependencies";

    explicit CyclicDependencyError(const std::string& message = STANDARD_MESSAGE,
                                   std::optional<std::vector<Cycle>> cycles = std::nullopt);

    const std::optional<std::vector<Cycle>>& GetCycles() const { return cycles_; }

    /**
     * @brief 可复现的文本表示，每个环单独一行
     */
    std::string ToString() const;

private:
    std::optional<std::vector<Cycle>> cycles_;
};

/**
 * @brief 引用了依赖图中不存在的成员
 */
class UndefinedDependencyError : public InjectorException {
public:
    /**
     * @param member 引用方成员，顶层访问时为空
     * @param dependency 未定义的名称
     */
    UndefinedDependencyError(const MemberName& member, const MemberName& dependency);

    /**
     * @brief 依赖图中声明了成员，但构造函数表中没有对应的构造函数
     */
    static UndefinedDependencyError MissingProvider(const MemberName& member);

    const MemberName& GetMember() const { return member_; }
    const MemberName& GetDependency() const { return dependency_; }

private:
    UndefinedDependencyError(const MemberName& member, const MemberName& dependency, const std::string& message);

    static std::string BuildMessage(const MemberName& member, const MemberName& dependency);

    MemberName member_;
    MemberName dependency_;
};

} // namespace injector
} // namespace core
} // namespace strand
