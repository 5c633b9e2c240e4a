#pragma once

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strand {
namespace core {
namespace injector {

using MemberName = std::string;

/**
 * @brief 成员依赖列表，按声明顺序解析
 */
using DependencyList = std::vector<MemberName>;

/**
 * @brief 依赖图：成员名称 -> 该成员依赖的成员列表
 */
using DependencyMap = std::unordered_map<MemberName, DependencyList>;

/**
 * @brief 一个环（强连通分量），成员名称已排序
 */
using Cycle = std::vector<MemberName>;

class DependencyLookup;

/**
 * @brief 成员构造函数，接收已解析的依赖，返回成员值
 */
using Provider = std::function<std::any(const DependencyLookup&)>;

/**
 * @brief 构造函数表：成员名称 -> 构造函数
 */
using ProviderTable = std::unordered_map<MemberName, Provider>;

/**
 * @brief 单行事件日志回调
 */
using LogSink = std::function<void(const std::string&)>;

/**
 * @brief 创建注入器时的环检测方式
 */
enum class CycleCheckMode {
    SKIP,       // 不检测，存在环时解析会耗尽调用栈
    SIMPLE,     // 发现第一个环即失败，不收集细节
    DETAILED    // 收集所有环，按强连通分量分组
};

/**
 * @brief 解析环检测方式字符串（skip/simple/detailed）
 * @return 未知字符串返回nullopt
 */
std::optional<CycleCheckMode> ParseCycleCheckMode(const std::string& mode);

const char* CycleCheckModeToString(CycleCheckMode mode);

/**
 * @brief 注入器选项
 */
struct InjectorOptions {
    CycleCheckMode check_for_cycles = CycleCheckMode::SIMPLE;
    LogSink log;
};

/**
 * @brief 未定义的依赖引用
 */
struct UndefinedReference {
    MemberName member;       // 声明依赖的成员
    MemberName dependency;   // 未定义的依赖名称

    bool operator==(const UndefinedReference& other) const {
        return member == other.member && dependency == other.dependency;
    }
};

/**
 * @brief 构造函数可见的依赖值视图
 *
 * 仅包含该成员声明的依赖，值由注入器缓存持有。
 */
class DependencyLookup {
public:
    explicit DependencyLookup(MemberName member) : member_(std::move(member)) {}

    /**
     * @brief 获取依赖值
     * @param name 依赖名称
     * @throws UndefinedDependencyError 名称不是该成员声明的依赖
     */
    const std::any& Get(const MemberName& name) const;

    /**
     * @brief 获取指定类型的依赖值
     * @throws std::bad_any_cast 类型不匹配
     */
    template<typename T>
    const T& Get(const MemberName& name) const {
        return std::any_cast<const T&>(Get(name));
    }

    bool Contains(const MemberName& name) const { return values_.count(name) > 0; }
    size_t Size() const { return values_.size(); }
    std::vector<MemberName> Names() const;

    const MemberName& GetMember() const { return member_; }

private:
    friend class Injector;

    void Set(const MemberName& name, const std::any& value) { values_[name] = &value; }

    MemberName member_;
    std::unordered_map<MemberName, const std::any*> values_;
};

} // namespace injector
} // namespace core
} // namespace strand
