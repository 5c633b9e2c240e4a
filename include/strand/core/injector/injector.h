#pragma once

#include "injector_types.h"
#include "injector_errors.h"
#include "cycle_detector.h"
#include <any>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace strand {
namespace core {
namespace injector {

/**
 * @brief 惰性依赖注入器
 *
 * 每个成员在第一次访问时构造：先按声明顺序递归解析其依赖，
 * 再调用构造函数，结果写入缓存后不再重建。
 * 构造函数抛出的异常原样传给调用方，失败的成员不会写入缓存，
 * 已经构造成功的依赖保留在缓存中。
 *
 * 单线程使用。多线程访问需要调用方在外部加锁。
 * 以SKIP模式创建且依赖图确实有环时，访问环上的成员会无限递归直到栈耗尽。
 */
class Injector {
public:
    /**
     * @brief 构造函数，按选项校验依赖图
     * @param dependencies 依赖图
     * @param providers 构造函数表
     * @param options 注入器选项
     * @throws UndefinedDependencyError 依赖未定义或缺少构造函数（SKIP模式下延迟到访问时）
     * @throws CyclicDependencyError 依赖图存在环（SKIP模式下不检测）
     */
    Injector(DependencyMap dependencies, ProviderTable providers, InjectorOptions options = {});
    
    ~Injector() = default;
    
    // 禁止拷贝和赋值
    Injector(const Injector&) = delete;
    Injector& operator=(const Injector&) = delete;
    
    /**
     * @brief 获取成员，必要时构造
     * @param name 成员名称
     * @return 缓存中的成员值，引用在注入器生命周期内有效
     * @throws UndefinedDependencyError 成员不存在
     */
    const std::any& Get(const MemberName& name);
    
    /**
     * @brief 获取指定类型的成员
     * @throws std::bad_any_cast 类型不匹配
     */
    template<typename T>
    const T& Get(const MemberName& name) {
        return std::any_cast<const T&>(Get(name));
    }
    
    bool HasMember(const MemberName& name) const;
    
    /**
     * @brief 成员是否已经构造
     */
    bool IsConstructed(const MemberName& name) const;
    
    /**
     * @brief 获取所有成员名称（已排序）
     */
    std::vector<MemberName> GetMemberNames() const;
    
    /**
     * @brief 获取成员声明的依赖
     * @throws UndefinedDependencyError 成员不存在
     */
    const DependencyList& GetDependencies(const MemberName& name) const;
    
    size_t GetMemberCount() const { return dependencies_.size(); }
    size_t GetConstructedCount() const { return cache_.size(); }
    
    CycleCheckMode GetCycleCheckMode() const { return options_.check_for_cycles; }

private:
    void ValidateOrThrow() const;
    
    // requester为空表示顶层访问
    const std::any& Resolve(const MemberName& name, const MemberName& requester);
    
    void Emit(const MemberName& name, const char* event) const;
    
    DependencyMap dependencies_;
    ProviderTable providers_;
    InjectorOptions options_;
    
    // 成员缓存，只增不删
    std::unordered_map<MemberName, std::any> cache_;
};

/**
 * @brief 创建注入器
 */
std::unique_ptr<Injector> MakeInjector(DependencyMap dependencies, ProviderTable providers,
                                       InjectorOptions options = {});

} // namespace injector
} // namespace core
} // namespace strand
