#pragma once

#include "injector_types.h"
#include <vector>

namespace strand {
namespace core {
namespace injector {

/**
 * @brief 依赖图校验结果
 */
struct ValidationResult {
    bool has_cycle = false;
    std::vector<Cycle> cycles;                          // 仅DETAILED模式填充
    std::vector<UndefinedReference> undefined;          // 按成员、依赖名称排序

    bool IsValid() const { return !has_cycle && undefined.empty(); }
};

/**
 * @brief 判断依赖图中是否存在环
 *
 * 三态深度优先遍历，遇到指向正在访问节点的边（包括自环）立即返回。
 * 不在图中的依赖名称视为没有出边。
 */
bool HasAnyCycle(const DependencyMap& dependencies);

/**
 * @brief 找出所有环，按强连通分量分组
 *
 * 单次low-link遍历。大小为1的分量只有存在自环时才算作环。
 * 返回结果已经过NormalizeCycles处理，与遍历顺序无关。
 */
std::vector<Cycle> FindCycles(const DependencyMap& dependencies);

/**
 * @brief 规范化环列表：环内排序，环之间按大小、再按逗号拼接的名称排序
 */
std::vector<Cycle> NormalizeCycles(std::vector<Cycle> cycles);

/**
 * @brief 找出所有引用了未定义成员的依赖
 */
std::vector<UndefinedReference> FindUndefinedDependencies(const DependencyMap& dependencies);

/**
 * @brief 按指定方式校验依赖图，SKIP模式不访问依赖图
 */
ValidationResult Validate(const DependencyMap& dependencies, CycleCheckMode mode);

} // namespace injector
} // namespace core
} // namespace strand
