#include "strand/core/injector/cycle_detector.h"
#include <algorithm>
#include <unordered_set>

namespace strand {
namespace core {
namespace injector {

namespace {

enum class VisitState {
    VISITING,
    VISITED
};

/**
 * @brief 三态深度优先遍历，发现第一个环即停止
 */
class CycleSearch {
public:
    explicit CycleSearch(const DependencyMap& dependencies) : dependencies_(dependencies) {}

    bool Run() {
        for (const auto& pair : dependencies_) {
            if (states_.find(pair.first) == states_.end() && Visit(pair.first)) {
                return true;
            }
        }
        return false;
    }

private:
    bool Visit(const MemberName& name) {
        states_[name] = VisitState::VISITING;

        auto it = dependencies_.find(name);
        if (it != dependencies_.end()) {
            for (const auto& neighbor : it->second) {
                auto state = states_.find(neighbor);
                if (state == states_.end()) {
                    if (Visit(neighbor)) {
                        return true;
                    }
                } else if (state->second == VisitState::VISITING) {
                    // 包括自环
                    return true;
                }
            }
        }

        states_[name] = VisitState::VISITED;
        return false;
    }

    const DependencyMap& dependencies_;
    std::unordered_map<MemberName, VisitState> states_;
};

/**
 * @brief 基于low-link的强连通分量查找
 *
 * 节点的low-link只通过指向尚未归入分量的节点的边降低，
 * 因此分量划分与遍历顺序无关。
 */
class ComponentFinder {
public:
    explicit ComponentFinder(const DependencyMap& dependencies) : dependencies_(dependencies) {}

    std::vector<Cycle> Run() {
        for (const auto& pair : dependencies_) {
            if (nodes_.find(pair.first) == nodes_.end()) {
                Visit(pair.first);
            }
        }

        // 按根节点分组
        std::unordered_map<MemberName, Cycle> components;
        for (const auto& pair : nodes_) {
            components[pair.second.root].push_back(pair.first);
        }

        std::vector<Cycle> cycles;
        for (auto& pair : components) {
            auto& members = pair.second;
            if (members.size() > 1 || self_loops_.count(members.front()) > 0) {
                cycles.push_back(std::move(members));
            }
        }
        return NormalizeCycles(std::move(cycles));
    }

private:
    struct NodeInfo {
        size_t visit_index = 0;
        size_t low_link = 0;
        bool settled = false;   // 已归入某个分量
        MemberName root;
    };

    void Visit(const MemberName& name) {
        const size_t visit_index = next_visit_index_++;
        pending_.push_back(name);

        NodeInfo info;
        info.visit_index = visit_index;
        info.low_link = visit_index;
        nodes_[name] = info;

        auto it = dependencies_.find(name);
        if (it != dependencies_.end()) {
            for (const auto& neighbor : it->second) {
                if (neighbor == name) {
                    self_loops_.insert(name);
                    continue;
                }

                auto found = nodes_.find(neighbor);
                if (found == nodes_.end()) {
                    Visit(neighbor);
                    found = nodes_.find(neighbor);
                } else if (found->second.settled) {
                    // 属于已完成的其他分量
                    continue;
                }

                auto& self = nodes_[name];
                self.low_link = std::min(self.low_link, found->second.low_link);
            }
        }

        auto& self = nodes_[name];
        if (self.low_link != self.visit_index) {
            return;
        }

        // 当前节点是分量的根，收拢其后访问且尚未归属的节点
        while (!pending_.empty()) {
            MemberName member = pending_.back();
            pending_.pop_back();

            auto& member_info = nodes_[member];
            member_info.settled = true;
            member_info.root = name;
            member_info.low_link = visit_index;

            if (member == name) {
                break;
            }
        }
    }

    const DependencyMap& dependencies_;
    std::unordered_map<MemberName, NodeInfo> nodes_;
    size_t next_visit_index_ = 0;
    std::vector<MemberName> pending_;
    std::unordered_set<MemberName> self_loops_;
};

std::string JoinNames(const Cycle& cycle) {
    std::string joined;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            joined += ',';
        }
        joined += cycle[i];
    }
    return joined;
}

} // anonymous namespace

bool HasAnyCycle(const DependencyMap& dependencies) {
    return CycleSearch(dependencies).Run();
}

std::vector<Cycle> FindCycles(const DependencyMap& dependencies) {
    return ComponentFinder(dependencies).Run();
}

std::vector<Cycle> NormalizeCycles(std::vector<Cycle> cycles) {
    for (auto& cycle : cycles) {
        std::sort(cycle.begin(), cycle.end());
    }

    std::sort(cycles.begin(), cycles.end(), [](const Cycle& a, const Cycle& b) {
        if (a.size() != b.size()) {
            return a.size() < b.size();
        }
        return JoinNames(a) < JoinNames(b);
    });

    return cycles;
}

std::vector<UndefinedReference> FindUndefinedDependencies(const DependencyMap& dependencies) {
    std::vector<UndefinedReference> undefined;

    for (const auto& pair : dependencies) {
        for (const auto& dependency : pair.second) {
            if (dependencies.find(dependency) == dependencies.end()) {
                undefined.push_back(UndefinedReference{pair.first, dependency});
            }
        }
    }

    std::sort(undefined.begin(), undefined.end(), [](const UndefinedReference& a, const UndefinedReference& b) {
        if (a.member != b.member) {
            return a.member < b.member;
        }
        return a.dependency < b.dependency;
    });
    undefined.erase(std::unique(undefined.begin(), undefined.end()), undefined.end());

    return undefined;
}

ValidationResult Validate(const DependencyMap& dependencies, CycleCheckMode mode) {
    ValidationResult result;

    switch (mode) {
        case CycleCheckMode::SKIP:
            return result;
        case CycleCheckMode::SIMPLE:
            result.undefined = FindUndefinedDependencies(dependencies);
            result.has_cycle = HasAnyCycle(dependencies);
            break;
        case CycleCheckMode::DETAILED:
            result.undefined = FindUndefinedDependencies(dependencies);
            result.cycles = FindCycles(dependencies);
            result.has_cycle = !result.cycles.empty();
            break;
    }

    return result;
}

} // namespace injector
} // namespace core
} // namespace strand
