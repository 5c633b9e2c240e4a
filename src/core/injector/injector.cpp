#include "strand/core/injector/injector.h"
#include "strand/common/log/strand_log_manager.h"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace strand {
namespace core {
namespace injector {

namespace {

constexpr const char* kLoggerName = "injector";

} // anonymous namespace

std::optional<CycleCheckMode> ParseCycleCheckMode(const std::string& mode) {
    if (mode == "skip") return CycleCheckMode::SKIP;
    if (mode == "simple") return CycleCheckMode::SIMPLE;
    if (mode == "detailed") return CycleCheckMode::DETAILED;
    return std::nullopt;
}

const char* CycleCheckModeToString(CycleCheckMode mode) {
    switch (mode) {
        case CycleCheckMode::SKIP: return "skip";
        case CycleCheckMode::SIMPLE: return "simple";
        case CycleCheckMode::DETAILED: return "detailed";
        default: return "unknown";
    }
}

const std::any& DependencyLookup::Get(const MemberName& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw UndefinedDependencyError(member_, name);
    }
    return *it->second;
}

std::vector<MemberName> DependencyLookup::Names() const {
    std::vector<MemberName> names;
    names.reserve(values_.size());
    for (const auto& pair : values_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

Injector::Injector(DependencyMap dependencies, ProviderTable providers, InjectorOptions options)
    : dependencies_(std::move(dependencies))
    , providers_(std::move(providers))
    , options_(std::move(options)) {
    ValidateOrThrow();
    STRAND_LOG_DEBUG(kLoggerName, "Injector created: {} members, cycle check {}",
                     dependencies_.size(), CycleCheckModeToString(options_.check_for_cycles));
}

void Injector::ValidateOrThrow() const {
    if (options_.check_for_cycles == CycleCheckMode::SKIP) {
        return;
    }
    
    ValidationResult result = Validate(dependencies_, options_.check_for_cycles);
    
    if (!result.undefined.empty()) {
        const auto& first = result.undefined.front();
        STRAND_LOG_WARN(kLoggerName, "Dependency validation failed: {} undefined reference(s), first '{}' -> '{}'",
                        result.undefined.size(), first.member, first.dependency);
        throw UndefinedDependencyError(first.member, first.dependency);
    }
    
    if (result.has_cycle) {
        if (options_.check_for_cycles == CycleCheckMode::DETAILED) {
            CyclicDependencyError error(CyclicDependencyError::STANDARD_MESSAGE, std::move(result.cycles));
            STRAND_LOG_WARN(kLoggerName, "{}", error.ToString());
            throw error;
        }
        
        STRAND_LOG_WARN(kLoggerName, "Cycle check ({}) failed: {}",
                        CycleCheckModeToString(options_.check_for_cycles), CyclicDependencyError::STANDARD_MESSAGE);
        throw CyclicDependencyError(CyclicDependencyError::STANDARD_MESSAGE);
    }
    
    std::vector<MemberName> missing_providers;
    for (const auto& pair : dependencies_) {
        auto it = providers_.find(pair.first);
        if (it == providers_.end() || !it->second) {
            missing_providers.push_back(pair.first);
        }
    }
    if (!missing_providers.empty()) {
        std::sort(missing_providers.begin(), missing_providers.end());
        STRAND_LOG_WARN(kLoggerName, "Dependency validation failed: no provider for [{}]",
                        fmt::join(missing_providers, ", "));
        throw UndefinedDependencyError::MissingProvider(missing_providers.front());
    }
}

const std::any& Injector::Get(const MemberName& name) {
    return Resolve(name, "");
}

const std::any& Injector::Resolve(const MemberName& name, const MemberName& requester) {
    Emit(name, "get");
    
    auto cached = cache_.find(name);
    if (cached != cache_.end()) {
        Emit(name, "already constructed");
        return cached->second;
    }
    
    auto deps = dependencies_.find(name);
    if (deps == dependencies_.end()) {
        throw UndefinedDependencyError(requester, name);
    }
    
    Emit(name, "constructing");
    
    // 按声明顺序解析依赖，缓存中的元素地址在rehash后保持不变
    DependencyLookup lookup(name);
    for (const auto& dependency : deps->second) {
        lookup.Set(dependency, Resolve(dependency, name));
    }
    
    auto provider = providers_.find(name);
    if (provider == providers_.end() || !provider->second) {
        throw UndefinedDependencyError::MissingProvider(name);
    }
    
    std::any value = provider->second(lookup);
    
    auto inserted = cache_.emplace(name, std::move(value));
    Emit(name, "constructed");
    return inserted.first->second;
}

bool Injector::HasMember(const MemberName& name) const {
    return dependencies_.find(name) != dependencies_.end();
}

bool Injector::IsConstructed(const MemberName& name) const {
    return cache_.find(name) != cache_.end();
}

std::vector<MemberName> Injector::GetMemberNames() const {
    std::vector<MemberName> names;
    names.reserve(dependencies_.size());
    for (const auto& pair : dependencies_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

const DependencyList& Injector::GetDependencies(const MemberName& name) const {
    auto it = dependencies_.find(name);
    if (it == dependencies_.end()) {
        throw UndefinedDependencyError("", name);
    }
    return it->second;
}

void Injector::Emit(const MemberName& name, const char* event) const {
    if (options_.log) {
        options_.log(fmt::format("{} - {}", name, event));
    }
}

std::unique_ptr<Injector> MakeInjector(DependencyMap dependencies, ProviderTable providers,
                                       InjectorOptions options) {
    return std::make_unique<Injector>(std::move(dependencies), std::move(providers), std::move(options));
}

} // namespace injector
} // namespace core
} // namespace strand
