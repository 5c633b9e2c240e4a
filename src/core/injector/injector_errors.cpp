#include "strand/core/injector/injector_errors.h"
#include "strand/core/injector/cycle_detector.h"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace strand {
namespace core {
namespace injector {

CyclicDependencyError::CyclicDependencyError(const std::string& message,
                                             std::optional<std::vector<Cycle>> cycles)
    : InjectorException(InjectorErrorCode::CYCLIC_DEPENDENCY, message) {
    if (cycles) {
        cycles_ = NormalizeCycles(std::move(*cycles));
    }
}

std::string CyclicDependencyError::ToString() const {
    std::string result = fmt::format("CyclicDependencyError: {}", what());
    if (!cycles_) {
        return result;
    }

    result += "\nCycles: [\n";
    for (const auto& cycle : *cycles_) {
        result += fmt::format("    [{}]\n", fmt::join(cycle, ", "));
    }
    result += "]";
    return result;
}

UndefinedDependencyError::UndefinedDependencyError(const MemberName& member, const MemberName& dependency)
    : InjectorException(InjectorErrorCode::UNDEFINED_DEPENDENCY, BuildMessage(member, dependency))
    , member_(member)
    , dependency_(dependency) {}

UndefinedDependencyError::UndefinedDependencyError(const MemberName& member, const MemberName& dependency,
                                                   const std::string& message)
    : InjectorException(InjectorErrorCode::UNDEFINED_DEPENDENCY, message)
    , member_(member)
    , dependency_(dependency) {}

UndefinedDependencyError UndefinedDependencyError::MissingProvider(const MemberName& member) {
    return UndefinedDependencyError(member, member, fmt::format("Member '{}' has no provider", member));
}

std::string UndefinedDependencyError::BuildMessage(const MemberName& member, const MemberName& dependency) {
    if (member.empty()) {
        return fmt::format("Member '{}' is not defined", dependency);
    }
    return fmt::format("Member '{}' depends on undefined member '{}'", member, dependency);
}

} // namespace injector
} // namespace core
} // namespace strand
