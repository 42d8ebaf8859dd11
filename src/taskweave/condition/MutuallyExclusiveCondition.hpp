#pragma once
#include "Condition.hpp"

#include <string>
#include <utility>

namespace TW {

// Always satisfied. Declares that no two tasks carrying the same category may run at the same time.
struct MutuallyExclusiveCondition final : Condition {
    explicit MutuallyExclusiveCondition(std::string category) : category(std::move(category)) {}

    auto name() const -> std::string override { return this->category; }
    auto isMutuallyExclusive() const -> bool override { return true; }
    auto evaluateForTask(Task&, ConditionCompletion completion) -> void override { completion({}); }

private:
    std::string category;
};

} // namespace TW
