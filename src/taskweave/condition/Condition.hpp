#pragma once
#include "core/Error.hpp"

#include <functional>
#include <memory>
#include <string>

namespace TW {

class Task;

using ConditionResult     = Expected<void>;
using ConditionCompletion = std::function<void(ConditionResult)>;

/**
 * Condition is an asynchronous precondition a Task must satisfy before it runs.
 *
 * Contract
 * --------
 * - name() identifies the condition in diagnostics. For mutually exclusive
 *   conditions it is also the exclusivity category.
 * - dependencyForTask(task) is asked once when the task is admitted. A
 *   returned task becomes a dependency of `task` and must be admitted by the
 *   scheduler as well.
 * - evaluateForTask(task, completion) must call `completion` exactly once,
 *   from any thread, at any later point. Conditions evaluating the same task
 *   run concurrently and may complete in any order.
 *
 * Conditions are usually stateless and may be shared between tasks.
 */
struct Condition {
    virtual ~Condition() = default;

    virtual auto name() const -> std::string = 0;
    virtual auto isMutuallyExclusive() const -> bool { return false; }
    virtual auto dependencyForTask(Task& /*task*/) -> std::shared_ptr<Task> { return nullptr; }
    virtual auto evaluateForTask(Task& task, ConditionCompletion completion) -> void = 0;
};

// Reported when a task was cancelled while its conditions were evaluated, or before they could be.
[[nodiscard]] inline auto conditionsCancelledError() -> Error {
    return Error{Error::Code::ConditionFailed, "Conditions failed: task was cancelled"};
}

} // namespace TW
