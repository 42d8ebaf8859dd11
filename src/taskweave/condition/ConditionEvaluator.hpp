#pragma once
#include "Condition.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace TW {

/**
 * Evaluates a task's conditions concurrently and joins on all of them.
 *
 * Every condition is started before the call returns; `completion` is invoked
 * exactly once, on the thread that delivers the last result (or inline when
 * there are no conditions or all of them complete synchronously).
 *
 * Failures are reported in the order the conditions were declared, not the
 * order they completed. If the task is cancelled by the time the last result
 * arrives, conditionsCancelledError() is appended.
 */
struct ConditionEvaluator {
    using Completion = std::function<void(std::vector<Error>)>;

    static auto evaluate(std::vector<std::shared_ptr<Condition>> conditions,
                         std::shared_ptr<Task>                   task,
                         Completion                              completion) -> void;
};

} // namespace TW
