#pragma once
#include "core/Error.hpp"

#include <functional>
#include <utility>
#include <vector>

namespace TW {

class Task;

/**
 * Executable is the work a Task drives through its lifecycle.
 *
 * execute(task) is invoked once the Task has entered Executing and its
 * observers were told it started. The body may produce child tasks through
 * task.produceChild(...) and must eventually call task.finish(...), either
 * before returning or later from another thread.
 *
 * finished(task, errors) is invoked exactly once from inside finish(), with
 * the combined error list and before any observer hears about it. It also
 * runs for tasks that never executed (failed conditions, cancellation).
 */
struct Executable {
    virtual ~Executable() = default;

    virtual auto execute(Task& task) -> void = 0;
    virtual auto finished(Task& /*task*/, std::vector<Error> const& /*errors*/) -> void {}
};

// Adapts a plain callable. The task finishes as soon as the callable returns.
template <typename FunctionType>
struct FunctionExecutable final : Executable {
    explicit FunctionExecutable(FunctionType fun) : function(std::move(fun)) {}

    auto execute(Task& task) -> void override;

private:
    FunctionType function;
};

} // namespace TW
