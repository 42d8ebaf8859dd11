#pragma once
#include "core/Error.hpp"

#include <memory>
#include <vector>

namespace TW {

class Task;

// Passive listener attached to one Task. Calls arrive synchronously, in the order the observers were added.
struct TaskObserver {
    virtual ~TaskObserver() = default;

    // Immediately before the task's executable body runs
    virtual auto taskDidStart(Task& task) -> void = 0;

    // The task produced a new schedulable unit that the scheduler should admit
    virtual auto taskDidProduce(Task& task, std::shared_ptr<Task> const& child) -> void = 0;

    // The task finished, with every error gathered during condition evaluation, cancellation and execution
    virtual auto taskDidFinish(Task& task, std::vector<Error> const& errors) -> void = 0;
};

} // namespace TW
