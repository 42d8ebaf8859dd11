#pragma once
#include <string_view>

namespace TW {

// Lifecycle of a Task. The underlying values define the ordering used for comparisons.
enum class TaskState {
    Initialized          = 0, // Created, not yet admitted by a scheduler
    Pending              = 1, // Admitted, waiting for dependencies
    EvaluatingConditions = 2, // Conditions are being evaluated asynchronously
    Ready                = 3, // Conditions landed, may be executed
    Executing            = 4, // Executable body is running
    Finishing            = 5, // finish() is delivering errors to the hook and observers
    Finished             = 6  // Terminal, absorbs every further transition
};

// Convert TaskState to string for logging and faults
auto taskStateToString(TaskState state) -> std::string_view;

// Whether the state machine accepts moving from `from` to `to`. Finished never accepts anything.
constexpr auto canTransition(TaskState from, TaskState to) -> bool {
    switch (from) {
        case TaskState::Initialized:
            return to == TaskState::Pending;
        case TaskState::Pending:
            return to == TaskState::EvaluatingConditions;
        case TaskState::EvaluatingConditions:
            return to == TaskState::Ready;
        case TaskState::Ready:
            return to == TaskState::Executing || to == TaskState::Finishing;
        case TaskState::Executing:
            return to == TaskState::Finishing;
        case TaskState::Finishing:
            return to == TaskState::Finished;
        case TaskState::Finished:
            return false;
    }
    return false;
}

} // namespace TW
