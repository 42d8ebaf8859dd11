#pragma once
#include "TaskState.hpp"

#include <mutex>
#include <string_view>

namespace TW {

enum class TransitionResult {
    Changed,  // State moved to the target
    Absorbed, // State was already Finished, request ignored
    Illegal   // Transition not allowed from the current state
};

// Mutex guarded storage for a TaskState. Every read and write of a task's state goes through here.
struct TaskStateGuard {
    TaskStateGuard() = default; // Starts in Initialized

    TaskStateGuard(TaskStateGuard const&)            = delete;
    TaskStateGuard& operator=(TaskStateGuard const&) = delete;

    auto transitionTo(TaskState target) -> TransitionResult;                     // Attempts to move to target under the lock
    auto transitionFrom(TaskState expected, TaskState target) -> TransitionResult; // Same, but Illegal unless the state is still `expected`

    auto get() const -> TaskState;          // Current state, read under the lock
    auto isFinished() const -> bool;        // State is Finished
    auto toString() const -> std::string_view; // String representation of the current state

private:
    mutable std::mutex mutex;
    TaskState          state{TaskState::Initialized};
};

} // namespace TW
