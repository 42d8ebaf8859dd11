#include "TaskStateGuard.hpp"

namespace TW {

auto taskStateToString(TaskState state) -> std::string_view {
    switch (state) {
        case TaskState::Initialized:
            return "Initialized";
        case TaskState::Pending:
            return "Pending";
        case TaskState::EvaluatingConditions:
            return "EvaluatingConditions";
        case TaskState::Ready:
            return "Ready";
        case TaskState::Executing:
            return "Executing";
        case TaskState::Finishing:
            return "Finishing";
        case TaskState::Finished:
            return "Finished";
        default:
            return "Unknown";
    }
}

auto TaskStateGuard::transitionTo(TaskState target) -> TransitionResult {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->state == TaskState::Finished)
        return TransitionResult::Absorbed;
    if (!canTransition(this->state, target))
        return TransitionResult::Illegal;
    this->state = target;
    return TransitionResult::Changed;
}

auto TaskStateGuard::transitionFrom(TaskState expected, TaskState target) -> TransitionResult {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->state == TaskState::Finished)
        return TransitionResult::Absorbed;
    if (this->state != expected || !canTransition(this->state, target))
        return TransitionResult::Illegal;
    this->state = target;
    return TransitionResult::Changed;
}

auto TaskStateGuard::get() const -> TaskState {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->state;
}

auto TaskStateGuard::isFinished() const -> bool {
    return this->get() == TaskState::Finished;
}

auto TaskStateGuard::toString() const -> std::string_view {
    return taskStateToString(this->get());
}

} // namespace TW
