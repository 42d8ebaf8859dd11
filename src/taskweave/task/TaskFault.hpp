#pragma once
#include "TaskState.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace TW {

/**
 * TaskFault signals a misuse of the Task contract: an illegal state transition,
 * execute() outside of Ready, or mutating conditions, observers or dependencies
 * after execution began. It is never delivered as a Task error; left uncaught on a
 * worker thread it terminates the process.
 */
class TaskFault : public std::logic_error {
public:
    TaskFault(std::uint64_t taskId, std::string const& label, TaskState state, std::string const& reason)
        : std::logic_error(format(taskId, label, state, reason)), taskId(taskId), state(state) {}

    std::uint64_t const taskId;
    TaskState const     state;

private:
    static auto format(std::uint64_t taskId, std::string const& label, TaskState state, std::string const& reason) -> std::string {
        std::string out = "Task #" + std::to_string(taskId);
        if (!label.empty())
            out += " '" + label + "'";
        out += " [";
        out += taskStateToString(state);
        out += "]: " + reason;
        return out;
    }
};

} // namespace TW
