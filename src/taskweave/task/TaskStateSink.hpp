#pragma once
#include "TaskState.hpp"

namespace TW {

class Task;

/**
 * TaskStateSink is how a scheduler hears about a Task's state changes.
 *
 * A Task holds only a weak_ptr<TaskStateSink>; when the sink has expired the
 * notifications are skipped. For each state change that actually happens the
 * Task calls taskStateWillChange before taking its state lock and
 * taskStateDidChange after releasing it, so the sink may re-read isReady(),
 * isExecuting() or isFinished() from inside either callback. `from` is the
 * state the change was made from. If another thread finished the task between
 * the two calls, taskStateWillChange is not followed by taskStateDidChange.
 *
 * Cancellation does not change the state but does change readiness, it is
 * reported through taskWasCancelled.
 */
struct TaskStateSink {
    virtual ~TaskStateSink() = default;

    virtual void taskStateWillChange(Task& task, TaskState from, TaskState to) = 0;
    virtual void taskStateDidChange(Task& task, TaskState from, TaskState to)  = 0;
    virtual void taskWasCancelled(Task& /*task*/) {}
};

} // namespace TW
