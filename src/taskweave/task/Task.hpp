#pragma once
#include "Executable.hpp"
#include "TaskFault.hpp"
#include "TaskStateGuard.hpp"
#include "TaskStateSink.hpp"
#include "condition/Condition.hpp"
#include "core/Error.hpp"
#include "core/TaskOptions.hpp"
#include "observer/TaskObserver.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace TW {

/**
 * Task is a schedulable unit of work with an explicit lifecycle.
 *
 *   Initialized -> Pending -> EvaluatingConditions -> Ready -> Executing -> Finishing -> Finished
 *                                                       \________________________/
 *
 * The Task does not run itself. An external scheduler admits it
 * (willEnqueue), reports when its dependencies finished
 * (dependenciesSatisfied), watches isReady and calls execute. The executable
 * body eventually calls finish, which delivers every accumulated error once
 * to the body's finished hook and then to each observer.
 *
 * Misuse of this contract throws TaskFault.
 */
class Task : public std::enable_shared_from_this<Task> {
public:
    static auto Create(std::unique_ptr<Executable> body, TaskOptions options = {}) -> std::shared_ptr<Task>;

    template <typename FunctionType>
        requires std::is_invocable_v<FunctionType&, Task&>
    static auto Create(FunctionType&& fun, TaskOptions options = {}) -> std::shared_ptr<Task> {
        using Body = FunctionExecutable<std::decay_t<FunctionType>>;
        return Create(std::make_unique<Body>(std::forward<FunctionType>(fun)), std::move(options));
    }

    ~Task();

    // Scheduler contract
    auto willEnqueue() -> std::vector<std::shared_ptr<Task>>;
    auto dependenciesSatisfied() -> bool;
    auto execute() -> void;
    auto setStateSink(std::weak_ptr<TaskStateSink> sink) -> void;

    auto isReady() const -> bool;
    auto isExecuting() const -> bool;
    auto isFinished() const -> bool;
    auto isCancelled() const -> bool;
    auto state() const -> TaskState;

    // Configuration. Conditions are accepted until evaluation begins, conditions that
    // contribute exclusivity or dependencies only before willEnqueue(), the rest until execution
    auto addCondition(std::shared_ptr<Condition> condition) -> void;
    auto addObserver(std::shared_ptr<TaskObserver> observer) -> void;
    auto addDependency(std::shared_ptr<Task> const& task) -> void;
    auto removeDependency(std::shared_ptr<Task> const& task) -> void;

    auto conditions() const -> std::vector<std::shared_ptr<Condition>>;
    auto dependencies() const -> std::vector<std::shared_ptr<Task>>;
    auto dependenciesFinished() const -> bool;

    // Called from the executable body
    auto produceChild(std::shared_ptr<Task> const& child) -> void;
    auto finish(std::vector<Error> errors = {}) -> void;
    auto finishWithError(std::optional<Error> error) -> void;

    auto cancel() -> void;
    auto cancelWithError(std::optional<Error> error) -> void;

    auto id() const -> std::uint64_t { return this->id_; }
    auto label() const -> std::string const& { return this->options.label; }

    // Blocking on a task from outside deadlocks worker pools, chain through dependencies or observers instead
    auto waitUntilFinished() -> void = delete;

private:
    Task(std::unique_ptr<Executable> body, TaskOptions options);
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    auto setState(TaskState target) -> void;
    auto fault(std::string const& reason) const -> TaskFault;
    auto requireNotExecuting(char const* what) const -> void;
    static auto exclusivityCategories(std::vector<std::shared_ptr<Condition>> const& conditions) -> std::vector<std::string>;
    auto evaluateConditions() -> void;
    auto conditionsEvaluated(std::vector<Error> failures) -> void;
    auto drainCancelled() -> void;
    auto startFromReady() -> void;

    std::uint64_t const         id_;
    TaskOptions const           options;
    std::unique_ptr<Executable> body;
    TaskStateGuard              stateGuard;

    std::atomic<bool> cancelled{false};
    std::atomic<bool> enqueued{false};
    std::atomic<bool> evaluationRequested{false};
    std::atomic<bool> executeRequested{false};
    std::atomic<bool> executeStarted{false};
    std::atomic<bool> hasFinished{false};

    mutable std::mutex                         dataMutex; // Guards everything below
    std::vector<std::shared_ptr<Condition>>    conditions_;
    std::vector<std::shared_ptr<TaskObserver>> observers;
    std::vector<std::shared_ptr<Task>>         dependencies_;
    std::vector<Error>                         internalErrors; // Condition and cancellation errors, in arrival order
    std::vector<std::string>                   registeredCategories;
    std::weak_ptr<TaskStateSink>               stateSink;
};

template <typename FunctionType>
auto FunctionExecutable<FunctionType>::execute(Task& task) -> void {
    this->function(task);
    task.finish();
}

} // namespace TW
