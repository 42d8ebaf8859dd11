#include "task/Task.hpp"
#include "condition/ConditionEvaluator.hpp"
#include "exclusivity/ExclusivityController.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>

namespace TW {

namespace {
std::atomic<std::uint64_t> nextTaskId{1};
}

auto Task::Create(std::unique_ptr<Executable> body, TaskOptions options) -> std::shared_ptr<Task> {
    auto task = std::shared_ptr<Task>(new Task{std::move(body), std::move(options)});
    tw_log("Task::Create #" + std::to_string(task->id()) + " " + task->label(), "Task");
    return task;
}

Task::Task(std::unique_ptr<Executable> body, TaskOptions options)
    : id_(nextTaskId.fetch_add(1, std::memory_order_relaxed)), options(std::move(options)), body(std::move(body)) {}

Task::~Task() {
    // A task dropped before finishing must not stay behind in the exclusivity registry
    if (!this->registeredCategories.empty() && this->options.exclusivity)
        this->options.exclusivity->unregisterTask(*this, this->registeredCategories);
}

auto Task::willEnqueue() -> std::vector<std::shared_ptr<Task>> {
    std::vector<std::shared_ptr<Condition>> admittedConditions;
    {
        // addCondition checks enqueued under the same lock, so the snapshot sees every condition added before admission
        std::lock_guard<std::mutex> lock(this->dataMutex);
        if (this->enqueued.exchange(true))
            throw this->fault("willEnqueue() called more than once");
        admittedConditions = this->conditions_;
    }

    std::vector<std::shared_ptr<Task>> conditionDependencies;
    for (auto const& condition : admittedConditions) {
        if (auto dependency = condition->dependencyForTask(*this)) {
            this->addDependency(dependency);
            conditionDependencies.push_back(std::move(dependency));
        }
    }

    auto categories = exclusivityCategories(admittedConditions);
    if (!categories.empty()) {
        if (!this->options.exclusivity)
            throw this->fault("mutually exclusive conditions need TaskOptions::exclusivity");
        {
            std::lock_guard<std::mutex> lock(this->dataMutex);
            this->registeredCategories = categories;
        }
        this->options.exclusivity->registerTask(this->shared_from_this(), categories);
    }

    this->setState(TaskState::Pending);
    return conditionDependencies;
}

auto Task::dependenciesSatisfied() -> bool {
    if (this->state() != TaskState::Pending || this->isCancelled())
        return false;
    if (!this->dependenciesFinished()) {
        tw_log("Task::dependenciesSatisfied #" + std::to_string(this->id_) + " reported with unfinished dependencies", "Task");
        return false;
    }
    if (this->evaluationRequested.exchange(true))
        return false;
    this->evaluateConditions();
    return true;
}

auto Task::evaluateConditions() -> void {
    this->setState(TaskState::EvaluatingConditions);
    auto self = this->shared_from_this();
    ConditionEvaluator::evaluate(this->conditions(), self, [self](std::vector<Error> failures) {
        self->conditionsEvaluated(std::move(failures));
    });
}

auto Task::conditionsEvaluated(std::vector<Error> failures) -> void {
    tw_log("Task #" + std::to_string(this->id_) + " conditions landed with " + std::to_string(failures.size()) + " failure(s)", "Task");
    {
        std::lock_guard<std::mutex> lock(this->dataMutex);
        this->internalErrors.insert(this->internalErrors.end(),
                                    std::make_move_iterator(failures.begin()),
                                    std::make_move_iterator(failures.end()));
    }
    this->setState(TaskState::Ready);
    if (this->executeRequested.exchange(false))
        this->startFromReady();
}

auto Task::execute() -> void {
    auto const current = this->state();
    if (current == TaskState::Ready) {
        this->startFromReady();
        return;
    }
    if (!this->isCancelled() || current > TaskState::Ready)
        throw this->fault("execute() requires the Ready state");

    if (current <= TaskState::Pending && !this->evaluationRequested.exchange(true)) {
        this->drainCancelled();
        this->startFromReady();
        return;
    }

    // Conditions are in flight, the task finishes as soon as they land
    tw_log("Task::execute #" + std::to_string(this->id_) + " deferred until conditions land", "Task");
    this->executeRequested.store(true);
    if (this->state() >= TaskState::Ready && this->executeRequested.exchange(false))
        this->startFromReady();
}

auto Task::drainCancelled() -> void {
    tw_log("Task #" + std::to_string(this->id_) + " cancelled before its conditions ran", "Task");
    if (this->state() == TaskState::Initialized)
        this->setState(TaskState::Pending);
    this->setState(TaskState::EvaluatingConditions);
    {
        std::lock_guard<std::mutex> lock(this->dataMutex);
        this->internalErrors.push_back(conditionsCancelledError());
    }
    this->setState(TaskState::Ready);
}

auto Task::startFromReady() -> void {
    if (this->executeStarted.exchange(true))
        throw this->fault("execute() called more than once");

    bool                                       failed = false;
    std::vector<std::shared_ptr<TaskObserver>> observersSnapshot;
    {
        std::lock_guard<std::mutex> lock(this->dataMutex);
        failed            = !this->internalErrors.empty();
        observersSnapshot = this->observers;
    }
    if (failed || this->isCancelled()) {
        tw_log("Task #" + std::to_string(this->id_) + " finishing without running", "Task");
        this->finish();
        return;
    }

    this->setState(TaskState::Executing);
    for (auto const& observer : observersSnapshot)
        observer->taskDidStart(*this);

    if (!this->body) {
        tw_log("Task #" + std::to_string(this->id_) + " has no executable body", "Task", "WARNING");
        this->finish();
        return;
    }

    try {
        this->body->execute(*this);
    } catch (TaskFault const&) {
        throw;
    } catch (std::exception const& e) {
        tw_log("Task #" + std::to_string(this->id_) + " body threw: " + e.what(), "Task", "ERROR");
        this->finish({Error{Error::Code::ExecutionFailed, e.what()}});
    }
}

auto Task::finish(std::vector<Error> errors) -> void {
    if (this->state() < TaskState::Ready)
        throw this->fault("finish() before the task became ready");
    if (this->hasFinished.exchange(true)) {
        tw_log("Task::finish #" + std::to_string(this->id_) + " ignored, already finished", "Task");
        return;
    }
    this->setState(TaskState::Finishing);

    std::vector<Error>                         combined;
    std::vector<std::string>                   categories;
    std::vector<std::shared_ptr<TaskObserver>> observersSnapshot;
    {
        std::lock_guard<std::mutex> lock(this->dataMutex);
        combined          = this->internalErrors;
        categories        = std::move(this->registeredCategories);
        observersSnapshot = this->observers;
        this->registeredCategories.clear();
    }
    combined.insert(combined.end(), std::make_move_iterator(errors.begin()), std::make_move_iterator(errors.end()));

    if (!categories.empty() && this->options.exclusivity)
        this->options.exclusivity->unregisterTask(*this, categories);

    try {
        if (this->body)
            this->body->finished(*this, combined);
        for (auto const& observer : observersSnapshot)
            observer->taskDidFinish(*this, combined);
    } catch (...) {
        // A throwing hook still leaves the task Finished so dependents are released
        tw_log("Task #" + std::to_string(this->id_) + " finish hook threw", "Task", "ERROR");
        this->setState(TaskState::Finished);
        throw;
    }

    tw_log("Task #" + std::to_string(this->id_) + " finished with " + std::to_string(combined.size()) + " error(s)", "Task");
    this->setState(TaskState::Finished);
}

auto Task::finishWithError(std::optional<Error> error) -> void {
    if (error)
        this->finish({std::move(*error)});
    else
        this->finish();
}

auto Task::cancel() -> void {
    this->cancelWithError(std::nullopt);
}

auto Task::cancelWithError(std::optional<Error> error) -> void {
    std::shared_ptr<TaskStateSink> sink;
    {
        // finish() snapshots the errors under this lock after raising hasFinished
        std::lock_guard<std::mutex> lock(this->dataMutex);
        if (this->hasFinished.load()) {
            tw_log("Task::cancel #" + std::to_string(this->id_) + " ignored, already finishing", "Task");
            return;
        }
        if (error)
            this->internalErrors.push_back(std::move(*error));
        sink = this->stateSink.lock();
    }
    if (!this->cancelled.exchange(true)) {
        tw_log("Task #" + std::to_string(this->id_) + " cancelled", "Task");
        if (sink)
            sink->taskWasCancelled(*this);
    }
}

auto Task::produceChild(std::shared_ptr<Task> const& child) -> void {
    std::vector<std::shared_ptr<TaskObserver>> observersSnapshot;
    {
        std::lock_guard<std::mutex> lock(this->dataMutex);
        observersSnapshot = this->observers;
    }
    tw_log("Task #" + std::to_string(this->id_) + " produced #" + std::to_string(child->id()), "Task");
    for (auto const& observer : observersSnapshot)
        observer->taskDidProduce(*this, child);
}

auto Task::setStateSink(std::weak_ptr<TaskStateSink> sink) -> void {
    std::lock_guard<std::mutex> lock(this->dataMutex);
    this->stateSink = std::move(sink);
}

auto Task::isReady() const -> bool {
    return this->isCancelled() || this->state() >= TaskState::Ready;
}

auto Task::isExecuting() const -> bool {
    return this->state() == TaskState::Executing;
}

auto Task::isFinished() const -> bool {
    return this->stateGuard.isFinished();
}

auto Task::isCancelled() const -> bool {
    return this->cancelled.load();
}

auto Task::state() const -> TaskState {
    return this->stateGuard.get();
}

auto Task::addCondition(std::shared_ptr<Condition> condition) -> void {
    if (!condition)
        throw this->fault("cannot add a null condition");
    this->requireNotExecuting("conditions");

    // Exclusivity and condition dependencies are only consulted by willEnqueue()
    bool const admitted = this->enqueued.load();
    if (admitted && (condition->isMutuallyExclusive() || condition->dependencyForTask(*this)))
        throw this->fault("condition '" + condition->name() + "' needs admission, add it before willEnqueue()");

    std::lock_guard<std::mutex> lock(this->dataMutex);
    if (this->state() >= TaskState::EvaluatingConditions)
        throw this->fault("cannot add conditions once evaluation has begun");
    if (!admitted && this->enqueued.load())
        throw this->fault("condition '" + condition->name() + "' added while the task was being admitted");
    this->conditions_.push_back(std::move(condition));
}

auto Task::addObserver(std::shared_ptr<TaskObserver> observer) -> void {
    if (!observer)
        throw this->fault("cannot add a null observer");
    this->requireNotExecuting("observers");
    std::lock_guard<std::mutex> lock(this->dataMutex);
    this->observers.push_back(std::move(observer));
}

auto Task::addDependency(std::shared_ptr<Task> const& task) -> void {
    if (!task)
        throw this->fault("cannot depend on a null task");
    this->requireNotExecuting("dependencies");
    if (task.get() == this)
        throw this->fault("a task cannot depend on itself");
    std::lock_guard<std::mutex> lock(this->dataMutex);
    if (std::find(this->dependencies_.begin(), this->dependencies_.end(), task) == this->dependencies_.end())
        this->dependencies_.push_back(task);
}

auto Task::removeDependency(std::shared_ptr<Task> const& task) -> void {
    this->requireNotExecuting("dependencies");
    std::lock_guard<std::mutex> lock(this->dataMutex);
    std::erase(this->dependencies_, task);
}

auto Task::conditions() const -> std::vector<std::shared_ptr<Condition>> {
    std::lock_guard<std::mutex> lock(this->dataMutex);
    return this->conditions_;
}

auto Task::dependencies() const -> std::vector<std::shared_ptr<Task>> {
    std::lock_guard<std::mutex> lock(this->dataMutex);
    return this->dependencies_;
}

auto Task::dependenciesFinished() const -> bool {
    auto const snapshot = this->dependencies();
    return std::all_of(snapshot.begin(), snapshot.end(), [](auto const& dependency) { return dependency->isFinished(); });
}

auto Task::setState(TaskState target) -> void {
    auto const current = this->stateGuard.get();
    if (current == TaskState::Finished)
        return;
    if (!canTransition(current, target))
        throw this->fault("illegal transition to " + std::string(taskStateToString(target)));

    std::shared_ptr<TaskStateSink> sink;
    {
        std::lock_guard<std::mutex> lock(this->dataMutex);
        sink = this->stateSink.lock();
    }
    if (sink)
        sink->taskStateWillChange(*this, current, target);

    // `current` is what the sink was told, the guard refuses the write if another thread moved the state since.
    // Only a concurrent move to Finished is absorbed, then willChange stays unpaired.
    switch (this->stateGuard.transitionFrom(current, target)) {
        case TransitionResult::Changed:
            tw_log("Task #" + std::to_string(this->id_) + " " + std::string(taskStateToString(current)) + " -> " + std::string(taskStateToString(target)), "TaskState");
            if (sink)
                sink->taskStateDidChange(*this, current, target);
            break;
        case TransitionResult::Absorbed:
            tw_log("Task #" + std::to_string(this->id_) + " -> " + std::string(taskStateToString(target)) + " absorbed, already finished", "TaskState");
            break;
        case TransitionResult::Illegal:
            throw this->fault("illegal transition to " + std::string(taskStateToString(target)));
    }
}

auto Task::fault(std::string const& reason) const -> TaskFault {
    tw_log("Task #" + std::to_string(this->id_) + " fault: " + reason, "Task", "ERROR");
    return TaskFault{this->id_, this->options.label, this->stateGuard.get(), reason};
}

auto Task::requireNotExecuting(char const* what) const -> void {
    if (this->state() >= TaskState::Executing)
        throw this->fault(std::string("cannot modify ") + what + " after execution has begun");
}

auto Task::exclusivityCategories(std::vector<std::shared_ptr<Condition>> const& conditions) -> std::vector<std::string> {
    std::vector<std::string> categories;
    for (auto const& condition : conditions) {
        if (!condition->isMutuallyExclusive())
            continue;
        auto name = condition->name();
        if (std::find(categories.begin(), categories.end(), name) == categories.end())
            categories.push_back(std::move(name));
    }
    return categories;
}

} // namespace TW
