#include "ConditionEvaluator.hpp"
#include "log/TaggedLogger.hpp"
#include "task/Task.hpp"

#include <exception>
#include <mutex>
#include <optional>

namespace TW {

namespace {

// Join point shared by every per-condition completion of one evaluation
struct EvaluationBarrier {
    EvaluationBarrier(std::shared_ptr<Task> task, std::size_t count, ConditionEvaluator::Completion completion)
        : task(std::move(task)), results(count), remaining(count), completion(std::move(completion)) {}

    auto deliver(std::size_t index, ConditionResult result) -> void {
        bool last = false;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            if (this->results[index].has_value()) {
                tw_log("ConditionEvaluator: duplicate result for condition " + std::to_string(index) + " ignored", "Condition");
                return;
            }
            this->results[index] = std::move(result);
            last                 = --this->remaining == 0;
        }
        if (last)
            this->complete();
    }

    auto complete() -> void {
        std::vector<Error> failures;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            for (auto& result : this->results)
                if (result && !result->has_value())
                    failures.push_back(std::move(result->error()));
        }
        if (this->task->isCancelled())
            failures.push_back(conditionsCancelledError());

        tw_log("ConditionEvaluator: task #" + std::to_string(this->task->id()) + " joined with " + std::to_string(failures.size()) + " failure(s)", "Condition");
        auto done = std::move(this->completion);
        done(std::move(failures));
    }

    std::shared_ptr<Task>                       task;
    std::mutex                                  mutex;
    std::vector<std::optional<ConditionResult>> results;
    std::size_t                                 remaining;
    ConditionEvaluator::Completion              completion;
};

} // namespace

auto ConditionEvaluator::evaluate(std::vector<std::shared_ptr<Condition>> conditions,
                                  std::shared_ptr<Task>                   task,
                                  Completion                              completion) -> void {
    auto barrier = std::make_shared<EvaluationBarrier>(std::move(task), conditions.size(), std::move(completion));
    if (conditions.empty()) {
        barrier->complete();
        return;
    }

    for (std::size_t index = 0; index < conditions.size(); ++index) {
        auto const& condition = conditions[index];
        tw_log("ConditionEvaluator: evaluating '" + condition->name() + "' for task #" + std::to_string(barrier->task->id()), "Condition");
        try {
            condition->evaluateForTask(*barrier->task, [barrier, index](ConditionResult result) {
                barrier->deliver(index, std::move(result));
            });
        } catch (TaskFault const&) {
            // A completion delivered inline may have driven the task into a contract violation
            throw;
        } catch (std::exception const& e) {
            barrier->deliver(index, std::unexpected(Error{Error::Code::ConditionFailed, condition->name() + ": " + e.what()}));
        }
    }
}

} // namespace TW
