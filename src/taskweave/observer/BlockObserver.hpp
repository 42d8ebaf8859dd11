#pragma once
#include "TaskObserver.hpp"

#include <functional>
#include <utility>

namespace TW {

// Observer built from optional callbacks. Events without a callback are ignored.
struct BlockObserver final : TaskObserver {
    using StartHandler   = std::function<void(Task&)>;
    using ProduceHandler = std::function<void(Task&, std::shared_ptr<Task> const&)>;
    using FinishHandler  = std::function<void(Task&, std::vector<Error> const&)>;

    explicit BlockObserver(StartHandler start = {}, ProduceHandler produce = {}, FinishHandler finish = {})
        : startHandler(std::move(start)), produceHandler(std::move(produce)), finishHandler(std::move(finish)) {}

    static auto OnFinish(FinishHandler finish) -> std::shared_ptr<BlockObserver> {
        return std::make_shared<BlockObserver>(StartHandler{}, ProduceHandler{}, std::move(finish));
    }

    auto taskDidStart(Task& task) -> void override {
        if (this->startHandler)
            this->startHandler(task);
    }

    auto taskDidProduce(Task& task, std::shared_ptr<Task> const& child) -> void override {
        if (this->produceHandler)
            this->produceHandler(task, child);
    }

    auto taskDidFinish(Task& task, std::vector<Error> const& errors) -> void override {
        if (this->finishHandler)
            this->finishHandler(task, errors);
    }

private:
    StartHandler   startHandler;
    ProduceHandler produceHandler;
    FinishHandler  finishHandler;
};

} // namespace TW
