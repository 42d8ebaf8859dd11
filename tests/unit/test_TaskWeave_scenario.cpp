#include "taskweave/TaskWeave.hpp"
#include "TaskWeaveTestHelper.hpp"

#include <doctest/doctest.h>

using namespace TW;
using namespace TW::Test;

TEST_SUITE("taskweave.scenario") {
TEST_CASE("A failing condition finishes the task once without running it") {
    ManualScheduler scheduler;
    bool            ran      = false;
    int             finishes = 0;
    std::vector<Error> reported;
    Error const        failure{Error::Code::ConditionFailed, "E"};

    auto task = Task::Create([&ran](Task&) { ran = true; });
    task->addCondition(std::make_shared<TestCondition>("AlwaysFails", failure));
    task->addObserver(BlockObserver::OnFinish([&](Task& finished, std::vector<Error> const& errors) {
        ++finishes;
        reported = errors;
        CHECK(finished.state() == TaskState::Finishing);
    }));

    scheduler.admit(task);
    scheduler.drain();

    CHECK_FALSE(ran);
    CHECK(finishes == 1);
    CHECK(reported == std::vector<Error>{failure});
    CHECK(task->isFinished());
}

TEST_CASE("Asynchronous conditions gate a pipeline of produced tasks") {
    AsyncRunner     runner;
    ManualScheduler scheduler;
    auto            trace = std::make_shared<TraceObserver>();
    std::mutex               orderMutex;
    std::vector<std::string> order;
    auto record = [&](std::string step) {
        std::lock_guard<std::mutex> lock(orderMutex);
        order.push_back(std::move(step));
    };

    auto load = Task::Create([&](Task& self) {
        record("load");
        for (int i = 0; i < 3; ++i) {
            auto part = Task::Create([&, i](Task&) { record("part" + std::to_string(i)); }, TaskOptions{.label = "part" + std::to_string(i)});
            part->addObserver(trace);
            self.produceChild(part);
        }
    }, TaskOptions{.label = "load"});
    load->addCondition(std::make_shared<TestCondition>("Network", std::nullopt, &runner, 10ms));
    load->addCondition(std::make_shared<TestCondition>("Disk", std::nullopt, &runner, 2ms));
    load->addObserver(trace);

    scheduler.admit(load);
    REQUIRE(scheduler.runUntil([&] {
        std::lock_guard<std::mutex> lock(orderMutex);
        return order.size() == 4;
    }));
    scheduler.drain();

    CHECK(load->isFinished());
    CHECK(order.front() == "load");
    // One span per task
    auto json = trace->toJson();
    int  ends = 0;
    for (auto const& event : json["traceEvents"])
        if (event["ph"] == "e")
            ++ends;
    CHECK(ends == 4);
}

TEST_CASE("An exclusive category serializes unrelated tasks") {
    ExclusivityController controller;
    AsyncRunner           runner;
    ManualScheduler       scheduler;
    std::atomic<int>      running{0};
    std::atomic<int>      maxRunning{0};
    std::atomic<int>      done{0};

    // Bodies finish on a worker thread so overlapping executions would be visible
    struct SlowBody final : Executable {
        SlowBody(AsyncRunner& runner, std::atomic<int>& running, std::atomic<int>& maxRunning, std::atomic<int>& done)
            : runner(runner), running(running), maxRunning(maxRunning), done(done) {}

        auto execute(Task& task) -> void override {
            auto now = ++this->running;
            auto max = this->maxRunning.load();
            while (now > max && !this->maxRunning.compare_exchange_weak(max, now)) {
            }
            auto self = task.shared_from_this();
            this->runner.after(3ms, [this, self]() {
                --this->running;
                ++this->done;
                self->finish();
            });
        }

        AsyncRunner&      runner;
        std::atomic<int>& running;
        std::atomic<int>& maxRunning;
        std::atomic<int>& done;
    };

    std::vector<std::shared_ptr<Task>> tasks;
    for (int i = 0; i < 4; ++i) {
        auto task = Task::Create(std::make_unique<SlowBody>(runner, running, maxRunning, done),
                                 TaskOptions{.label = "exclusive" + std::to_string(i), .exclusivity = &controller});
        task->addCondition(std::make_shared<MutuallyExclusiveCondition>("gpu"));
        tasks.push_back(task);
        scheduler.admit(task);
    }

    REQUIRE(scheduler.runUntil([&] { return done.load() == 4; }));
    runner.join();
    CHECK(maxRunning.load() == 1);
    for (std::size_t i = 0; i < tasks.size(); ++i)
        CHECK(scheduler.executionOrder[i] == tasks[i]);
}

TEST_CASE("Cancelling a dependency chain drains every task") {
    ManualScheduler scheduler;
    auto            observer = std::make_shared<RecordingObserver>();
    auto            first    = Task::Create([](Task&) {});
    auto            second   = Task::Create([](Task&) {});
    second->addDependency(first);
    second->addObserver(observer);

    scheduler.admit(first);
    scheduler.admit(second);
    first->cancel();
    second->cancel();
    scheduler.drain();

    CHECK(first->isFinished());
    CHECK(second->isFinished());
    CHECK(observer->count("start") == 0);
    CHECK(observer->errors() == std::vector<Error>{conditionsCancelledError()});
}
}
