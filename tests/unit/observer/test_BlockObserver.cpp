#include "TaskWeaveTestHelper.hpp"

#include <doctest/doctest.h>

using namespace TW;
using namespace TW::Test;

TEST_SUITE("observer.block") {
TEST_CASE("Every handler fires for its event") {
    ManualScheduler scheduler;
    std::vector<std::string> events;
    auto observer = std::make_shared<BlockObserver>(
            [&events](Task&) { events.push_back("start"); },
            [&events](Task&, std::shared_ptr<Task> const& child) { events.push_back("produce " + child->label()); },
            [&events](Task&, std::vector<Error> const& errors) { events.push_back("finish " + std::to_string(errors.size())); });

    auto child  = Task::Create([](Task&) {}, TaskOptions{.label = "child"});
    auto parent = Task::Create([child](Task& self) { self.produceChild(child); });
    parent->addObserver(observer);

    scheduler.admit(parent);
    scheduler.drain();

    CHECK(events == std::vector<std::string>{"start", "produce child", "finish 0"});
}

TEST_CASE("Missing handlers are skipped") {
    ManualScheduler scheduler;
    std::vector<Error> seen;
    bool               finished = false;
    auto               task     = Task::Create([](Task& self) { self.produceChild(Task::Create([](Task&) {})); });
    task->addObserver(BlockObserver::OnFinish([&](Task&, std::vector<Error> const& errors) {
        seen     = errors;
        finished = true;
    }));
    task->addObserver(std::make_shared<BlockObserver>());

    scheduler.admit(task);
    scheduler.drain();

    CHECK(finished);
    CHECK(seen.empty());
}

TEST_CASE("Finish handler receives condition failures") {
    ManualScheduler scheduler;
    std::vector<Error> seen;
    bool               started = false;
    auto               task    = Task::Create([](Task&) {});
    task->addCondition(std::make_shared<TestCondition>("Offline", Error{Error::Code::ConditionFailed, "offline"}));
    task->addObserver(std::make_shared<BlockObserver>([&started](Task&) { started = true; },
                                                      BlockObserver::ProduceHandler{},
                                                      [&seen](Task&, std::vector<Error> const& errors) { seen = errors; }));

    scheduler.admit(task);
    scheduler.drain();

    CHECK_FALSE(started);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].message.value_or("") == "offline");
}
}
