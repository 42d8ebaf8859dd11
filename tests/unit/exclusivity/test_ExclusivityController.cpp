#define private public
#include "exclusivity/ExclusivityController.hpp"
#undef private
#include "condition/MutuallyExclusiveCondition.hpp"
#include "TaskWeaveTestHelper.hpp"

#include <doctest/doctest.h>

using namespace TW;
using namespace TW::Test;

namespace {

auto makeTask(std::string label, ExclusivityController* controller = nullptr) -> std::shared_ptr<Task> {
    return Task::Create([](Task&) {}, TaskOptions{.label = std::move(label), .exclusivity = controller});
}

auto dependsOn(std::shared_ptr<Task> const& task, std::shared_ptr<Task> const& other) -> bool {
    auto deps = task->dependencies();
    return std::find(deps.begin(), deps.end(), other) != deps.end();
}

// Body that stays Executing until the test finishes it.
struct HoldingBody final : Executable {
    auto execute(Task&) -> void override {}
};

} // namespace

TEST_SUITE("exclusivity.controller") {
TEST_CASE("Tasks in one category form a single chain") {
    ExclusivityController controller;
    auto                  t1 = makeTask("t1");
    auto                  t2 = makeTask("t2");
    auto                  t3 = makeTask("t3");

    controller.registerTask(t1, {"X"});
    controller.registerTask(t2, {"X"});
    controller.registerTask(t3, {"X"});

    CHECK(t1->dependencies().empty());
    CHECK(t2->dependencies() == std::vector<std::shared_ptr<Task>>{t1});
    CHECK(t3->dependencies() == std::vector<std::shared_ptr<Task>>{t2});
    CHECK_FALSE(dependsOn(t3, t1));
    CHECK(controller.categories_["X"].size() == 3);
}

TEST_CASE("Disjoint categories do not interact") {
    ExclusivityController controller;
    auto                  a = makeTask("a");
    auto                  b = makeTask("b");

    controller.registerTask(a, {"X"});
    controller.registerTask(b, {"Y"});

    CHECK(a->dependencies().empty());
    CHECK(b->dependencies().empty());
}

TEST_CASE("A task in several categories follows each tail") {
    ExclusivityController controller;
    auto                  a    = makeTask("a");
    auto                  b    = makeTask("b");
    auto                  both = makeTask("both");

    controller.registerTask(a, {"X"});
    controller.registerTask(b, {"Y"});
    controller.registerTask(both, {"X", "Y"});

    CHECK(dependsOn(both, a));
    CHECK(dependsOn(both, b));
    CHECK(both->dependencies().size() == 2);
}

TEST_CASE("Unregistering changes which tail the next task follows") {
    ExclusivityController controller;
    auto                  t1 = makeTask("t1");
    auto                  t2 = makeTask("t2");
    controller.registerTask(t1, {"X"});
    controller.registerTask(t2, {"X"});

    SUBCASE("removing the tail") {
        controller.unregisterTask(*t2, {"X"});
        auto t3 = makeTask("t3");
        controller.registerTask(t3, {"X"});
        CHECK(t3->dependencies() == std::vector<std::shared_ptr<Task>>{t1});
        // Edges captured earlier stay in place
        CHECK(dependsOn(t2, t1));
    }

    SUBCASE("removing the head") {
        controller.unregisterTask(*t1, {"X"});
        auto t3 = makeTask("t3");
        controller.registerTask(t3, {"X"});
        CHECK(t3->dependencies() == std::vector<std::shared_ptr<Task>>{t2});
    }

    SUBCASE("removing everything drops the category") {
        controller.unregisterTask(*t1, {"X"});
        controller.unregisterTask(*t2, {"X"});
        CHECK(controller.categories_.empty());
        auto t3 = makeTask("t3");
        controller.registerTask(t3, {"X"});
        CHECK(t3->dependencies().empty());
    }
}

TEST_CASE("Unregistering an unknown task or category is a no-op") {
    ExclusivityController controller;
    auto                  known   = makeTask("known");
    auto                  unknown = makeTask("unknown");
    controller.registerTask(known, {"X"});

    controller.unregisterTask(*unknown, {"X"});
    controller.unregisterTask(*known, {"Nope"});
    REQUIRE(controller.categories_.count("X") == 1);
    CHECK(controller.categories_["X"].size() == 1);
    CHECK(controller.categories_.count("Nope") == 0);
}

TEST_CASE("Destroyed tasks are skipped when picking the tail") {
    ExclusivityController controller;
    auto                  gone = makeTask("gone");
    controller.registerTask(gone, {"X"});
    gone.reset();

    auto next = makeTask("next");
    controller.registerTask(next, {"X"});
    CHECK(next->dependencies().empty());
    CHECK(controller.categories_["X"].size() == 1);
}
}

TEST_SUITE("exclusivity.task") {
TEST_CASE("Mutually exclusive conditions register through willEnqueue") {
    ExclusivityController controller;
    auto                  first  = makeTask("first", &controller);
    auto                  second = makeTask("second", &controller);
    first->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));
    second->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));

    first->willEnqueue();
    auto extra = second->willEnqueue();

    CHECK(extra.empty());
    CHECK(second->dependencies() == std::vector<std::shared_ptr<Task>>{first});
    CHECK(controller.categories_["db"].size() == 2);
}

TEST_CASE("Repeated categories on one task register once") {
    ExclusivityController controller;
    auto                  task = makeTask("dup", &controller);
    task->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));
    task->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));
    task->addCondition(std::make_shared<MutuallyExclusiveCondition>("net"));

    task->willEnqueue();
    CHECK(controller.categories_["db"].size() == 1);
    CHECK(controller.categories_["net"].size() == 1);
    CHECK(task->dependencies().empty());
}

TEST_CASE("Exclusive conditions without a controller are a fault") {
    auto task = makeTask("orphan");
    task->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));
    CHECK_THROWS_AS(task->willEnqueue(), TaskFault);
}

TEST_CASE("Finishing unregisters and releases the next task") {
    ExclusivityController controller;
    ManualScheduler       scheduler;
    auto                  first  = Task::Create(std::make_unique<HoldingBody>(), TaskOptions{.label = "first", .exclusivity = &controller});
    auto                  second = makeTask("second", &controller);
    first->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));
    second->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));

    scheduler.admit(first);
    scheduler.admit(second);
    scheduler.drain();

    CHECK(first->isExecuting());
    CHECK(second->state() == TaskState::Pending);

    first->finish();
    REQUIRE(controller.categories_["db"].size() == 1);
    CHECK(controller.categories_["db"].front().identity == second.get());

    scheduler.drain();
    CHECK(second->isFinished());
    CHECK(controller.categories_.empty());
}

TEST_CASE("A dropped registered task leaves the registry") {
    ExclusivityController controller;
    {
        auto task = makeTask("dropped", &controller);
        task->addCondition(std::make_shared<MutuallyExclusiveCondition>("db"));
        task->willEnqueue();
        CHECK(controller.categories_["db"].size() == 1);
    }
    CHECK(controller.categories_.empty());
}
}
