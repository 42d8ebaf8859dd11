#include "TraceObserver.hpp"
#include "log/TaggedLogger.hpp"
#include "task/Task.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <thread>

namespace TW {

namespace {

auto currentThreadId() -> std::uint64_t {
    return static_cast<std::uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

} // namespace

TraceObserver::TraceObserver() : origin(std::chrono::steady_clock::now()) {}

auto TraceObserver::taskDidStart(Task& task) -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->startedTasks.push_back(task.id());
    }
    this->record(TraceEvent{.phase = 'b', .name = eventName(task), .category = "task", .taskId = task.id(), .timestampUs = this->nowUs(), .threadId = currentThreadId()});
}

auto TraceObserver::taskDidProduce(Task& task, std::shared_ptr<Task> const& child) -> void {
    this->record(TraceEvent{.phase       = 'n',
                            .name        = "Produce " + eventName(*child),
                            .category    = "task",
                            .taskId      = task.id(),
                            .timestampUs = this->nowUs(),
                            .threadId    = currentThreadId(),
                            .childId     = child->id()});
}

auto TraceObserver::taskDidFinish(Task& task, std::vector<Error> const& errors) -> void {
    auto const now     = this->nowUs();
    bool       started = false;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        started = std::find(this->startedTasks.begin(), this->startedTasks.end(), task.id()) != this->startedTasks.end();
        std::erase(this->startedTasks, task.id());
    }
    if (!started)
        this->record(TraceEvent{.phase = 'b', .name = eventName(task), .category = "task", .taskId = task.id(), .timestampUs = now, .threadId = currentThreadId()});

    TraceEvent end{.phase = 'e', .name = eventName(task), .category = "task", .taskId = task.id(), .timestampUs = now, .threadId = currentThreadId()};
    for (auto const& error : errors)
        end.errors.push_back(describeError(error));
    this->record(std::move(end));
}

auto TraceObserver::events() const -> std::vector<TraceEvent> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->traceEvents;
}

auto TraceObserver::toJson() const -> nlohmann::json {
    nlohmann::json list = nlohmann::json::array();
    for (auto const& event : this->events()) {
        nlohmann::json entry{
                {"ph", std::string(1, event.phase)},
                {"name", event.name},
                {"cat", event.category},
                {"id", event.taskId},
                {"ts", event.timestampUs},
                {"pid", 1},
                {"tid", event.threadId},
        };
        nlohmann::json args = nlohmann::json::object();
        if (!event.errors.empty())
            args["errors"] = event.errors;
        if (event.childId)
            args["child"] = *event.childId;
        if (!args.empty())
            entry["args"] = std::move(args);
        list.push_back(std::move(entry));
    }
    return nlohmann::json{{"traceEvents", std::move(list)}, {"displayTimeUnit", "ms"}};
}

auto TraceObserver::writeTo(std::filesystem::path const& path) const -> std::optional<Error> {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open())
        return Error{Error::Code::IoFailure, "Failed to open trace file " + path.string()};
    out << this->toJson().dump(2);
    if (!out.good())
        return Error{Error::Code::IoFailure, "Failed to write trace file " + path.string()};
    tw_log("TraceObserver wrote " + path.string(), "Trace");
    return std::nullopt;
}

auto TraceObserver::record(TraceEvent event) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->traceEvents.push_back(std::move(event));
}

auto TraceObserver::nowUs() const -> std::uint64_t {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - this->origin).count());
}

auto TraceObserver::eventName(Task const& task) -> std::string {
    if (!task.label().empty())
        return task.label();
    return "Task #" + std::to_string(task.id());
}

} // namespace TW
