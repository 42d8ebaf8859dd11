#pragma once
#include "TaskObserver.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TW {

/**
 * Records task lifecycles as Chrome trace events (chrome://tracing, Perfetto).
 *
 * One observer may be attached to many tasks. Each task becomes an async span
 * keyed by its id: 'b' when it starts, 'n' for every produced child, 'e' when
 * it finishes. Tasks that finish without starting get a zero length span.
 */
class TraceObserver final : public TaskObserver {
public:
    struct TraceEvent {
        char                     phase;
        std::string              name;
        std::string              category;
        std::uint64_t            taskId;
        std::uint64_t            timestampUs;
        std::uint64_t            threadId;
        std::vector<std::string> errors;
        std::optional<std::uint64_t> childId;
    };

    TraceObserver();

    auto taskDidStart(Task& task) -> void override;
    auto taskDidProduce(Task& task, std::shared_ptr<Task> const& child) -> void override;
    auto taskDidFinish(Task& task, std::vector<Error> const& errors) -> void override;

    auto events() const -> std::vector<TraceEvent>;
    auto toJson() const -> nlohmann::json;
    auto writeTo(std::filesystem::path const& path) const -> std::optional<Error>;

private:
    auto record(TraceEvent event) -> void;
    auto nowUs() const -> std::uint64_t;
    static auto eventName(Task const& task) -> std::string;

    std::chrono::steady_clock::time_point origin;
    mutable std::mutex                    mutex;
    std::vector<TraceEvent>               traceEvents;
    std::vector<std::uint64_t>            startedTasks;
};

} // namespace TW
