#pragma once

#include <parallel_hashmap/phmap.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TW {

class Task;

/**
 * @brief Registry of in-flight tasks that declared a mutual exclusivity category.
 *
 * Purpose:
 * - Serialize tasks that share a category even when they are admitted by
 *   unrelated schedulers. Each task registered under a category gains a
 *   dependency on the task registered before it, so one category forms a
 *   single chain.
 *
 * Usage:
 * - Construct one controller for the process and hand it to every task that
 *   needs it through TaskOptions::exclusivity. A Task registers itself from
 *   willEnqueue() and unregisters from finish():
 *
 *     controller.registerTask(task, {"database"});
 *     ...
 *     controller.unregisterTask(*task, {"database"});
 *
 * Notes:
 * - All access goes through one mutex; registerTask has wired every
 *   dependency by the time it returns.
 * - Unregistering never removes edges already captured by later tasks.
 * - Tasks are held weakly, a destroyed task is skipped when picking the tail.
 */
class ExclusivityController {
public:
    ExclusivityController();
    ~ExclusivityController();

    ExclusivityController(const ExclusivityController&)            = delete;
    ExclusivityController& operator=(const ExclusivityController&) = delete;

    /**
     * Append `task` to each category and make it depend on the previous tail of
     * that category, if any.
     */
    void registerTask(std::shared_ptr<Task> const& task, std::vector<std::string> const& categories);

    /**
     * Remove `task` from each category. Unknown tasks and categories are ignored.
     */
    void unregisterTask(Task const& task, std::vector<std::string> const& categories);

private:
    struct Entry {
        Task const*         identity;
        std::weak_ptr<Task> task;
    };

    std::mutex                                              mutex_;
    phmap::flat_hash_map<std::string, std::vector<Entry>> categories_;
};

} // namespace TW
