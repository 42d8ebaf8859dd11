#include "ExclusivityController.hpp"
#include "log/TaggedLogger.hpp"
#include "task/Task.hpp"

#include <algorithm>

namespace TW {

ExclusivityController::ExclusivityController()  = default;
ExclusivityController::~ExclusivityController() = default;

void ExclusivityController::registerTask(std::shared_ptr<Task> const& task, std::vector<std::string> const& categories) {
    if (!task)
        return;
    // Released after the lock, a tail dropped meanwhile must not unregister itself while we hold mutex_
    std::vector<std::shared_ptr<Task>> previousTails;
    std::lock_guard<std::mutex>        lk(mutex_);
    for (auto const& category : categories) {
        auto& chain = categories_[category];

        // Drop destroyed tasks from the tail so the new task chains onto a live one
        while (!chain.empty() && chain.back().task.expired())
            chain.pop_back();

        if (!chain.empty()) {
            if (auto previous = chain.back().task.lock(); previous && previous != task) {
                task->addDependency(previous);
                tw_log("ExclusivityController: '" + category + "' task #" + std::to_string(task->id()) + " after #" + std::to_string(previous->id()),
                       "Exclusivity");
                previousTails.push_back(std::move(previous));
            }
        }
        chain.push_back(Entry{task.get(), task});
    }
}

void ExclusivityController::unregisterTask(Task const& task, std::vector<std::string> const& categories) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto const& category : categories) {
        auto it = categories_.find(category);
        if (it == categories_.end())
            continue;
        auto& chain = it->second;
        auto  entry = std::find_if(chain.begin(), chain.end(), [&task](Entry const& e) { return e.identity == &task; });
        if (entry == chain.end())
            continue;
        chain.erase(entry);
        tw_log("ExclusivityController: '" + category + "' released task #" + std::to_string(task.id()), "Exclusivity");
        if (chain.empty())
            categories_.erase(it);
    }
}

} // namespace TW
