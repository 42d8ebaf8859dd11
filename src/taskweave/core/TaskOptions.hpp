#pragma once
#include <string>

namespace TW {

class ExclusivityController;

struct TaskOptions {
    std::string            label;                 // Shown in logs, faults and traces
    ExclusivityController* exclusivity = nullptr; // Registry used for mutually exclusive conditions, must outlive the task
};

} // namespace TW
