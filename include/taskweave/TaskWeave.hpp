#pragma once

#include "condition/Condition.hpp"
#include "condition/ConditionEvaluator.hpp"
#include "condition/MutuallyExclusiveCondition.hpp"
#include "core/Error.hpp"
#include "core/TaskOptions.hpp"
#include "exclusivity/ExclusivityController.hpp"
#include "observer/BlockObserver.hpp"
#include "observer/TaskObserver.hpp"
#include "observer/TraceObserver.hpp"
#include "task/Executable.hpp"
#include "task/Task.hpp"
#include "task/TaskFault.hpp"
#include "task/TaskState.hpp"
#include "task/TaskStateSink.hpp"
