//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/engine/Interpreter.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace sloth::engine {

Outcome Interpreter::interpret(const TaskNodeRef& task, const SchedulerRef& sched) {
    if(task->mode() == Mode::Parallel) {
        return executeParallel(task, sched);
    } else {
        return execute(task, sched);
    }
}

Outcome Interpreter::execute(const TaskNodeRef& task, const SchedulerRef& sched) {
    return applyActions(task->handle()->await(), task->actionsInOrder(), task->recovery(), sched);
}

Outcome Interpreter::executeParallel(const TaskNodeRef& task, const SchedulerRef& sched) {
    Outcome seed = task->handle()->await();
    if(seed.is_failure()) {
        if(task->recovery().has_value()) {
            return execute(recoveryTask(*(task->recovery()), seed.get_error()), sched);
        }
        return seed;
    }

    if(!seed.get_value().isGroup()) {
        throw std::invalid_argument("A parallel task must resolve to a group of tasks.");
    }

    const TaskGroup& group = seed.get_value().asGroup();
    std::vector<TaskNodeRef> running;
    running.reserve(group.size());

    for(auto& branch : group) {
        if(branch == nullptr) {
            throw std::invalid_argument("Every branch of a parallel task must be a task.");
        }
        running.push_back(runAsync(branch, sched));
    }

    std::vector<Value> values;
    std::vector<Error> errors;
    values.reserve(running.size());

    for(auto& branch : running) {
        auto outcome = branch->handle()->await();
        if(outcome.is_success()) {
            values.push_back(outcome.get_value());
        } else {
            errors.push_back(outcome.get_error());
        }
    }

    if(errors.empty()) {
        Actions actions = task->actionsInOrder();
        if(actions->is_empty()) {
            throw std::invalid_argument("A parallel task requires a gather function.");
        }

        auto gather = *(actions->head());
        Value gathered = Value::ofGathered(std::move(values));
        auto combined = attempt([&gather, &gathered]() { return gather(gathered); });

        return applyActions(combined, actions->tail(), task->recovery(), sched);
    }

    Error aggregate = errors.front().withBranchErrors(errors);

    if(task->recovery().has_value()) {
        return execute(recoveryTask(*(task->recovery()), aggregate), sched);
    } else {
        return Outcome::failure(aggregate);
    }
}

TaskNodeRef Interpreter::run(const TaskNodeRef& task, const SchedulerRef& sched) {
    return TaskNode::resolved(interpret(task, sched));
}

TaskNodeRef Interpreter::runAsync(const TaskNodeRef& task, const SchedulerRef& sched) {
    auto promise = Promise<Value,Error>::create();

    sched->submit([task, sched = sched, promise]() mutable {
        auto outcome = attempt([&task, &sched]() { return interpret(task, sched); }).join();

        sched.reset();
        promise->complete(outcome);
    });

    return TaskNode::pending(Deferred<Value,Error>::forPromise(promise));
}

Outcome Interpreter::applyActions(
    Outcome result,
    Actions actions,
    const std::optional<Recovery>& recovery,
    const SchedulerRef& sched
) {
    while(true) {
        if(result.is_failure()) {
            if(recovery.has_value()) {
                return execute(recoveryTask(*recovery, result.get_error()), sched);
            }
            return result;
        }

        const Value& value = result.get_value();

        if(value.isTask()) {
            result = interpret(value.asTask(), sched);
            continue;
        }

        if(actions->is_empty()) {
            return result;
        }

        auto action = *(actions->head());
        actions = actions->tail();
        result = attempt([&action, &value]() { return action(value); });
    }
}

TaskNodeRef Interpreter::recoveryTask(const Recovery& recovery, const Error& error) {
    return TaskNode::thunk([recovery, error]() {
        return recovery(error);
    });
}

} // namespace sloth::engine
