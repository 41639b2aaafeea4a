//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/engine/TaskNode.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace sloth::engine {

TaskNode::TaskNode(Mode mode, Handle handle, Actions actions, std::optional<Recovery> recovery)
    : execMode(mode)
    , resultHandle(std::move(handle))
    , pendingActions(std::move(actions))
    , recoveryFn(std::move(recovery))
{
    if(resultHandle == nullptr || pendingActions == nullptr) {
        throw std::invalid_argument("A task node requires a handle and an action queue.");
    }
}

TaskNodeRef TaskNode::thunk(const std::function<Value()>& thunk) {
    Action first = [thunk](const Value&) {
        return thunk();
    };

    return std::make_shared<TaskNode>(
        Mode::Serial,
        Deferred<Value,Error>::pure(Outcome::success(Value())),
        List<Action>::empty()->prepend(first),
        std::nullopt
    );
}

TaskNodeRef TaskNode::resolved(const Outcome& outcome) {
    return pending(Deferred<Value,Error>::pure(outcome));
}

TaskNodeRef TaskNode::pending(Handle handle) {
    return std::make_shared<TaskNode>(
        Mode::Serial,
        std::move(handle),
        List<Action>::empty(),
        std::nullopt
    );
}

TaskNodeRef TaskNode::parallel(TaskGroup tasks, const Action& gather, std::size_t arity) {
    for(auto& task : tasks) {
        if(task == nullptr) {
            throw std::invalid_argument("Every branch of a parallel task must be a task.");
        }
    }

    if(arity != tasks.size()) {
        throw std::invalid_argument(
            "Gather function expects " + std::to_string(arity) +
            " results but " + std::to_string(tasks.size()) + " tasks were given."
        );
    }

    return std::make_shared<TaskNode>(
        Mode::Parallel,
        Deferred<Value,Error>::pure(Outcome::success(Value::ofGroup(std::move(tasks)))),
        List<Action>::empty()->prepend(gather),
        std::nullopt
    );
}

TaskNodeRef TaskNode::then(const Action& action) const {
    if(recoveryFn.has_value()) {
        return std::make_shared<TaskNode>(
            Mode::Serial,
            Deferred<Value,Error>::pure(Outcome::success(Value::ofTask(shared_from_this()))),
            List<Action>::empty()->prepend(action),
            std::nullopt
        );
    }

    if(isBroken()) {
        return std::make_shared<TaskNode>(execMode, resultHandle, List<Action>::empty(), std::nullopt);
    }

    return std::make_shared<TaskNode>(execMode, resultHandle, pendingActions->prepend(action), std::nullopt);
}

TaskNodeRef TaskNode::recover(const Recovery& recovery) const {
    return std::make_shared<TaskNode>(execMode, resultHandle, pendingActions, recovery);
}

TaskNodeRef TaskNode::withHandle(Handle handle) const {
    return std::make_shared<TaskNode>(execMode, std::move(handle), pendingActions, recoveryFn);
}

Actions TaskNode::actionsInOrder() const {
    Actions ordered = List<Action>::empty();
    for(Actions current = pendingActions; !current->is_empty(); current = current->tail()) {
        ordered = ordered->prepend(*(current->head()));
    }

    return ordered;
}

Mode TaskNode::mode() const noexcept {
    return execMode;
}

const Handle& TaskNode::handle() const noexcept {
    return resultHandle;
}

const Actions& TaskNode::actions() const noexcept {
    return pendingActions;
}

const std::optional<Recovery>& TaskNode::recovery() const noexcept {
    return recoveryFn;
}

bool TaskNode::isDone() const {
    return resultHandle->isDone();
}

bool TaskNode::isExecuted() const {
    return isDone() && pendingActions->is_empty();
}

bool TaskNode::isFulfilled() const {
    auto outcome = peek();
    return outcome.has_value() && outcome->is_success();
}

bool TaskNode::isBroken() const {
    auto outcome = peek();
    return outcome.has_value() && outcome->is_failure();
}

std::optional<Outcome> TaskNode::peek() const {
    return resultHandle->get();
}

} // namespace sloth::engine
