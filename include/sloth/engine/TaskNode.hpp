//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_ENGINE_TASK_NODE_H_
#define _SLOTH_ENGINE_TASK_NODE_H_

#include <functional>
#include <memory>
#include <optional>
#include "../Deferred.hpp"
#include "../Error.hpp"
#include "../List.hpp"
#include "../Result.hpp"
#include "../Value.hpp"

namespace sloth {

/**
 * How a task's resolved value is interpreted when it runs.
 */
enum class Mode {
    // The value is fed through the action queue one action at a time.
    Serial,
    // The value is a group of tasks run concurrently, and the first
    // queued action gathers their results.
    Parallel
};

namespace engine {

using Outcome = Result<Value>;
using Handle = DeferredRef<Value,Error>;
using Action = std::function<Value(const Value&)>;
using Actions = ListRef<Action>;
using Recovery = std::function<Value(const Error&)>;

/**
 * The untyped representation of a task. A node bundles:
 *
 *   1. The execution mode.
 *   2. A handle to the most recently produced result. It may still be
 *      pending when the node came out of an asynchronous run.
 *   3. The queue of actions still to be applied to that result. It is
 *      kept most recent first so that queueing an action is O(1).
 *   4. An optional recovery applied if execution of this node fails.
 *
 * Nodes are immutable. Composing a node returns a new node and leaves the
 * original untouched, which makes nodes safe to share between threads. The
 * typed `Task` is a thin facade over a node.
 */
class TaskNode : public std::enable_shared_from_this<TaskNode> {
public:
    TaskNode(Mode mode, Handle handle, Actions actions, std::optional<Recovery> recovery);

    /**
     * A serial node that will evaluate the given thunk as its only action.
     */
    static TaskNodeRef thunk(const std::function<Value()>& thunk);

    /**
     * A spent serial node holding the given outcome.
     */
    static TaskNodeRef resolved(const Outcome& outcome);

    /**
     * A spent serial node whose outcome is delivered through the given
     * (possibly pending) handle.
     */
    static TaskNodeRef pending(Handle handle);

    /**
     * A parallel node running the given tasks concurrently and combining
     * their results with `gather`.
     *
     * @param tasks The branches, in declaration order.
     * @param gather Receives the branch results via `Value::ofGathered`.
     * @param arity The number of results `gather` expects.
     * @return The parallel node.
     */
    static TaskNodeRef parallel(TaskGroup tasks, const Action& gather, std::size_t arity);

    /**
     * Derive a node with the given action queued. A node carrying a
     * recovery is not extended: it becomes the nested seed of a new node
     * whose only action is `action`, so the recovery stays local to it.
     * A broken node without a recovery is not extended either; its failure
     * is carried over instead.
     */
    TaskNodeRef then(const Action& action) const;

    /**
     * Derive a node with the given recovery installed.
     */
    TaskNodeRef recover(const Recovery& recovery) const;

    /**
     * Derive a node with a different handle.
     */
    TaskNodeRef withHandle(Handle handle) const;

    Mode mode() const noexcept;
    const Handle& handle() const noexcept;
    /**
     * The queued actions, most recently queued first.
     */
    const Actions& actions() const noexcept;

    /**
     * The queued actions in the order they run. Executes in O(n) time.
     */
    Actions actionsInOrder() const;
    const std::optional<Recovery>& recovery() const noexcept;

    /**
     * Status queries. None of them blocks on a pending handle.
     */
    bool isDone() const;
    bool isExecuted() const;
    bool isFulfilled() const;
    bool isBroken() const;

    /**
     * Peek at the handle without blocking.
     */
    std::optional<Outcome> peek() const;

private:
    Mode execMode;
    Handle resultHandle;
    Actions pendingActions;
    std::optional<Recovery> recoveryFn;
};

} // namespace engine
} // namespace sloth

#endif
