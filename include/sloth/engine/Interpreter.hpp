//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_ENGINE_INTERPRETER_H_
#define _SLOTH_ENGINE_INTERPRETER_H_

#include "../Scheduler.hpp"
#include "TaskNode.hpp"

namespace sloth::engine {

/**
 * The executor for task nodes. Execution is blocking: the calling thread
 * waits on pending handles and on the branches of parallel groups. The only
 * points where work leaves the calling thread are `runAsync` and the
 * branches of a parallel group, both of which submit to the given scheduler.
 */
class Interpreter {
public:
    /**
     * Execute the given node according to its mode.
     *
     * @param task The node to execute.
     * @param sched The scheduler used for any asynchronous work.
     * @return The final outcome of the node.
     */
    static Outcome interpret(const TaskNodeRef& task, const SchedulerRef& sched);

    /**
     * Execute a serial node: apply the queued actions, strictly in order,
     * to the node's resolved value. Nested tasks produced along the way are
     * executed in place and failures are handed to the node's recovery.
     *
     * @param task The node to execute.
     * @param sched The scheduler used for any asynchronous work.
     * @return The final outcome of the node.
     */
    static Outcome execute(const TaskNodeRef& task, const SchedulerRef& sched);

    /**
     * Execute a parallel node: start every branch asynchronously in
     * declaration order, wait for all of them, then either gather their
     * values and continue with the remaining actions or fail with the
     * first failing branch's error.
     *
     * @param task The node to execute.
     * @param sched The scheduler the branches are submitted to.
     * @return The final outcome of the node.
     */
    static Outcome executeParallel(const TaskNodeRef& task, const SchedulerRef& sched);

    /**
     * Execute the node on the calling thread and wrap the outcome in a
     * spent node.
     */
    static TaskNodeRef run(const TaskNodeRef& task, const SchedulerRef& sched);

    /**
     * Submit execution of the node to the scheduler as a single job and
     * immediately return a spent node whose handle completes when that job
     * finishes. The job never lets an exception escape.
     *
     * The job keeps the scheduler alive while it interprets the node and
     * releases it before completing the returned handle.
     */
    static TaskNodeRef runAsync(const TaskNodeRef& task, const SchedulerRef& sched);

private:
    static Outcome applyActions(
        Outcome result,
        Actions actions,
        const std::optional<Recovery>& recovery,
        const SchedulerRef& sched
    );

    static TaskNodeRef recoveryTask(const Recovery& recovery, const Error& error);
};

} // namespace sloth::engine

#endif
