//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_SCHEDULER_H_
#define _SLOTH_SCHEDULER_H_

#include <functional>
#include <memory>
#include <vector>

namespace sloth {

class Scheduler;
using SchedulerRef = std::shared_ptr<Scheduler>;

/**
 * A Scheduler is where asynchronous task execution actually happens. Each
 * call to `Task::runAsync` - including the one made for every branch of a
 * parallel group - submits exactly one job here. Swapping the scheduler
 * changes how those jobs get threads, never what a task computes.
 */
class Scheduler {
public:
    /**
     * Obtain a reference to the global default scheduler. Which
     * implementation backs it is decided at build time via
     * `config::global_pool_size`.
     *
     * @return The default globally available scheduler instance.
     */
    static SchedulerRef global();

    /**
     * Submit a job for execution. The job will execute after an
     * indeterminite amount of time as resources free to perform it.
     * 
     * @param task The job to submit for execution.
     */
    virtual void submit(const std::function<void()>& task) = 0;

    /**
     * Submit several jobs at once. The order these jobs will be taken
     * up and executed is undefined.
     * 
     * @param tasks The vector of jobs to submit in-bulk.
     */
    virtual void submitBulk(const std::vector<std::function<void()>>& tasks) = 0;

    /**
     * Check if the scheduler is currently idle - meaning no submitted
     * job is waiting or running.
     * 
     * @return true if the scheduler is idle.
     */
    virtual bool isIdle() const = 0;

    virtual ~Scheduler() = default;
};

} // namespace sloth

#endif
