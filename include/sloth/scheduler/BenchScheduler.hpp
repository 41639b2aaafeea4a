//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_BENCH_SCHEDULER_H_
#define _SLOTH_BENCH_SCHEDULER_H_

#include "../Scheduler.hpp"
#include <memory>
#include <mutex>
#include <queue>

namespace sloth::scheduler {

/**
 * The BenchScheduler is a scheduler geared towards making certain types
 * of testing easier: submitted jobs don't run in the background. Instead
 * the scheduler must be manually pumped for execution via the
 * `run_one_task` and `run_ready_tasks` methods.
 * 
 * This gives the test bench full control over when an asynchronously
 * started task makes progress - which makes it possible to observe a task
 * that is still pending in a repeatable way.
 *
 * Only serial tasks should be run asynchronously on this scheduler. A
 * parallel group blocks the pumping thread until its branches complete,
 * and those branches would be waiting in this very queue.
 */
class BenchScheduler final : public Scheduler {
public:
    BenchScheduler();

    /**
     * Check the number of jobs that are currently
     * ready for execution.
     * 
     * @return The number of ready jobs.
     */
    std::size_t num_task_ready() const;

    /**
     * Run a single job from the ready queue.
     * 
     * @return True iff a job was executed.
     */
    bool run_one_task();

    /**
     * Run all jobs from the ready queue - including jobs which
     * may be submitted by the executing code. As a result the
     * number of jobs executed may be larger than what
     * `num_task_ready()` indicates before calling this method.
     * 
     * @return The number of jobs that were executed.
     */
    std::size_t run_ready_tasks();

    void submit(const std::function<void()>& task) override;
    void submitBulk(const std::vector<std::function<void()>>& tasks) override;
    bool isIdle() const override;

private:
    std::queue<std::function<void()>> ready_queue;
    mutable std::mutex scheduler_mutex;
};

} // namespace sloth::scheduler

#endif
