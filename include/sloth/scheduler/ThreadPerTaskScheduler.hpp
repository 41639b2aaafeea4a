//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_THREAD_PER_TASK_SCHEDULER_H_
#define _SLOTH_THREAD_PER_TASK_SCHEDULER_H_

#include <atomic>
#include <memory>

#include "../Scheduler.hpp"

namespace sloth::scheduler {

/**
 * Runs every submitted job on a brand new detached thread. There is no
 * bound on the number of threads alive at once - a wide parallel group
 * creates as many threads as it has branches.
 *
 * If the operating system refuses to create a thread the job runs inline
 * on the submitting thread instead and a warning is written to stderr.
 */
class ThreadPerTaskScheduler final : public Scheduler {
public:
    ThreadPerTaskScheduler();

    void submit(const std::function<void()>& task) override;
    void submitBulk(const std::vector<std::function<void()>>& tasks) override;
    bool isIdle() const override;

    /**
     * The number of jobs currently running.
     */
    std::size_t running() const;

private:
    // Shared with the spawned threads so they may outlive the scheduler.
    std::shared_ptr<std::atomic_size_t> runningJobs;
};

} // namespace sloth::scheduler

#endif
