//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_THREAD_POOL_SCHEDULER_H_
#define _SLOTH_THREAD_POOL_SCHEDULER_H_

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <queue>
#include <vector>

#include "../Scheduler.hpp"

namespace sloth::scheduler {

/**
 * A scheduler backed by a fixed number of threads sharing one ready queue.
 *
 * Running a parallel group blocks the thread running it until every branch
 * has finished, and the branches themselves need threads from the same pool.
 * The pool must therefore be larger than the deepest nesting of parallel
 * groups being run through it at once, otherwise execution starves.
 *
 * Destruction waits for the pool threads to stop, so the last reference to
 * a pool must not be released from one of its own jobs.
 */
class ThreadPoolScheduler final : public Scheduler {
public:
    /**
     * Construct a scheduler optionally configuring the number of threads
     * to use.
     * 
     * @param poolSize The number of threads to use - defaults to matching
     *                 the number of hardware threads available in the system.
     */
    explicit ThreadPoolScheduler(unsigned int poolSize = std::thread::hardware_concurrency());

    /**
     * Destruct the scheduler. Destruction waits for all running
     * threads to stop before finishing.
     */
    ~ThreadPoolScheduler();

    void submit(const std::function<void()>& task) override;
    void submitBulk(const std::vector<std::function<void()>>& tasks) override;
    bool isIdle() const override;

    /**
     * The number of threads in the pool.
     */
    std::size_t size() const;

private:
    std::atomic_bool should_run;

    mutable std::mutex readyQueueMutex;
    std::condition_variable dataInQueue;
    std::queue<std::function<void()>> readyQueue;
    std::atomic_size_t idleThreads;
    std::vector<std::atomic_bool*> threadStatus;

    void run(unsigned int thread_index);
};

} // namespace sloth::scheduler

#endif
