//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/scheduler/ThreadPerTaskScheduler.hpp"
#include <iostream>
#include <system_error>
#include <thread>

namespace sloth::scheduler {

ThreadPerTaskScheduler::ThreadPerTaskScheduler()
    : runningJobs(std::make_shared<std::atomic_size_t>(0))
{}

void ThreadPerTaskScheduler::submit(const std::function<void()>& task) {
    auto counter = runningJobs;
    counter->fetch_add(1, std::memory_order_acq_rel);

    try {
        std::thread worker([counter, task]() {
            task();
            counter->fetch_sub(1, std::memory_order_acq_rel);
        });
        worker.detach();
    } catch(const std::system_error& error) {
        std::cerr << "Unable to spawn a thread (" << error.what() << "), running job inline." << std::endl;
        task();
        counter->fetch_sub(1, std::memory_order_acq_rel);
    }
}

void ThreadPerTaskScheduler::submitBulk(const std::vector<std::function<void()>>& tasks) {
    for(auto& task : tasks) {
        submit(task);
    }
}

bool ThreadPerTaskScheduler::isIdle() const {
    return running() == 0;
}

std::size_t ThreadPerTaskScheduler::running() const {
    return runningJobs->load(std::memory_order_acquire);
}

} // namespace sloth::scheduler
