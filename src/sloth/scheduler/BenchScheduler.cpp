//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/scheduler/BenchScheduler.hpp"

namespace sloth::scheduler {

BenchScheduler::BenchScheduler()
    : ready_queue()
    , scheduler_mutex()
{}

std::size_t BenchScheduler::num_task_ready() const {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    return ready_queue.size();
}

bool BenchScheduler::run_one_task() {
    std::function<void()> task;

    {
        std::lock_guard<std::mutex> guard(scheduler_mutex);
        if(!ready_queue.empty()) {
            task = ready_queue.front();
            ready_queue.pop();
        }
    }

    if(task) {
        task();
        return true;
    } else {
        return false;
    }
}

std::size_t BenchScheduler::run_ready_tasks() {
    std::size_t num_executed = 0;
    while(run_one_task()) num_executed++;
    return num_executed;
}

void BenchScheduler::submit(const std::function<void()>& task) {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    ready_queue.emplace(task);
}

void BenchScheduler::submitBulk(const std::vector<std::function<void()>>& tasks) {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    for(auto& task : tasks) {
        ready_queue.emplace(task);
    }
}

bool BenchScheduler::isIdle() const {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    return ready_queue.empty();
}

} // namespace sloth::scheduler
