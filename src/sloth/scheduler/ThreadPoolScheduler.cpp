//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/scheduler/ThreadPoolScheduler.hpp"
#include <chrono>
#include <stdexcept>

namespace sloth::scheduler {

ThreadPoolScheduler::ThreadPoolScheduler(unsigned int poolSize)
    : should_run(true)
    , readyQueueMutex()
    , dataInQueue()
    , readyQueue()
    , idleThreads(poolSize)
    , threadStatus()
{
    if(poolSize == 0) {
        throw std::invalid_argument("A thread pool needs at least one thread.");
    }

    threadStatus.reserve(poolSize);

    for(unsigned int i = 0; i < poolSize; i++) {
        threadStatus.push_back(new std::atomic_bool(false));
        std::thread poolThread(std::bind(&ThreadPoolScheduler::run, this, i));
        poolThread.detach();
    }

    for(unsigned int i = 0; i < poolSize; i++) {
        while(!threadStatus[i]->load());
    }
}

ThreadPoolScheduler::~ThreadPoolScheduler() {
    should_run.store(false);
    dataInQueue.notify_all();

    for(auto& t : threadStatus) {
        while(t->load());
        delete t;
    }
}

void ThreadPoolScheduler::submit(const std::function<void()>& task) {
    {
        std::lock_guard<std::mutex> guard(readyQueueMutex);
        readyQueue.emplace(task);
    }
    dataInQueue.notify_one();
}

void ThreadPoolScheduler::submitBulk(const std::vector<std::function<void()>>& tasks) {
    {
        std::lock_guard<std::mutex> guard(readyQueueMutex);
        for(auto& task: tasks) {
            readyQueue.emplace(task);
        }
    }
    dataInQueue.notify_all();
}

bool ThreadPoolScheduler::isIdle() const {
    std::lock_guard<std::mutex> guard(readyQueueMutex);
    return idleThreads.load() == threadStatus.size() && readyQueue.empty();
}

std::size_t ThreadPoolScheduler::size() const {
    return threadStatus.size();
}

void ThreadPoolScheduler::run(unsigned int thread_index) {
    std::unique_lock<std::mutex> readyQueueLock(readyQueueMutex, std::defer_lock);
    std::chrono::milliseconds max_wait_time(10);
    std::function<void()> task;
    bool idling = true;

    threadStatus[thread_index]->store(true);

    while(should_run.load()) {
        readyQueueLock.lock();

        if(!idling && readyQueue.empty()) {
            idling = true;
            idleThreads++;
        }

        if(dataInQueue.wait_for(readyQueueLock, max_wait_time, [this](){ return !readyQueue.empty(); })) {
            if(idling) {
                idling = false;
                idleThreads--;
            }

            task = readyQueue.front();
            readyQueue.pop();
            readyQueueLock.unlock();
            task();
        } else {
            readyQueueLock.unlock();
        }
    }

    threadStatus[thread_index]->store(false);
}

} // namespace sloth::scheduler
