//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "gtest/gtest.h"
#include "sloth/Deferred.hpp"
#include "sloth/Promise.hpp"
#include "sloth/Task.hpp"
#include "sloth/scheduler/BenchScheduler.hpp"
#include "SchedulerTestBench.hpp"

using sloth::Error;
using sloth::None;
using sloth::Promise;
using sloth::Result;
using sloth::Task;
using sloth::scheduler::BenchScheduler;

// NOLINTBEGIN(bugprone-unchecked-optional-access)

TEST(TaskRunAsync, PendingUntilScheduled) {
    auto sched = std::make_shared<BenchScheduler>();
    int counter = 0;

    auto running = sloth::task([&counter]() { return ++counter; })
        .runAsync(sched);

    EXPECT_EQ(sched->num_task_ready(), 1);
    EXPECT_EQ(counter, 0);
    EXPECT_FALSE(running.isDone());
    EXPECT_FALSE(running.isExecuted());
    EXPECT_FALSE(running.isFulfilled());
    EXPECT_FALSE(running.isBroken());
    EXPECT_FALSE(running.peer().has_value());

    sched->run_ready_tasks();

    EXPECT_EQ(counter, 1);
    EXPECT_TRUE(running.isDone());
    EXPECT_TRUE(running.isExecuted());
    EXPECT_TRUE(running.isFulfilled());
    EXPECT_EQ(*(running.peer()), Result<int>::success(1));
}

TEST(TaskRunAsync, CapturesFailure) {
    auto sched = std::make_shared<BenchScheduler>();

    auto running = Task<int>::pure(1)
        .then([](int) -> int { throw std::runtime_error("broke"); })
        .runAsync(sched);

    sched->run_ready_tasks();

    EXPECT_TRUE(running.isBroken());
    EXPECT_EQ(running.await(), Result<int>::failure(Error("broke")));
}

TEST(TaskRunAsync, ComposingPendingTaskDoesNotAffectRun) {
    auto sched = std::make_shared<BenchScheduler>();
    int first = 0;
    int second = 0;

    auto running = sloth::task([&first]() { return ++first; }).runAsync(sched);
    auto extended = running.then([&second](int value) {
        second++;
        return value + 100;
    });

    EXPECT_FALSE(extended.isExecuted());

    sched->run_ready_tasks();

    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 0);
    EXPECT_EQ(running.await(), Result<int>::success(1));

    auto finished = extended.run();
    EXPECT_EQ(finished.getOr(0), 101);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}

TEST(TaskRunAsync, RunOnPendingTaskBlocksUntilResolved) {
    auto promise = Promise<None>::create();
    auto gate = sloth::Deferred<None>::forPromise(promise);

    auto running = sloth::task([gate]() {
            gate->await();
            return 5;
        })
        .runAsync(std::make_shared<sloth::scheduler::ThreadPerTaskScheduler>());

    auto extended = running.then([](int value) { return value * 2; });

    std::thread release([promise]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        promise->success(None());
    });

    auto result = extended.run();
    release.join();

    EXPECT_EQ(result.getOr(0), 10);
}

TEST(TaskWait, BlocksUntilDone) {
    auto running = sloth::task([]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return 123;
        })
        .runAsync(std::make_shared<sloth::scheduler::ThreadPerTaskScheduler>());

    auto waited = running.wait();

    EXPECT_TRUE(waited.isDone());
    EXPECT_EQ(*(waited.peer()), Result<int>::success(123));
}

TEST(TaskWait, KeepsQueuedActions) {
    auto sched = std::make_shared<BenchScheduler>();
    auto running = Task<int>::pure(1).runAsync(sched);
    auto extended = running.then([](int value) { return value + 1; });

    sched->run_ready_tasks();
    auto waited = extended.wait(std::chrono::milliseconds(10));

    EXPECT_TRUE(waited.isDone());
    EXPECT_FALSE(waited.isExecuted());
    EXPECT_EQ(waited.run().getOr(0), 2);
}

TEST(TaskWait, TimesOut) {
    auto sched = std::make_shared<BenchScheduler>();
    auto running = Task<int>::pure(1).runAsync(sched);

    auto waited = running.wait(std::chrono::milliseconds(5));

    EXPECT_TRUE(waited.isExecuted());
    EXPECT_TRUE(waited.isBroken());
    EXPECT_EQ(waited.await(), Result<int>::failure(Error("Timed out waiting for task after 5 ms")));

    // The computation itself is left alone.
    EXPECT_FALSE(running.isDone());
    sched->run_ready_tasks();
    EXPECT_EQ(running.await(), Result<int>::success(1));
}

TEST(TaskWait, TimesOutWithFallback) {
    auto sched = std::make_shared<BenchScheduler>();
    auto running = Task<int>::pure(1).runAsync(sched);

    auto waited = running.wait(std::chrono::milliseconds(5), 456);

    EXPECT_TRUE(waited.isExecuted());
    EXPECT_EQ(waited.await(), Result<int>::success(456));

    sched->run_ready_tasks();
    EXPECT_EQ(running.wait(std::chrono::milliseconds(5), 456).getOr(0), 1);
}

TEST(TaskRun, IsSpent) {
    auto result = sloth::task([]() { return 1; })
        .then([](int value) { return value + 1; })
        .run();

    EXPECT_TRUE(result.isExecuted());
    EXPECT_TRUE(result.isDone());

    auto again = result.run();
    EXPECT_TRUE(again.isExecuted());
    EXPECT_EQ(again.getOr(0), 2);
}

INSTANTIATE_SCHEDULER_TEST_BENCH_SUITE(TaskRunTest);

TEST_P(TaskRunTest, RunAsyncAndWait) {
    auto result = sloth::task([]() { return 1 + 1; })
        .then([](int value) { return value * 21; })
        .runAsync(sched)
        .wait();

    EXPECT_TRUE(result.isExecuted());
    EXPECT_EQ(result.await(), Result<int>::success(42));
}

TEST_P(TaskRunTest, ManyConcurrentRuns) {
    const static int num_tasks = 50;
    std::atomic_int counter(0);
    std::vector<Task<int>> running;

    for(int i = 0; i < num_tasks; i++) {
        running.push_back(sloth::task([&counter, i]() {
            counter++;
            return i;
        }).runAsync(sched));
    }

    int sum = 0;
    for(auto& task : running) {
        sum += task.getOr(0);
    }

    EXPECT_EQ(counter.load(), num_tasks);
    EXPECT_EQ(sum, num_tasks * (num_tasks - 1) / 2);
}

TEST_P(TaskRunTest, NestedRunAsync) {
    auto scheduler = sched;
    auto result = sloth::task([scheduler]() {
            return sloth::task([]() { return 7; }).runAsync(scheduler);
        })
        .then([](int value) { return value * 6; })
        .run(sched);

    EXPECT_EQ(result.getOr(0), 42);
}

// NOLINTEND(bugprone-unchecked-optional-access)
