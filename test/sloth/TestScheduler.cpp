//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <atomic>
#include <chrono>
#include "gtest/gtest.h"
#include "sloth/Config.hpp"
#include "sloth/Deferred.hpp"
#include "sloth/Promise.hpp"
#include "sloth/Scheduler.hpp"
#include "sloth/scheduler/ThreadPerTaskScheduler.hpp"
#include "sloth/scheduler/ThreadPoolScheduler.hpp"
#include "SchedulerTestBench.hpp"

using sloth::Deferred;
using sloth::None;
using sloth::Promise;
using sloth::Scheduler;

INSTANTIATE_SCHEDULER_TEST_BENCH_SUITE(SchedulerTest);

TEST_P(SchedulerTest, IdlesAtStart) {
    EXPECT_TRUE(sched->isIdle());
}

TEST_P(SchedulerTest, SubmitSingle) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    sched->submit([promise] {
        promise->success(123);
    });

    auto result = deferred->await();
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.get_value(), 123);
}

TEST_P(SchedulerTest, SubmitBulk) {
    const static int num_tasks = 100;
    int num_exec_retries = 1000;

    std::atomic_int num_executed(0);
    std::vector<std::function<void()>> tasks;

    tasks.reserve(num_tasks);
    for(int i = 0; i < num_tasks; i++) {
        tasks.push_back([&num_executed] {
            num_executed++;
        });
    }

    sched->submitBulk(tasks);

    while(num_exec_retries > 0) {
        if(num_executed.load() == num_tasks) {
            break;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            num_exec_retries--;
        }
    }

    EXPECT_EQ(num_executed.load(), num_tasks);
}

TEST_P(SchedulerTest, JobsSubmittedFromJobs) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);
    auto scheduler = sched;

    sched->submit([scheduler, promise] {
        scheduler->submit([promise] {
            promise->success(456);
        });
    });

    auto result = deferred->await();
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.get_value(), 456);
}

TEST(Scheduler, GlobalIsShared) {
    auto first = Scheduler::global();
    auto second = Scheduler::global();

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
}

TEST(Scheduler, GlobalMatchesConfiguration) {
    auto global = Scheduler::global();

    if(sloth::config::global_pool_size == 0) {
        EXPECT_NE(std::dynamic_pointer_cast<sloth::scheduler::ThreadPerTaskScheduler>(global), nullptr);
    } else {
        auto pool = std::dynamic_pointer_cast<sloth::scheduler::ThreadPoolScheduler>(global);
        ASSERT_NE(pool, nullptr);
        EXPECT_EQ(pool->size(), sloth::config::global_pool_size);
    }
}
