//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <benchmark/benchmark.h>
#include <string>
#include <vector>
#include "sloth/Combinators.hpp"
#include "sloth/Task.hpp"
#include "sloth/scheduler/BenchScheduler.hpp"
#include "sloth/scheduler/ThreadPerTaskScheduler.hpp"
#include "sloth/scheduler/ThreadPoolScheduler.hpp"

using sloth::Task;
using sloth::scheduler::BenchScheduler;
using sloth::scheduler::ThreadPerTaskScheduler;
using sloth::scheduler::ThreadPoolScheduler;

// Benchmark a chain of plain `then` actions.
// Pre-build the task chain outside the timing loop
static void BM_Then_PlainChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));
    auto sched = std::make_shared<BenchScheduler>();

    Task<int> task = Task<int>::pure(0);
    for (int i = 0; i < chain_length; ++i) {
        task = task.then([](int value) { return value + 1; });
    }

    // Only measure execution time
    for (auto _ : state) {
        auto result = task.run(sched);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Then_PlainChain)->Range(1, 1024);

// Benchmark composing a chain, without running it
static void BM_Then_Build(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));

    for (auto _ : state) {
        Task<int> task = Task<int>::pure(0);
        for (int i = 0; i < chain_length; ++i) {
            task = task.then([](int value) { return value + 1; });
        }
        benchmark::DoNotOptimize(task);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Then_Build)->Range(1, 1 << 16)->Complexity(benchmark::oN);

// Benchmark a chain where every action returns a nested task
static void BM_Then_NestedChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));
    auto sched = std::make_shared<BenchScheduler>();

    Task<int> task = sloth::task([]() { return 0; });
    for (int i = 0; i < chain_length; ++i) {
        task = task.then([](int value) {
            return sloth::task([value]() { return value + 1; });
        });
    }

    for (auto _ : state) {
        auto result = task.run(sched);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Then_NestedChain)->Range(1, 1024);

// Benchmark a chain carrying heap allocated values
static void BM_Then_StringChain(benchmark::State& state) {
    const int chain_length = static_cast<int>(state.range(0));
    auto sched = std::make_shared<BenchScheduler>();

    Task<std::string> task = Task<std::string>::pure(std::string("start"));
    for (int i = 0; i < chain_length; ++i) {
        task = task.then([](const std::string& value) { return value + "."; });
    }

    for (auto _ : state) {
        auto result = task.run(sched);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Then_StringChain)->Range(1, 256);

// Benchmark fan-out of a parallel group over a thread pool
static void BM_SequencedPar_Pool(benchmark::State& state) {
    const int width = static_cast<int>(state.range(0));
    auto sched = std::make_shared<ThreadPoolScheduler>(8);

    std::vector<Task<int>> tasks;
    for (int i = 0; i < width; ++i) {
        tasks.push_back(sloth::task([i]() { return i; }));
    }
    auto task = sloth::sequencedPar(tasks);

    for (auto _ : state) {
        auto result = task.run(sched);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SequencedPar_Pool)->Range(1, 256);

// Benchmark fan-out of a parallel group with a thread per branch
static void BM_SequencedPar_ThreadPerTask(benchmark::State& state) {
    const int width = static_cast<int>(state.range(0));
    auto sched = std::make_shared<ThreadPerTaskScheduler>();

    std::vector<Task<int>> tasks;
    for (int i = 0; i < width; ++i) {
        tasks.push_back(sloth::task([i]() { return i; }));
    }
    auto task = sloth::sequencedPar(tasks);

    for (auto _ : state) {
        auto result = task.run(sched);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SequencedPar_ThreadPerTask)->Range(1, 64);

// Benchmark a partitioned parallel map
static void BM_Pmap(benchmark::State& state) {
    const int size = static_cast<int>(state.range(0));
    auto sched = std::make_shared<ThreadPoolScheduler>(8);

    std::vector<int> items;
    for (int i = 0; i < size; ++i) {
        items.push_back(i);
    }

    for (auto _ : state) {
        auto result = sloth::pmap([](int value) { return value * value; }, items, 4).run(sched);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Pmap)->Range(8, 8192);

BENCHMARK_MAIN();
