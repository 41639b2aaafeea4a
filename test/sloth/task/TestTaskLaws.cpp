//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "sloth/Combinators.hpp"
#include "sloth/Task.hpp"

using sloth::Error;
using sloth::Result;
using sloth::Task;

namespace {

// Every third input fails as a broken task.
Task<int> increment(int value) {
    if(value % 3 == 0) {
        return Task<int>::raiseError("increment " + std::to_string(value));
    }
    return sloth::task([value]() { return value + 1; });
}

// Every fifth input fails by throwing.
Task<int> twice(int value) {
    return sloth::task([value]() {
        if(value % 5 == 0) {
            throw std::runtime_error("twice " + std::to_string(value));
        }
        return value * 2;
    });
}

std::vector<Task<int>> sources() {
    std::vector<Task<int>> tasks;
    for(int i = 0; i < 16; i++) {
        tasks.push_back(Task<int>::pure(i));
        tasks.push_back(sloth::task([i]() { return i; }));
    }
    tasks.push_back(Task<int>::raiseError("source"));
    tasks.push_back(Task<int>::eval([]() -> int { throw std::runtime_error("source"); }));
    return tasks;
}

Result<int> outcome(const Task<int>& task) {
    return task.run().await();
}

} // namespace

TEST(TaskLaws, Associativity) {
    for(auto& t : sources()) {
        auto left = t.then(increment).then(twice);
        auto right = t.then([](int value) { return increment(value).then(twice); });

        EXPECT_EQ(outcome(left), outcome(right));
    }
}

TEST(TaskLaws, RightIdentity) {
    for(auto& t : sources()) {
        auto wrapped = t.then([](int value) { return Task<int>::pure(value); });
        auto evaluated = t.then([](int value) { return sloth::task([value]() { return value; }); });

        EXPECT_EQ(outcome(wrapped), outcome(t));
        EXPECT_EQ(outcome(evaluated), outcome(t));
    }
}

TEST(TaskLaws, LeftIdentity) {
    std::vector<std::function<Task<int>(int)>> functions = { increment, twice };

    for(int a = 0; a < 16; a++) {
        for(auto& f : functions) {
            EXPECT_EQ(outcome(Task<int>::pure(a).then(f)), outcome(f(a)));
            EXPECT_EQ(outcome(sloth::task([a]() { return a; }).then(f)), outcome(f(a)));
        }
    }
}

TEST(TaskLaws, RecoveryCorrectness) {
    auto handler = [](const Error& error) { return "handled " + error.message(); };

    for(auto& t : sources()) {
        auto recovered = t
            .then([](int) -> std::string { throw std::runtime_error("E"); })
            .recover(handler)
            .run();

        auto expected = t.run().isBroken() ? handler(Error("source")) : handler(Error("E"));
        EXPECT_EQ(recovered.getOr(""), expected);
    }
}

TEST(TaskLaws, ParallelAggregation) {
    auto result = sloth::zip(sloth::task([]() { return 1; }), sloth::task([]() { return 2; })).run();
    EXPECT_EQ(result.await(), (Result<std::tuple<int,int>>::success(std::make_tuple(1, 2))));

    auto broken = sloth::zip(
        sloth::task([]() { return 1; }),
        sloth::task([]() -> int { throw std::runtime_error("second"); }),
        sloth::task([]() -> int { throw std::runtime_error("third"); })
    ).run();

    auto error = std::get<Error>(broken.get());
    EXPECT_EQ(error.message(), "second");
}

TEST(TaskLaws, IdempotentSpentness) {
    for(auto& t : sources()) {
        auto spent = t.then(increment).run();

        EXPECT_TRUE(spent.isExecuted());
        EXPECT_TRUE(spent.run().isExecuted());
        EXPECT_EQ(outcome(spent), spent.await());
    }
}

TEST(TaskLaws, ConcreteScenarios) {
    auto chained = sloth::task([]() { return 1 + 1; })
        .then([](int value) { return value + 1; })
        .then([](int value) { return value - 1; })
        .run();
    EXPECT_EQ(chained.await(), Result<int>::success(2));

    auto zipped = sloth::sequencedPar(std::vector<Task<int>>{
        sloth::task([]() { return 1; }),
        sloth::task([]() { return 2; }),
        sloth::task([]() { return 3; })
    }).run();
    EXPECT_EQ(zipped.getOr({}), std::vector<int>({1, 2, 3}));
}

TEST(TaskLaws, ComprehensionDesugarsToNestedThen) {
    // Bindings a <- 1, b <- a + 1, c <- a * b with body a + b + c and a
    // trailing recovery, written out as nested `then` calls.
    auto nested = sloth::task([]() { return 1; })
        .then([](int a) {
            return sloth::task([a]() { return a + 1; })
                .then([a](int b) {
                    return sloth::task([a, b]() { return a * b; })
                        .then([a, b](int c) { return a + b + c; });
                });
        })
        .recover([](auto) { return -1; });

    auto flat = sloth::task([]() { return 1; })
        .then([](int a) { return a + (a + 1) + a * (a + 1); });

    EXPECT_EQ(nested.run().getOr(0), 5);
    EXPECT_EQ(outcome(nested), outcome(flat));

    auto failing = sloth::task([]() { return 1; })
        .then([](int a) {
            return sloth::task([]() -> int { throw std::runtime_error("binding broke"); })
                .then([a](int b) { return a + b; });
        })
        .recover([](const Error& error) { return error.message() == "binding broke" ? -1 : -2; });

    EXPECT_EQ(failing.run().getOr(0), -1);
}
