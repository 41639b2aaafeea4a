//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "gtest/gtest.h"
#include "sloth/Deferred.hpp"
#include "sloth/Promise.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include <utility>

using sloth::Deferred;
using sloth::Error;
using sloth::Promise;
using sloth::Result;

// NOLINTBEGIN(bugprone-unchecked-optional-access)

namespace {

struct CopyCounter {
    explicit CopyCounter(std::shared_ptr<int> copies)
        : copies(std::move(copies))
    {}

    CopyCounter(const CopyCounter& other)
        : copies(other.copies)
    {
        (*copies)++;
    }

    CopyCounter& operator=(const CopyCounter& other) = default;

    std::shared_ptr<int> copies;
};

int copiesAfterTimedWaits(int waits) {
    auto copies = std::make_shared<int>(0);
    auto promise = Promise<CopyCounter>::create();
    auto deferred = Deferred<CopyCounter>::forPromise(promise);

    for(int i = 0; i < waits; i++) {
        deferred->await(std::chrono::milliseconds(1));
    }

    CopyCounter value(copies);
    *copies = 0;
    promise->success(value);
    return *copies;
}

} // namespace

TEST(DeferredTest, Pure) {
    auto deferred = Deferred<int>::pure(Result<int>::success(123));

    EXPECT_TRUE(deferred->isDone());

    auto result_opt = deferred->get();
    ASSERT_TRUE(result_opt.has_value());
    ASSERT_TRUE(result_opt->is_success());
    EXPECT_EQ(result_opt->get_value(), 123);
}

TEST(DeferredTest, PureOnComplete) {
    Result<int> result = Result<int>::success(0);
    auto deferred = Deferred<int>::pure(Result<int>::success(123));

    deferred->onComplete([&result](auto value) {
        result = value;
    });

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.get_value(), 123);
}

TEST(DeferredTest, PureAwait) {
    auto deferred = Deferred<int>::pure(Result<int>::success(123));

    EXPECT_EQ(deferred->await().get_value(), 123);

    auto timed = deferred->await(std::chrono::milliseconds(0));
    ASSERT_TRUE(timed.has_value());
    EXPECT_EQ(timed->get_value(), 123);
}

TEST(DeferredTest, PureError) {
    auto deferred = Deferred<int>::pure(Result<int>::failure(Error("broke")));

    auto result = deferred->await();
    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.get_error().message(), "broke");
}

TEST(DeferredTest, Promise) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    EXPECT_FALSE(deferred->get().has_value());
    EXPECT_FALSE(deferred->isDone());
}

TEST(DeferredTest, PromiseOnCompleteSuccess) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    Result<int> result = Result<int>::success(0);
    deferred->onComplete([&result](auto value) {
        result = value;
    });

    promise->success(123);

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.get_value(), 123);
    EXPECT_TRUE(deferred->isDone());
}

TEST(DeferredTest, PromiseOnCompleteError) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    Result<int> result = Result<int>::success(0);
    deferred->onComplete([&result](auto value) {
        result = value;
    });

    promise->failure(Error("broke"));

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.get_error().message(), "broke");
}

TEST(DeferredTest, PromiseOnCompleteAfterCompletion) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);
    promise->success(123);

    int result = 0;
    deferred->onComplete([&result](auto value) {
        result = value.get_value();
    });

    EXPECT_EQ(result, 123);
}

TEST(DeferredTest, PromiseAwaitSyncSuccess) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    promise->success(123);

    EXPECT_EQ(deferred->await().get_value(), 123);
}

TEST(DeferredTest, PromiseAwaitSyncError) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    promise->failure(Error("broke"));

    auto result = deferred->await();
    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.get_error().message(), "broke");
}

TEST(DeferredTest, PromiseAwaitAsync) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    std::thread background([promise]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        promise->success(123);
    });

    auto result = deferred->await();
    background.join();

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.get_value(), 123);
}

TEST(DeferredTest, PromiseAwaitTimeout) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    auto timedOut = deferred->await(std::chrono::milliseconds(5));
    EXPECT_FALSE(timedOut.has_value());

    // Giving up on the wait leaves the promise open.
    promise->success(123);

    auto completed = deferred->await(std::chrono::milliseconds(5));
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->get_value(), 123);
}

TEST(DeferredTest, RepeatedTimeoutsRegisterOneCallback) {
    // Every registered completion callback copies the value once, so the
    // copy count must not depend on how many waits timed out.
    EXPECT_EQ(copiesAfterTimedWaits(1), copiesAfterTimedWaits(50));
}

TEST(DeferredTest, RepeatedTimeoutsThenCompletion) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    for(int i = 0; i < 10; i++) {
        EXPECT_FALSE(deferred->await(std::chrono::milliseconds(1)).has_value());
    }

    promise->success(7);

    EXPECT_EQ(deferred->await().get_value(), 7);
    EXPECT_EQ(deferred->await(std::chrono::milliseconds(1))->get_value(), 7);
}

TEST(DeferredTest, PromiseAwaitWithinTimeout) {
    auto promise = Promise<int>::create();
    auto deferred = Deferred<int>::forPromise(promise);

    std::thread background([promise]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        promise->success(123);
    });

    auto result = deferred->await(std::chrono::seconds(10));
    background.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->get_value(), 123);
}

TEST(DeferredTest, DoesntAllowMultipleSuccesses) {
    auto promise = Promise<int>::create();
    promise->success(123);
    
    try {
        promise->success(456);
        FAIL() << "Excpeted method to throw";
    } catch(std::runtime_error& error) {
        std::string message = error.what();
        EXPECT_EQ(message, "Promise already successfully completed.");
    }

    EXPECT_EQ(promise->get()->get_value(), 123);
}

TEST(DeferredTest, DoesntAllowMultipleErrors) {
    auto promise = Promise<int>::create();
    promise->failure(Error("fail"));
    
    try {
        promise->failure(Error("fail2"));
        FAIL() << "Excpeted method to throw";
    } catch(std::runtime_error& error) {
        std::string message = error.what();
        EXPECT_EQ(message, "Promise already completed with an error.");
    }
}

// NOLINTEND(bugprone-unchecked-optional-access)
