//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_PROMISE_H_
#define _SLOTH_PROMISE_H_

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>
#include "Error.hpp"
#include "Result.hpp"

namespace sloth {

template <class T, class E>
class Promise;

template <class T, class E = Error>
using PromiseRef = std::shared_ptr<Promise<T,E>>;

/**
 * A `Promise` represents the "producer" side of a running asynchronous operation. A producer
 * completes an asynchronous operation by calling the `complete` method at which point all
 * consumers will be notified of the available result via an attached `Deferred` instance.
 *
 * A promise is written exactly once. Any number of consumers may read it.
 */
template <class T, class E = Error>
class Promise final {
public:
    /**
     * Create a new, not yet completed, promise.
     * 
     * @return A reference to the created promise.
     */
    static PromiseRef<T,E> create();

    Promise();

    /**
     * Complete this promise with the given value.
     * 
     * @param value The value to use when completing the promise.
     */
    void success(const T& value);
    
    /**
     * Complete this promise with the given error.
     * 
     * @param error The error to use when completing the promise.
     */
    void failure(const E& error);

    /**
     * Complete this promise with the given value OR error. Completing
     * a promise a second time throws.
     * 
     * @param result The value OR error to use when completing the promise.
     */
    void complete(const Result<T,E>& result);

    /**
     * Attempt to retrieve the value of this promise. Will return nothing
     * if the promise has not yet completed. Never blocks.
     *
     * @return The result value of this promise or nothing.
     */
    std::optional<Result<T,E>> get() const;

    /**
     * Register a callback to run once the promise completes. Callbacks run
     * on the completing thread - or immediately on the calling thread if
     * the promise has already completed.
     *
     * @param callback The callback to run with the result.
     */
    void onComplete(const std::function<void(const Result<T,E>&)>& callback);

private:
    std::optional<Result<T,E>> resultOpt;
    mutable std::atomic_flag lock = ATOMIC_FLAG_INIT;
    std::vector<std::function<void(const Result<T,E>&)>> completeCallbacks;
};

template <class T, class E>
PromiseRef<T,E> Promise<T,E>::create() {
    return std::make_shared<Promise<T,E>>();
}

template <class T, class E>
Promise<T,E>::Promise()
    : resultOpt(std::nullopt)
    , completeCallbacks()
{}

template <class T, class E>
void Promise<T,E>::success(const T& value) {
    complete(Result<T,E>::success(value));
}

template <class T, class E>
void Promise<T,E>::failure(const E& error) {
    complete(Result<T,E>::failure(error));
}

template <class T, class E>
void Promise<T,E>::complete(const Result<T,E>& value) {
    std::vector<std::function<void(const Result<T,E>&)>> callbacks_to_run;

    {
        while(lock.test_and_set(std::memory_order_acquire));

        if(resultOpt.has_value()) {
            bool succeeded = resultOpt->is_success();
            lock.clear(std::memory_order_release);

            if(succeeded) {
                throw std::runtime_error("Promise already successfully completed.");
            } else {
                throw std::runtime_error("Promise already completed with an error.");
            }
        }

        resultOpt = value;
        std::swap(completeCallbacks, callbacks_to_run);
        lock.clear(std::memory_order_release);
    }

    for(auto& callback : callbacks_to_run) {
        callback(value);
    }
}

template <class T, class E>
std::optional<Result<T,E>> Promise<T,E>::get() const {
    while(lock.test_and_set(std::memory_order_acquire));
    auto result = resultOpt;
    lock.clear(std::memory_order_release);
    return result;
}

template <class T, class E>
void Promise<T,E>::onComplete(const std::function<void(const Result<T,E>&)>& callback) {
    std::optional<Result<T,E>> completed;

    {
        while(lock.test_and_set(std::memory_order_acquire));
        if(resultOpt.has_value()) {
            completed = resultOpt;
        } else {
            completeCallbacks.push_back(callback);
        }
        lock.clear(std::memory_order_release);
    }

    if(completed.has_value()) {
        callback(*completed);
    }
}

} // namespace sloth

#endif
