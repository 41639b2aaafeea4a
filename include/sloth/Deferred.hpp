//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_DEFERRED_H_
#define _SLOTH_DEFERRED_H_

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "Promise.hpp"

namespace sloth {

template <class T, class E> class Deferred;

template <class T, class E = Error> using DeferredRef = std::shared_ptr<Deferred<T, E>>;

/**
 * A `Deferred` represents the "consumer" side of an asynchronous operation - the
 * handle a task holds on to for its most recent result. Consumers may peek at it
 * without blocking (`get`), block until it is available (`await`), block for a
 * bounded amount of time, or register a callback (`onComplete`).
 *
 * Giving up on a timed `await` only abandons the wait. The computation producing
 * the result keeps running to completion.
 */
template <class T, class E = Error>
class Deferred {
public:
    /**
     * Create a deferred instance wrapping an already computed result.
     *
     * @param result The result of this completed deferred.
     * @return A deferred wrapping the given result.
     */
    static DeferredRef<T, E> pure(const Result<T, E>& result);

    /**
     * Create a deferred whose completion is governed by
     * the supplied promise.
     *
     * @param promise The promise which, when complete, should
     *                also complete this deferred.
     * @return A deferred instance for the given promise.
     */
    static DeferredRef<T, E> forPromise(PromiseRef<T, E> promise);

    /**
     * Peek at the result without blocking.
     *
     * @return The result or nothing if it is not yet available.
     */
    virtual std::optional<Result<T, E>> get() const = 0;

    /**
     * Check, without blocking, whether the result is available.
     *
     * @return True iff the result is available.
     */
    bool isDone() const {
        return get().has_value();
    }

    /**
     * Register a callback to be evaluated when the result is
     * available.
     *
     * @param callback The callback to execute.
     */
    virtual void onComplete(const std::function<void(const Result<T, E>&)>& callback) = 0;

    /**
     * Block the current thread until the result is available.
     *
     * @return The result of the asynchronous computation.
     */
    virtual Result<T, E> await() = 0;

    /**
     * Block the current thread until the result is available or
     * the given timeout elapses.
     *
     * @param timeout The maximum amount of time to block for.
     * @return The result or nothing if the timeout elapsed first.
     */
    virtual std::optional<Result<T, E>> await(std::chrono::milliseconds timeout) = 0;

    virtual ~Deferred(){};
};

} // namespace sloth

#include "deferred/PromiseDeferred.hpp"
#include "deferred/PureDeferred.hpp"

namespace sloth {

template <class T, class E> DeferredRef<T, E> Deferred<T, E>::pure(const Result<T, E>& result) {
    return std::make_shared<deferred::PureDeferred<T, E>>(result);
}

template <class T, class E> DeferredRef<T, E> Deferred<T, E>::forPromise(PromiseRef<T, E> promise) {
    return std::make_shared<deferred::PromiseDeferred<T, E>>(promise);
}

} // namespace sloth

#endif
