//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_PROMISE_DEFERRED_H_
#define _SLOTH_PROMISE_DEFERRED_H_

#include <condition_variable>
#include <memory>
#include <mutex>
#include "../Deferred.hpp"

namespace sloth::deferred {

/**
 * A deferred reading the result of a promise.
 */
template <class T, class E>
class PromiseDeferred final : public Deferred<T,E> {
public:
    explicit PromiseDeferred(std::shared_ptr<Promise<T,E>> promise);

    std::optional<Result<T,E>> get() const override;
    void onComplete(const std::function<void(const Result<T,E>&)>& callback) override;
    Result<T,E> await() override;
    std::optional<Result<T,E>> await(std::chrono::milliseconds timeout) override;

private:
    // Shared by every wait on this deferred, so timed out waits leave at
    // most one callback registered with the promise.
    struct Waiter {
        std::mutex mutex;
        std::condition_variable completed;
        std::optional<Result<T,E>> result;
    };

    std::shared_ptr<Promise<T,E>> promise;
    std::mutex subscribeMutex;
    std::shared_ptr<Waiter> waiter;

    std::shared_ptr<Waiter> subscribe();
};

template <class T, class E>
PromiseDeferred<T,E>::PromiseDeferred(std::shared_ptr<Promise<T,E>> promise)
    : promise(std::move(promise))
{}

template <class T, class E>
std::optional<Result<T,E>> PromiseDeferred<T,E>::get() const {
    return promise->get();
}

template <class T, class E>
void PromiseDeferred<T,E>::onComplete(const std::function<void(const Result<T,E>&)>& callback) {
    promise->onComplete(callback);
}

template <class T, class E>
std::shared_ptr<typename PromiseDeferred<T,E>::Waiter> PromiseDeferred<T,E>::subscribe() {
    std::lock_guard<std::mutex> guard(subscribeMutex);
    if(waiter != nullptr) {
        return waiter;
    }

    auto created = std::make_shared<Waiter>();
    waiter = created;

    promise->onComplete([created](const Result<T,E>& result) {
        {
            std::lock_guard<std::mutex> resultGuard(created->mutex);
            created->result = result;
        }
        created->completed.notify_all();
    });

    return created;
}

template <class T, class E>
Result<T,E> PromiseDeferred<T,E>::await() {
    if(auto result = promise->get()) {
        return *result;
    }

    auto subscribed = subscribe();
    std::unique_lock<std::mutex> lock(subscribed->mutex);
    subscribed->completed.wait(lock, [&subscribed]() { return subscribed->result.has_value(); });
    return *(subscribed->result);
}

template <class T, class E>
std::optional<Result<T,E>> PromiseDeferred<T,E>::await(std::chrono::milliseconds timeout) {
    if(auto result = promise->get()) {
        return result;
    }

    auto subscribed = subscribe();
    std::unique_lock<std::mutex> lock(subscribed->mutex);
    if(subscribed->completed.wait_for(lock, timeout, [&subscribed]() { return subscribed->result.has_value(); })) {
        return subscribed->result;
    } else {
        return std::nullopt;
    }
}

} // namespace sloth::deferred

#endif
