//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_PURE_DEFERRED_H_
#define _SLOTH_PURE_DEFERRED_H_

#include "../Deferred.hpp"

namespace sloth::deferred {

/**
 * A deferred which was complete from the moment it was created.
 */
template <class T, class E>
class PureDeferred final : public Deferred<T,E> {
public:
    explicit PureDeferred(const Result<T,E>& result);

    std::optional<Result<T,E>> get() const override;
    void onComplete(const std::function<void(const Result<T,E>&)>& callback) override;
    Result<T,E> await() override;
    std::optional<Result<T,E>> await(std::chrono::milliseconds timeout) override;

private:
    const Result<T,E> result;
};

template <class T, class E>
PureDeferred<T,E>::PureDeferred(const Result<T,E>& result)
    : result(result)
{}

template <class T, class E>
std::optional<Result<T,E>> PureDeferred<T,E>::get() const {
    return result;
}

template <class T, class E>
void PureDeferred<T,E>::onComplete(const std::function<void(const Result<T,E>&)>& callback) {
    return callback(result);
}

template <class T, class E>
Result<T,E> PureDeferred<T,E>::await() {
    return result;
}

template <class T, class E>
std::optional<Result<T,E>> PureDeferred<T,E>::await(std::chrono::milliseconds) {
    return result;
}

} // namespace sloth::deferred

#endif
