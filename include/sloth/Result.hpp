//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_RESULT_H_
#define _SLOTH_RESULT_H_

#include <functional>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>
#include "Error.hpp"
#include "None.hpp"

namespace sloth {

template <typename T, typename E = Error>
class Result;

namespace detail {

template <typename R>
struct IsResult : std::false_type {};

template <typename T, typename E>
struct IsResult<Result<T,E>> : std::true_type {};

template <typename F, typename... Args>
using AttemptType = std::conditional_t<
    std::is_void<std::invoke_result_t<F, Args...>>::value,
    None,
    std::decay_t<std::invoke_result_t<F, Args...>>
>;

} // namespace detail

/**
 * Evaluate the given thunk, capturing its outcome as data. A value returned
 * by the thunk becomes a success (a `void` thunk succeeds with `None`) and
 * any exception thrown by it becomes a failure holding the exception.
 *
 * This is the single place where exceptions raised by user code are turned
 * into results.
 *
 * @param thunk The computation to evaluate.
 * @return The outcome of the computation.
 */
template <typename Thunk>
Result<detail::AttemptType<Thunk&>> attempt(Thunk&& thunk);

/**
 * A result holds the outcome of a computation: either a success holding a
 * value or a failure holding an error. Exactly one of the two is present
 * and a result never changes once constructed.
 *
 * It is shaped like an `Either` whose left side is the success and whose
 * right side is the failure, with a few combinators on top that keep
 * exceptions thrown by callbacks contained.
 */
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /**
     * Construct a successful result.
     *
     * @param value The value to hold.
     * @return A result holding the value.
     */
    constexpr static Result<T,E> success(const T& value);
    constexpr static Result<T,E> success(T&& value);

    /**
     * Construct a failed result.
     *
     * @param error The error to hold.
     * @return A result holding the error.
     */
    constexpr static Result<T,E> failure(const E& error);
    constexpr static Result<T,E> failure(E&& error);

    constexpr bool is_success() const;
    constexpr bool is_failure() const;

    /**
     * Get the success value. Must be guarded by `is_success`.
     */
    constexpr const T& get_value() const;

    /**
     * Get the failure error. Must be guarded by `is_failure`.
     */
    constexpr const E& get_error() const;

    /**
     * Get whichever payload this result holds - the value on success
     * and the error on failure.
     *
     * @return The held value or error.
     */
    std::variant<T,E> get() const;

    /**
     * Get the success value, propagating a failure. For failures holding
     * an `Error` the captured exception is rethrown, any other error type
     * is thrown as is.
     *
     * @return The success value.
     */
    T value() const;

    /**
     * Get the success value or the given fallback for a failure.
     *
     * @param fallback The value to use on failure.
     * @return The success value or the fallback.
     */
    T get_or(const T& fallback) const;

    /**
     * Dispatch on the held payload without exposing it.
     *
     * @param on_success Invoked with the value on success.
     * @param on_failure Invoked with the error on failure.
     * @return Whatever the invoked function returns.
     */
    template <typename SuccessFn, typename FailureFn>
    auto fold(SuccessFn&& on_success, FailureFn&& on_failure) const;

    /**
     * Transform the success value. Exceptions thrown by the transformation
     * become failures. Failures pass through untouched.
     *
     * @param predicate The transformation.
     * @return The transformed result.
     */
    template <typename Predicate>
    Result<detail::AttemptType<const Predicate&, const T&>,E> map(const Predicate& predicate) const;

    /**
     * Chain a computation which itself produces a result. Failures short
     * circuit, exceptions thrown by the computation become failures.
     *
     * @param predicate The computation returning a `Result`.
     * @return The result of the computation.
     */
    template <typename Predicate>
    std::invoke_result_t<const Predicate&, const T&> bind(const Predicate& predicate) const;

    /**
     * Collapse one level of nesting from a result holding a result.
     *
     * @return The inner result, or this failure.
     */
    auto join() const;

    /**
     * Replace a failure with the outcome of the given function. The function
     * may return a plain value or a `Result`. Successes pass through
     * untouched.
     *
     * @param predicate The function applied to the error.
     * @return The recovered result.
     */
    template <typename Predicate>
    Result<T,E> recover(const Predicate& predicate) const;

    constexpr Result(const Result<T,E>&) = default;
    constexpr Result(Result<T,E>&&) = default;
    constexpr Result<T,E>& operator=(const Result<T,E>&) = default;
    constexpr Result<T,E>& operator=(Result<T,E>&&) = default;

private:
    constexpr Result() = default;
    std::optional<T> successValue;
    std::optional<E> failureValue;
};

template <typename T, typename E>
constexpr Result<T,E> Result<T,E>::success(const T& value) {
    Result<T,E> result;
    result.successValue = value;
    return result;
}

template <typename T, typename E>
constexpr Result<T,E> Result<T,E>::success(T&& value) {
    Result<T,E> result;
    result.successValue = std::move(value);
    return result;
}

template <typename T, typename E>
constexpr Result<T,E> Result<T,E>::failure(const E& error) {
    Result<T,E> result;
    result.failureValue = error;
    return result;
}

template <typename T, typename E>
constexpr Result<T,E> Result<T,E>::failure(E&& error) {
    Result<T,E> result;
    result.failureValue = std::move(error);
    return result;
}

template <typename T, typename E>
constexpr bool Result<T,E>::is_success() const {
    return successValue.has_value();
}

template <typename T, typename E>
constexpr bool Result<T,E>::is_failure() const {
    return failureValue.has_value();
}

template <typename T, typename E>
constexpr const T& Result<T,E>::get_value() const {
    return *successValue;
}

template <typename T, typename E>
constexpr const E& Result<T,E>::get_error() const {
    return *failureValue;
}

template <typename T, typename E>
std::variant<T,E> Result<T,E>::get() const {
    if(is_success()) {
        return std::variant<T,E>(std::in_place_index<0>, *successValue);
    } else {
        return std::variant<T,E>(std::in_place_index<1>, *failureValue);
    }
}

template <typename T, typename E>
T Result<T,E>::value() const {
    if(is_success()) {
        return *successValue;
    } else if constexpr (std::is_same<E,Error>::value) {
        failureValue->rethrow();
    } else {
        throw *failureValue;
    }
}

template <typename T, typename E>
T Result<T,E>::get_or(const T& fallback) const {
    if(is_success()) {
        return *successValue;
    } else {
        return fallback;
    }
}

template <typename T, typename E>
template <typename SuccessFn, typename FailureFn>
auto Result<T,E>::fold(SuccessFn&& on_success, FailureFn&& on_failure) const {
    if(is_success()) {
        return std::invoke(std::forward<SuccessFn>(on_success), *successValue);
    } else {
        return std::invoke(std::forward<FailureFn>(on_failure), *failureValue);
    }
}

template <typename T, typename E>
template <typename Predicate>
Result<detail::AttemptType<const Predicate&, const T&>,E> Result<T,E>::map(const Predicate& predicate) const {
    static_assert(std::is_same<E,Error>::value, "map captures exceptions and requires an Error payload");
    using T2 = detail::AttemptType<const Predicate&, const T&>;

    if(is_success()) {
        const T& input = *successValue;
        return attempt([&predicate, &input]() { return predicate(input); });
    } else {
        return Result<T2,E>::failure(*failureValue);
    }
}

template <typename T, typename E>
template <typename Predicate>
std::invoke_result_t<const Predicate&, const T&> Result<T,E>::bind(const Predicate& predicate) const {
    using R = std::invoke_result_t<const Predicate&, const T&>;
    static_assert(detail::IsResult<R>::value, "bind requires a function returning a Result");
    static_assert(std::is_same<typename R::error_type,E>::value, "bind cannot change the error type");

    if(is_success()) {
        const T& input = *successValue;
        return attempt([&predicate, &input]() { return predicate(input); }).join();
    } else {
        return R::failure(*failureValue);
    }
}

template <typename T, typename E>
auto Result<T,E>::join() const {
    static_assert(detail::IsResult<T>::value, "join requires a Result holding a Result");
    static_assert(std::is_same<typename T::error_type,E>::value, "join cannot change the error type");

    if(is_success()) {
        return *successValue;
    } else {
        return T::failure(*failureValue);
    }
}

template <typename T, typename E>
template <typename Predicate>
Result<T,E> Result<T,E>::recover(const Predicate& predicate) const {
    static_assert(std::is_same<E,Error>::value, "recover captures exceptions and requires an Error payload");
    using R = std::decay_t<std::invoke_result_t<const Predicate&, const E&>>;

    if(is_success()) {
        return *this;
    }

    const E& error = *failureValue;
    if constexpr (detail::IsResult<R>::value) {
        return attempt([&predicate, &error]() { return predicate(error); }).join();
    } else {
        auto recovered = attempt([&predicate, &error]() { return T(predicate(error)); });
        if(recovered.is_success()) {
            return Result<T,E>::success(recovered.get_value());
        } else {
            return Result<T,E>::failure(recovered.get_error());
        }
    }
}

template <typename Thunk>
Result<detail::AttemptType<Thunk&>> attempt(Thunk&& thunk) {
    using T = detail::AttemptType<Thunk&>;

    try {
        if constexpr (std::is_void<std::invoke_result_t<Thunk&>>::value) {
            thunk();
            return Result<T>::success(None());
        } else {
            return Result<T>::success(thunk());
        }
    } catch(...) {
        return Result<T>::failure(Error::fromCurrentException());
    }
}

template <typename T, typename E>
bool operator==(const Result<T,E>& lhs, const Result<T,E>& rhs) {
    if(lhs.is_success() && rhs.is_success()) {
        return lhs.get_value() == rhs.get_value();
    } else if(lhs.is_failure() && rhs.is_failure()) {
        return lhs.get_error() == rhs.get_error();
    } else {
        return false;
    }
}

template <typename T, typename E>
bool operator!=(const Result<T,E>& lhs, const Result<T,E>& rhs) {
    return !(lhs == rhs);
}

} // namespace sloth

#endif
