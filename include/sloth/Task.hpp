//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_TASK_H_
#define _SLOTH_TASK_H_

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "Error.hpp"
#include "None.hpp"
#include "Result.hpp"
#include "Scheduler.hpp"
#include "Value.hpp"
#include "engine/Interpreter.hpp"
#include "engine/TaskNode.hpp"

namespace sloth {

template <typename T = None>
class Task;

namespace detail {

template <typename R>
struct IsTask : std::false_type {};

template <typename T>
struct IsTask<Task<T>> : std::true_type {};

template <typename R>
struct Lifted {
    using type = R;
};

template <>
struct Lifted<void> {
    using type = None;
};

template <typename T>
struct Lifted<Task<T>> {
    using type = T;
};

/**
 * The value type of the task produced by a callback: a callback returning
 * `U` or `Task<U>` produces a `Task<U>`, a `void` callback a `Task<None>`.
 */
template <typename F, typename... Args>
using LiftedType = typename Lifted<std::decay_t<std::invoke_result_t<F, Args...>>>::type;

/**
 * Invoke a callback and convert whatever it returned into the engine's
 * untyped value. A returned task is kept as a nested task so that the
 * interpreter runs it, it is never forced here.
 */
template <typename Target, typename F, typename... Args>
Value liftAs(const F& callback, const Args&... args) {
    using R = std::decay_t<std::invoke_result_t<const F&, const Args&...>>;

    if constexpr (std::is_void<R>::value) {
        static_assert(std::is_same<Target,None>::value, "A void callback can only produce a Task<None>");
        callback(args...);
        return Value();
    } else if constexpr (IsTask<R>::value) {
        static_assert(std::is_same<typename R::value_type,Target>::value, "Callback returns a task of the wrong type");
        return Value::ofTask(callback(args...).node());
    } else {
        return Value::of(Target(callback(args...)));
    }
}

} // namespace detail

/**
 * A Task represents a computation that is lazily evaluated. Building a task
 * or composing it with `then` and `recover` never runs anything. The task
 * simply records the actions still to be applied - in order - to its most
 * recent result. Running a task (`run` or `runAsync`) consumes that queue and
 * yields a new, spent, task holding the outcome.
 *
 * Tasks are immutable values and can be freely copied and shared between
 * threads. Composing a spent task makes it unexecuted again without losing
 * the value it already holds: a later run only evaluates the new actions.
 *
 * Exceptions thrown by user callbacks never escape a run. They become the
 * failure held by the resulting task.
 */
template <typename T>
class Task {
public:
    using value_type = T;

    /**
     * Create a task that wraps a function. Whenever the task is run it
     * executes the function and provides its result to downstream actions.
     * The function may return a `T`, a `Task<T>` (which is run in turn) or,
     * for a `Task<None>`, nothing at all.
     *
     * @param thunk The function to run when the task is run.
     * @return A task wrapping the given function.
     */
    template <typename Thunk>
    static Task<T> eval(Thunk thunk) {
        return Task<T>(engine::TaskNode::thunk([thunk = std::move(thunk)]() {
            return detail::liftAs<T>(thunk);
        }));
    }

    /**
     * Create an already resolved task holding the given value.
     *
     * @param value The value for this task.
     * @return A spent task holding the value.
     */
    static Task<T> pure(const T& value) {
        return Task<T>(engine::TaskNode::resolved(engine::Outcome::success(Value::of(value))));
    }

    /**
     * Create an already resolved task holding the given error.
     *
     * @param message The message of the error.
     * @return A spent, broken, task.
     */
    static Task<T> raiseError(const std::string& message) {
        return raiseError(Error(message));
    }

    static Task<T> raiseError(const Error& error) {
        return Task<T>(engine::TaskNode::resolved(engine::Outcome::failure(error)));
    }

    /**
     * Create an already resolved task holding the given result.
     *
     * @param result The outcome for this task.
     * @return A spent task holding the result.
     */
    static Task<T> fromResult(const Result<T>& result) {
        if(result.is_success()) {
            return pure(result.get_value());
        } else {
            return raiseError(result.get_error());
        }
    }

    explicit Task(TaskNodeRef node)
        : taskNode(std::move(node))
    {}

    /**
     * Queue a transformation of this task's value. The function may return
     * a plain value or another task, which is run when this task is run.
     * Composing a task that is already known to be broken yields a task
     * carrying the same failure.
     *
     * @param predicate The transformation applied to the value.
     * @return A new task with the transformation queued.
     */
    template <typename Predicate>
    Task<detail::LiftedType<const Predicate&, const T&>> then(Predicate predicate) const {
        using U = detail::LiftedType<const Predicate&, const T&>;

        return Task<U>(taskNode->then([predicate = std::move(predicate)](const Value& value) {
            return detail::liftAs<U>(predicate, value.as<T>());
        }));
    }

    /**
     * Queue a side effect. The function ignores the value and the value is
     * kept for downstream actions. When the function returns a task, that
     * task is run before the chain continues and its failure, if any, fails
     * the chain.
     *
     * @param predicate The side effect to run.
     * @return A new task with the side effect queued.
     */
    template <typename Predicate>
    Task<T> thenDo(Predicate predicate) const {
        return Task<T>(taskNode->then([predicate = std::move(predicate)](const Value& value) {
            using R = std::decay_t<std::invoke_result_t<const Predicate&>>;

            if constexpr (detail::IsTask<R>::value) {
                return Value::ofTask(predicate().node()->then([value](const Value&) {
                    return value;
                }));
            } else {
                predicate();
                return value;
            }
        }));
    }

    /**
     * Install a recovery for failures of this task. When running the task
     * fails, the function is handed the error and its result (a value or
     * another task) replaces the whole computation. The action queue is
     * left as it is.
     *
     * @param predicate The function applied to the error.
     * @return A new task with the recovery installed.
     */
    template <typename Predicate>
    Task<T> recover(Predicate predicate) const {
        return Task<T>(taskNode->recover([predicate = std::move(predicate)](const Error& error) {
            return detail::liftAs<T>(predicate, error);
        }));
    }

    /**
     * Run this task on the calling thread, blocking until it completes.
     *
     * @param sched The scheduler used for parallel branches.
     * @return A spent task holding the outcome.
     */
    Task<T> run(const SchedulerRef& sched = Scheduler::global()) const {
        return Task<T>(engine::Interpreter::run(taskNode, sched));
    }

    /**
     * Start running this task on the given scheduler and return
     * immediately. The returned task holds a pending handle until the
     * run completes.
     *
     * @param sched The scheduler the run is submitted to.
     * @return A spent task whose outcome may still be pending.
     */
    Task<T> runAsync(const SchedulerRef& sched = Scheduler::global()) const {
        return Task<T>(engine::Interpreter::runAsync(taskNode, sched));
    }

    /**
     * Block until this task's handle resolves. Queued actions are kept.
     *
     * @return A task whose handle is resolved.
     */
    Task<T> wait() const {
        auto outcome = taskNode->handle()->await();
        return Task<T>(taskNode->withHandle(Deferred<Value,Error>::pure(outcome)));
    }

    /**
     * Block until this task's handle resolves or the timeout elapses.
     * Timing out only abandons the wait, the computation keeps running.
     *
     * @param timeout How long to wait for.
     * @return The resolved task, or a broken task if the timeout elapsed.
     */
    Task<T> wait(std::chrono::milliseconds timeout) const {
        if(auto outcome = taskNode->handle()->await(timeout)) {
            return Task<T>(taskNode->withHandle(Deferred<Value,Error>::pure(*outcome)));
        }

        return raiseError("Timed out waiting for task after " + std::to_string(timeout.count()) + " ms");
    }

    /**
     * Block until this task's handle resolves or the timeout elapses.
     *
     * @param timeout How long to wait for.
     * @param fallback The value to use if the timeout elapsed.
     * @return The resolved task, or a task holding the fallback.
     */
    Task<T> wait(std::chrono::milliseconds timeout, const T& fallback) const {
        if(auto outcome = taskNode->handle()->await(timeout)) {
            return Task<T>(taskNode->withHandle(Deferred<Value,Error>::pure(*outcome)));
        }

        return pure(fallback);
    }

    /**
     * Block until the outcome of this (spent) task is available.
     *
     * @return The outcome of the task.
     */
    Result<T> await() const {
        if(!taskNode->actions()->is_empty()) {
            throw std::logic_error("Cannot read the value of a task with unexecuted actions. Run it first.");
        }

        return typed(taskNode->handle()->await());
    }

    /**
     * Block until the outcome of this (spent) task is available and
     * return whichever of the value or the error it holds.
     */
    std::variant<T,Error> get() const {
        return await().get();
    }

    /**
     * Block until the outcome of this (spent) task is available.
     *
     * @param fallback The value to use if the task failed.
     * @return The value of the task or the fallback.
     */
    T getOr(const T& fallback) const {
        return await().get_or(fallback);
    }

    /**
     * Peek at the outcome without blocking. Nothing is returned while the
     * handle is pending or while actions are still queued.
     */
    std::optional<Result<T>> peer() const {
        if(!taskNode->actions()->is_empty()) {
            return std::nullopt;
        }

        if(auto outcome = taskNode->peek()) {
            return typed(*outcome);
        }

        return std::nullopt;
    }

    bool isDone() const {
        return taskNode->isDone();
    }

    bool isExecuted() const {
        return taskNode->isExecuted();
    }

    bool isFulfilled() const {
        return taskNode->isFulfilled();
    }

    bool isBroken() const {
        return taskNode->isBroken();
    }

    /**
     * The untyped node backing this task.
     */
    const TaskNodeRef& node() const noexcept {
        return taskNode;
    }

private:
    TaskNodeRef taskNode;

    static Result<T> typed(const engine::Outcome& outcome) {
        return outcome.map([](const Value& value) { return value.as<T>(); });
    }
};

/**
 * Create a task wrapping a function, deducing the task's value type from
 * what the function returns.
 *
 * @param thunk The function to run when the task is run.
 * @return A task wrapping the given function.
 */
template <typename Thunk>
Task<detail::LiftedType<const Thunk&>> task(Thunk thunk) {
    return Task<detail::LiftedType<const Thunk&>>::eval(std::move(thunk));
}

} // namespace sloth

#endif
