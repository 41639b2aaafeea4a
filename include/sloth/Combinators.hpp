//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_COMBINATORS_H_
#define _SLOTH_COMBINATORS_H_

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>
#include "Task.hpp"
#include "sloth/Config.hpp"

namespace sloth {

namespace detail {

template <typename U, typename F, typename... Ts, std::size_t... I>
Value gatherAs(const F& gather, const std::vector<Value>& values, std::index_sequence<I...>) {
    if(values.size() != sizeof...(Ts)) {
        throw std::invalid_argument(
            "Gather function expects " + std::to_string(sizeof...(Ts)) +
            " results but received " + std::to_string(values.size()) + "."
        );
    }

    return liftAs<U>(gather, values[I].template as<Ts>()...);
}

inline std::size_t pmapPartitions() {
    if(config::pmap_partitions != 0) {
        return config::pmap_partitions;
    }

    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace detail

/**
 * Build a parallel task from the given tasks. When run, every task is
 * started at once (in argument order) and, once all of them succeeded, the
 * gather function is applied to their values in argument order. If any of
 * them fails the combined task fails with the error of the first failing
 * task, which lists every branch failure in `Error::branchErrors`.
 *
 * @param gather The function combining the values. It may return a plain
 *               value or another task.
 * @param tasks The tasks to run concurrently.
 * @return The parallel task.
 */
template <typename F, typename... Ts>
Task<detail::LiftedType<const F&, const Ts&...>> mapply(F gather, const Task<Ts>&... tasks) {
    using U = detail::LiftedType<const F&, const Ts&...>;

    TaskGroup group { tasks.node()... };
    engine::Action action = [gather = std::move(gather)](const Value& gathered) {
        return detail::gatherAs<U, F, Ts...>(gather, gathered.asGathered(), std::index_sequence_for<Ts...>());
    };

    return Task<U>(engine::TaskNode::parallel(std::move(group), action, sizeof...(Ts)));
}

/**
 * Build a parallel task from a runtime sized collection of tasks. The
 * gather function receives the values as a vector in collection order.
 */
template <typename F, typename T>
Task<detail::LiftedType<const F&, const std::vector<T>&>> mapply(F gather, const std::vector<Task<T>>& tasks) {
    using U = detail::LiftedType<const F&, const std::vector<T>&>;

    TaskGroup group;
    group.reserve(tasks.size());
    for(auto& task : tasks) {
        group.push_back(task.node());
    }

    std::size_t arity = group.size();
    engine::Action action = [gather = std::move(gather)](const Value& gathered) {
        std::vector<T> values;
        for(auto& value : gathered.asGathered()) {
            values.push_back(value.template as<T>());
        }
        return detail::liftAs<U>(gather, values);
    };

    return Task<U>(engine::TaskNode::parallel(std::move(group), action, arity));
}

/**
 * Run the given tasks concurrently and collect their values into a tuple.
 */
template <typename... Ts>
Task<std::tuple<Ts...>> zip(const Task<Ts>&... tasks) {
    return mapply([](const Ts&... values) { return std::tuple<Ts...>(values...); }, tasks...);
}

/**
 * Pair the result of applying `predicate` to a task's value with the value
 * itself. The task is run once per branch.
 */
template <typename T, typename Predicate>
auto zipWith(const Task<T>& task, Predicate predicate) {
    return zip(task.then(std::move(predicate)), task);
}

/**
 * Run every task of a collection concurrently and collect the values, in
 * collection order, into the container type `Out`.
 */
template <typename Out, typename Container>
Task<Out> sequencedParInto(const Container& tasks) {
    using T = typename Container::value_type::value_type;

    std::vector<Task<T>> branches(std::begin(tasks), std::end(tasks));
    return mapply([](const std::vector<T>& values) {
        return Out(values.begin(), values.end());
    }, branches);
}

/**
 * Run every task of a collection concurrently, collecting the values into
 * a container of the same shape as the input.
 */
template <template <typename...> class Container, typename T, typename... Rest>
Task<Container<T>> sequencedPar(const Container<Task<T>, Rest...>& tasks) {
    return sequencedParInto<Container<T>>(tasks);
}

/**
 * Run the tasks of a collection strictly one after another, in collection
 * order, collecting the values into the container type `Out`. The first
 * failure stops the sequence.
 */
template <typename Out, typename Container>
Task<Out> sequencedInto(const Container& tasks) {
    using T = typename Container::value_type::value_type;

    auto result = Task<Out>::pure(Out());
    for(const Task<T>& next : tasks) {
        result = result.then([next](const Out& collected) {
            return next.then([collected](const T& value) {
                Out out = collected;
                out.insert(out.end(), value);
                return out;
            });
        });
    }

    return result;
}

/**
 * Run the tasks of a collection strictly one after another, collecting the
 * values into a container of the same shape as the input.
 */
template <template <typename...> class Container, typename T, typename... Rest>
Task<Container<T>> sequenced(const Container<Task<T>, Rest...>& tasks) {
    return sequencedInto<Container<T>>(tasks);
}

/**
 * Map a function over a collection in parallel. The items are split into
 * at most `partitions` contiguous chunks, each chunk is mapped on its own
 * branch and the results are concatenated in item order.
 *
 * @param predicate The function applied to every item.
 * @param items The items to map.
 * @param partitions The maximum number of concurrent branches.
 * @return A task producing the mapped items.
 */
template <typename Predicate, typename T>
Task<std::vector<std::decay_t<std::invoke_result_t<const Predicate&, const T&>>>> pmap(
    Predicate predicate,
    const std::vector<T>& items,
    std::size_t partitions = detail::pmapPartitions()
) {
    using U = std::decay_t<std::invoke_result_t<const Predicate&, const T&>>;
    static_assert(!std::is_void<U>::value && !detail::IsTask<U>::value, "pmap requires a function returning a plain value");

    if(partitions == 0) {
        throw std::invalid_argument("pmap requires at least one partition.");
    }

    if(items.empty()) {
        return Task<std::vector<U>>::pure(std::vector<U>());
    }

    std::size_t count = std::min(partitions, items.size());
    std::size_t chunkSize = items.size() / count;
    std::size_t remainder = items.size() % count;

    std::vector<Task<std::vector<U>>> chunks;
    chunks.reserve(count);

    auto begin = items.begin();
    for(std::size_t i = 0; i < count; i++) {
        auto end = begin + static_cast<std::ptrdiff_t>(chunkSize + (i < remainder ? 1 : 0));
        std::vector<T> chunk(begin, end);
        begin = end;

        chunks.push_back(Task<std::vector<U>>::eval([predicate, chunk]() {
            std::vector<U> mapped;
            mapped.reserve(chunk.size());
            for(auto& item : chunk) {
                mapped.push_back(predicate(item));
            }
            return mapped;
        }));
    }

    return mapply([](const std::vector<std::vector<U>>& mappedChunks) {
        std::vector<U> flattened;
        for(auto& chunk : mappedChunks) {
            flattened.insert(flattened.end(), chunk.begin(), chunk.end());
        }
        return flattened;
    }, chunks);
}

} // namespace sloth

#endif
