//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_VALUE_H_
#define _SLOTH_VALUE_H_

#include <any>
#include <memory>
#include <variant>
#include <vector>
#include "None.hpp"

namespace sloth {

namespace engine {
class TaskNode;
}

using TaskNodeRef = std::shared_ptr<const engine::TaskNode>;
using TaskGroup = std::vector<TaskNodeRef>;

/**
 * The untyped value flowing through a task's action queue. It is one of:
 *
 *   1. A plain value - whatever the previous action produced.
 *   2. A nested task - an action returned another task, which the
 *      interpreter must execute before the queue can continue.
 *   3. A task group - the branches of a parallel task.
 *
 * The kind is an explicit tag so that the interpreter can dispatch on it
 * without inspecting the type of the plain value.
 */
class Value {
public:
    enum Kind { PLAIN, TASK, GROUP };

    /**
     * Construct a plain value holding `None`.
     */
    Value();

    /**
     * Construct a plain value.
     *
     * @param value The value to hold.
     * @return The plain value.
     */
    template <typename T>
    static Value of(T&& value) {
        return Value(std::in_place, Data(std::in_place_index<PLAIN>, std::any(std::forward<T>(value))));
    }

    static Value ofTask(TaskNodeRef task);
    static Value ofGroup(TaskGroup tasks);

    /**
     * Construct a plain value holding the collected results of a
     * parallel group, in declaration order.
     */
    static Value ofGathered(std::vector<Value> values);

    Kind kind() const noexcept;
    bool isTask() const noexcept;
    bool isGroup() const noexcept;

    const TaskNodeRef& asTask() const;
    const TaskGroup& asGroup() const;
    std::vector<Value> asGathered() const;

    /**
     * Get the plain value as the given type. Throws `std::bad_any_cast`
     * when the value is of another type and `std::bad_variant_access`
     * when it is not plain.
     */
    template <typename T>
    T as() const {
        return std::any_cast<T>(std::get<PLAIN>(data));
    }

private:
    using Data = std::variant<std::any, TaskNodeRef, TaskGroup>;

    Value(std::in_place_t, Data data);

    Data data;
};

} // namespace sloth

#endif
