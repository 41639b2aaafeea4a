//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/Value.hpp"
#include <utility>

namespace sloth {

Value::Value()
    : data(std::in_place_index<PLAIN>, std::any(None()))
{}

Value::Value(std::in_place_t, Data data)
    : data(std::move(data))
{}

Value Value::ofTask(TaskNodeRef task) {
    return Value(std::in_place, Data(std::in_place_index<TASK>, std::move(task)));
}

Value Value::ofGroup(TaskGroup tasks) {
    return Value(std::in_place, Data(std::in_place_index<GROUP>, std::move(tasks)));
}

Value Value::ofGathered(std::vector<Value> values) {
    return Value::of(std::move(values));
}

Value::Kind Value::kind() const noexcept {
    return static_cast<Kind>(data.index());
}

bool Value::isTask() const noexcept {
    return data.index() == TASK;
}

bool Value::isGroup() const noexcept {
    return data.index() == GROUP;
}

const TaskNodeRef& Value::asTask() const {
    return std::get<TASK>(data);
}

const TaskGroup& Value::asGroup() const {
    return std::get<GROUP>(data);
}

std::vector<Value> Value::asGathered() const {
    return as<std::vector<Value>>();
}

} // namespace sloth
