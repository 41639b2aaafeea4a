//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/Scheduler.hpp"
#include "sloth/Config.hpp"
#include "sloth/scheduler/ThreadPerTaskScheduler.hpp"
#include "sloth/scheduler/ThreadPoolScheduler.hpp"

namespace sloth {

namespace {

SchedulerRef createGlobal() {
    if(config::global_pool_size == 0) {
        return std::make_shared<scheduler::ThreadPerTaskScheduler>();
    } else {
        return std::make_shared<scheduler::ThreadPoolScheduler>(
            static_cast<unsigned int>(config::global_pool_size));
    }
}

} // namespace

std::shared_ptr<Scheduler> Scheduler::global() {
    static std::shared_ptr<Scheduler> sched = createGlobal();
    return sched;
}

} // namespace sloth
