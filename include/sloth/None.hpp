//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_NONE_H_
#define _SLOTH_NONE_H_

#include <ostream>

namespace sloth {

/**
 * The unit value. A freshly created task starts out holding `None` before
 * its first action runs, and callbacks returning `void` produce it. Unlike
 * `void` it is a real value, so it can flow through a task's action queue
 * like any other result.
 */
class None {};

constexpr inline bool operator==(const None&, const None&) {
    return true;
}

constexpr inline bool operator!=(const None&, const None&) {
    return false;
}

inline std::ostream& operator<<(std::ostream& os, const None&) {
    return os << "None";
}

} // namespace sloth

#endif
