//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_ERROR_H_
#define _SLOTH_ERROR_H_

#include <exception>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sloth {

/**
 * The payload of a failed computation. An error always has a human readable
 * message. When it was produced by catching an exception the original
 * exception is kept as well so that it can be rethrown later.
 *
 * An error produced by a failed parallel group additionally carries the
 * errors of every failing branch (in declaration order) - the error itself
 * describes the first of them.
 */
class Error {
public:
    Error();
    explicit Error(std::string message);
    Error(std::string message, std::exception_ptr cause);

    /**
     * Build an error from the exception currently being handled. Must be
     * called from inside a `catch` block.
     *
     * @return An error describing the in-flight exception.
     */
    static Error fromCurrentException();

    /**
     * Build an error from a captured exception.
     *
     * @param cause The captured exception.
     * @return An error describing the captured exception.
     */
    static Error fromException(const std::exception_ptr& cause);

    const std::string& message() const noexcept;
    std::exception_ptr cause() const noexcept;
    bool hasCause() const noexcept;

    /**
     * The errors of all failing branches when this error stands for a
     * failed parallel group. Empty otherwise.
     */
    const std::vector<Error>& branchErrors() const noexcept;

    /**
     * Copy this error, attaching the given branch errors.
     *
     * @param errors The errors of the failing branches.
     * @return A copy of this error carrying the branch errors.
     */
    Error withBranchErrors(std::vector<Error> errors) const;

    /**
     * Rethrow the captured exception. When no exception was captured a
     * `FailedResultAccess` carrying this error is thrown instead.
     */
    [[noreturn]] void rethrow() const;

private:
    std::string msg;
    std::exception_ptr exception;
    std::vector<Error> branches;
};

bool operator==(const Error& lhs, const Error& rhs);
bool operator!=(const Error& lhs, const Error& rhs);
std::ostream& operator<<(std::ostream& os, const Error& error);

/**
 * Thrown when the value of a failed result is requested and the failure
 * has no underlying exception to rethrow.
 */
class FailedResultAccess : public std::runtime_error {
public:
    explicit FailedResultAccess(const Error& error);
    const Error& error() const noexcept;

private:
    Error failure;
};

} // namespace sloth

#endif
