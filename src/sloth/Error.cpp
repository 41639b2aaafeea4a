//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "sloth/Error.hpp"

#include <utility>

namespace sloth {

Error::Error()
    : msg()
    , exception()
    , branches()
{}

Error::Error(std::string message)
    : msg(std::move(message))
    , exception()
    , branches()
{}

Error::Error(std::string message, std::exception_ptr cause)
    : msg(std::move(message))
    , exception(std::move(cause))
    , branches()
{}

Error Error::fromCurrentException() {
    return fromException(std::current_exception());
}

Error Error::fromException(const std::exception_ptr& cause) {
    if(!cause) {
        return Error("unknown exception");
    }

    try {
        std::rethrow_exception(cause);
    } catch(const std::exception& error) {
        return Error(error.what(), cause);
    } catch(const std::string& message) {
        return Error(message, cause);
    } catch(const char* message) {
        return Error(message, cause);
    } catch(...) {
        return Error("unknown exception", cause);
    }
}

const std::string& Error::message() const noexcept {
    return msg;
}

std::exception_ptr Error::cause() const noexcept {
    return exception;
}

bool Error::hasCause() const noexcept {
    return static_cast<bool>(exception);
}

const std::vector<Error>& Error::branchErrors() const noexcept {
    return branches;
}

Error Error::withBranchErrors(std::vector<Error> errors) const {
    Error copy(*this);
    copy.branches = std::move(errors);
    return copy;
}

void Error::rethrow() const {
    if(exception) {
        std::rethrow_exception(exception);
    }

    throw FailedResultAccess(*this);
}

bool operator==(const Error& lhs, const Error& rhs) {
    return lhs.message() == rhs.message() && lhs.branchErrors() == rhs.branchErrors();
}

bool operator!=(const Error& lhs, const Error& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << "Error(" << error.message();
    if(!error.branchErrors().empty()) {
        os << ", " << error.branchErrors().size() << " failed branches";
    }
    return os << ")";
}

FailedResultAccess::FailedResultAccess(const Error& error)
    : std::runtime_error(error.message())
    , failure(error)
{}

const Error& FailedResultAccess::error() const noexcept {
    return failure;
}

} // namespace sloth
