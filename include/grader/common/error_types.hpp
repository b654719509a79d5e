#pragma once

#include <grader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>

#include <string_view>

namespace grader {

// NOLINTNEXTLINE
enum class ErrorKind {
    Assertion,               ///< A check inside a test body did not hold
    Timeout,                 ///< A test or hook exceeded its deadline
    MultipleCompletion,      ///< A completion handle was invoked more than once
    ExclusivityForbidden,    ///< Something was marked ``only`` while that is forbidden
    PendingForbidden,        ///< A pending test was selected while that is forbidden
    InvalidFilter,           ///< The grep pattern could not be compiled
    InvalidException,        ///< A value that is not a std::exception was thrown
    InstanceAlreadyRunning,  ///< A runner was asked to run while already running
    InstanceAlreadyDisposed, ///< A disposed runner was asked to run
    Infrastructure,          ///< The grader itself failed (e.g., a program could not be spawned)
    UnknownError,            ///< As named; use this as little as possible
};

constexpr std::string_view format_as(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Assertion:
        return "AssertionError";
    case ErrorKind::Timeout:
        return "TimeoutError";
    case ErrorKind::MultipleCompletion:
        return "MultipleCompletionError";
    case ErrorKind::ExclusivityForbidden:
        return "ExclusivityForbiddenError";
    case ErrorKind::PendingForbidden:
        return "PendingForbiddenError";
    case ErrorKind::InvalidFilter:
        return "InvalidFilterError";
    case ErrorKind::InvalidException:
        return "InvalidExceptionError";
    case ErrorKind::InstanceAlreadyRunning:
        return "InstanceAlreadyRunningError";
    case ErrorKind::InstanceAlreadyDisposed:
        return "InstanceAlreadyDisposedError";
    case ErrorKind::Infrastructure:
        return "InfrastructureError";
    case ErrorKind::UnknownError:
        return "Error";
    }

    return "Error";
}

} // namespace grader

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, evaluate to the contained value and continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRY_IMPL(val, ident)                                                                                           \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            return ident.error();                                                                                      \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })
// NOLINTEND(bugprone-macro-parentheses)

#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errref_uniq__, __COUNTER__))
