/// \file
/// Error taxonomy shared by the runner, the sandbox and the assertion helpers
#pragma once

#include <grader/common/error_types.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace grader {

/// Base class for every error the grader raises on purpose
class GraderError : public std::runtime_error
{
public:
    GraderError(ErrorKind kind, const std::string& msg)
        : std::runtime_error{msg}
        , kind_{kind} {}

    ErrorKind get_kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// A check in a test body failed. ``actual`` and ``expected`` are already stringified for display.
class AssertionError : public GraderError
{
public:
    explicit AssertionError(const std::string& msg, std::optional<std::string> actual = std::nullopt,
                            std::optional<std::string> expected = std::nullopt)
        : GraderError{ErrorKind::Assertion, msg}
        , actual_{std::move(actual)}
        , expected_{std::move(expected)} {}

    const std::optional<std::string>& get_actual() const noexcept { return actual_; }

    const std::optional<std::string>& get_expected() const noexcept { return expected_; }

private:
    std::optional<std::string> actual_;
    std::optional<std::string> expected_;
};

class TimeoutError : public GraderError
{
public:
    explicit TimeoutError(std::chrono::milliseconds limit);

    std::chrono::milliseconds get_limit() const noexcept { return limit_; }

private:
    std::chrono::milliseconds limit_;
};

/// A completion handle (``Done``) was invoked again for an attempt that had already completed
class MultipleCompletionError : public GraderError
{
public:
    MultipleCompletionError(const std::string& runnable_title, const std::optional<std::string>& reason);
};

/// Raised by ``Context::skip()``. A control signal rather than a failure, so it intentionally
/// does not derive from std::exception.
class PendingSignal
{
public:
    const char* what() const noexcept { return "skipped; aborting execution"; }
};

class ExclusivityForbiddenError : public GraderError
{
public:
    ExclusivityForbiddenError()
        : GraderError{ErrorKind::ExclusivityForbidden, "`only` is forbidden in this run"} {}
};

class PendingForbiddenError : public GraderError
{
public:
    explicit PendingForbiddenError(const std::string& what)
        : GraderError{ErrorKind::PendingForbidden, what} {}
};

class InvalidFilterError : public GraderError
{
public:
    InvalidFilterError(const std::string& pattern, const std::string& reason);
};

/// A runner was reused in a state that does not permit running
class RunnerStateError : public GraderError
{
public:
    using GraderError::GraderError;
};

/// Something other than a std::exception was thrown from a test or hook
class InvalidExceptionError : public GraderError
{
public:
    InvalidExceptionError(const std::string& type_name, const std::optional<std::string>& text);
};

/// The grader failed to do its own job (as opposed to the submission failing a check)
class InfrastructureError : public GraderError
{
public:
    InfrastructureError(const std::string& msg, std::error_code code)
        : GraderError{ErrorKind::Infrastructure, fmt_message(msg, code)}
        , code_{code} {}

    std::error_code get_code() const noexcept { return code_; }

private:
    static std::string fmt_message(const std::string& msg, std::error_code code);

    std::error_code code_;
};

/// Normalized description of whatever ended a runnable unsuccessfully.
/// The original exception is kept so that consumers can rethrow or inspect it.
struct Failure
{
    ErrorKind kind = ErrorKind::UnknownError;
    std::string message;
    std::optional<std::string> actual;
    std::optional<std::string> expected;
    std::exception_ptr exception;
};

/// Converts any caught exception into a ``Failure``.
/// Values that are not std::exceptions are normalized into ``InvalidExceptionError``.
Failure describe_failure(std::exception_ptr exception);

template <typename Exception>
Failure describe_failure(const Exception& exception) {
    return describe_failure(std::make_exception_ptr(exception));
}

} // namespace grader
