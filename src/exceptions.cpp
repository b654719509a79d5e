#include <grader/exceptions.hpp>

#include <grader/logging.hpp>

#include <boost/core/demangle.hpp>
#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <typeinfo>
#include <utility>

#include <cxxabi.h>

namespace grader {

TimeoutError::TimeoutError(std::chrono::milliseconds limit)
    : GraderError{ErrorKind::Timeout,
                  fmt::format("Timeout of {}ms exceeded. For callback tests and hooks, ensure \"done()\" is called; "
                              "if returning a future, ensure it becomes ready.",
                              limit.count())}
    , limit_{limit} {}

MultipleCompletionError::MultipleCompletionError(const std::string& runnable_title,
                                                 const std::optional<std::string>& reason)
    : GraderError{ErrorKind::MultipleCompletion,
                  reason ? fmt::format("done() called multiple times in {:?}; with error: {}", runnable_title, *reason)
                         : fmt::format("done() called multiple times in {:?}", runnable_title)} {}

InvalidFilterError::InvalidFilterError(const std::string& pattern, const std::string& reason)
    : GraderError{ErrorKind::InvalidFilter, fmt::format("Invalid grep pattern {:?}: {}", pattern, reason)} {}

InvalidExceptionError::InvalidExceptionError(const std::string& type_name, const std::optional<std::string>& text)
    : GraderError{ErrorKind::InvalidException,
                  text ? fmt::format("A value of type `{}` was thrown instead of an exception: {:?}", type_name, *text)
                       : fmt::format("A value of type `{}` was thrown instead of an exception", type_name)} {}

std::string InfrastructureError::fmt_message(const std::string& msg, std::error_code code) {
    return fmt::format("{} ({})", msg, code.message());
}

namespace {

std::string current_exception_type_name() {
    const std::type_info* type = abi::__cxa_current_exception_type();

    if (type == nullptr) {
        return "<unknown>";
    }

    return boost::core::demangle(type->name());
}

Failure from_grader_error(const GraderError& error, std::exception_ptr exception) {
    return Failure{.kind = error.get_kind(),
                   .message = error.what(),
                   .actual = std::nullopt,
                   .expected = std::nullopt,
                   .exception = std::move(exception)};
}

} // namespace

Failure describe_failure(std::exception_ptr exception) {
    if (!exception) {
        return Failure{.kind = ErrorKind::UnknownError, .message = "<no error>"};
    }

    try {
        std::rethrow_exception(exception);
    } catch (const AssertionError& error) {
        Failure failure = from_grader_error(error, exception);
        failure.actual = error.get_actual();
        failure.expected = error.get_expected();
        return failure;
    } catch (const GraderError& error) {
        return from_grader_error(error, exception);
    } catch (const std::exception& error) {
        return Failure{.kind = ErrorKind::UnknownError, .message = error.what(), .exception = exception};
    } catch (const PendingSignal& signal) {
        // Only reaches here if a skip escaped somewhere a skip is meaningless
        return Failure{.kind = ErrorKind::UnknownError, .message = signal.what(), .exception = exception};
    } catch (const char* text) {
        return describe_failure(InvalidExceptionError{"const char*", std::string{text}});
    } catch (const std::string& text) {
        return describe_failure(InvalidExceptionError{"std::string", text});
    } catch (...) {
        std::string type_name = current_exception_type_name();
        LOG_DEBUG("Normalizing thrown value of type {} into an InvalidExceptionError", type_name);
        return describe_failure(InvalidExceptionError{type_name, std::nullopt});
    }
}

} // namespace grader
