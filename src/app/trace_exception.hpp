#pragma once

#include <grader/exceptions.hpp>
#include <grader/logging.hpp>

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <concepts>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace grader {

/// Log the exception currently being handled, with the stack at the point it was thrown.
/// Must be called from within a catch block.
inline void trace_current_exception() {
    const Failure failure = describe_failure(std::current_exception());
    const boost::stacktrace::stacktrace trace = boost::stacktrace::stacktrace::from_current_exception();

    LOG_FATAL("Unhandled {}: {}", failure.kind, failure.message);

    std::string stacktrace_str = fmt::to_string(fmt::streamed(trace));
    LOG_FATAL("Thrown from:\n{}", stacktrace_str.empty() ? " <unavailable>" : stacktrace_str);
}

/// Invoke ``fn``. An escaping exception is traced and turned into an empty result.
template <typename Func, typename... Args>
    requires(std::invocable<Func, Args...>)
std::optional<std::invoke_result_t<Func, Args...>> wrap_throwable_fn(Func&& fn, Args&&... args) {
    try {
        return std::invoke(std::forward<Func>(fn), std::forward<Args>(args)...);
    } catch (...) {
        trace_current_exception();
    }

    return std::nullopt;
}

} // namespace grader
