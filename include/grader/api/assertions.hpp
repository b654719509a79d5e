/// \file
/// Checks for use inside test bodies. Each raises ``AssertionError`` when it does not hold.
#pragma once

#include <grader/exceptions.hpp>
#include <grader/sandbox/execute.hpp>

#include <boost/type_index.hpp>
#include <fmt/base.h>
#include <fmt/format.h>

#include <chrono>
#include <compare>
#include <concepts>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace grader::assertions {

namespace detail {

inline std::string stringize(const std::convertible_to<std::string_view> auto& val) {
    return fmt::format("{:?}", std::string_view{val});
}

template <typename T>
std::string stringize(const T& val) {
    if constexpr (fmt::formattable<T>) {
        return fmt::format("{}", val);
    } else {
        return fmt::format("<{}>", boost::typeindex::type_id<T>().pretty_name());
    }
}

template <typename Actual, typename Expected>
[[noreturn]] void raise(const std::string& message, const Actual& actual, const Expected& expected) {
    throw AssertionError{message, stringize(actual), stringize(expected)};
}

} // namespace detail

void ok(bool condition, const std::string& message = "expected condition to hold");

[[noreturn]] void fail(const std::string& message = "failure");

template <typename Actual, typename Expected>
[[noreturn]] void fail(const Actual& actual, const Expected& expected, const std::string& message = "failure") {
    detail::raise(message, actual, expected);
}

template <typename Actual, typename Expected>
void equal(const Actual& actual, const Expected& expected,
           const std::string& message = "expected values to be equal") {
    if (!(actual == expected)) {
        detail::raise(message, actual, expected);
    }
}

template <typename Actual, typename Expected>
void not_equal(const Actual& actual, const Expected& expected,
               const std::string& message = "expected values to differ") {
    if (actual == expected) {
        detail::raise(message, actual, expected);
    }
}

/// actual > bound
template <typename Actual, typename Bound>
void above(const Actual& actual, const Bound& bound, const std::string& message = "expected value to be above bound") {
    if (!(actual > bound)) {
        detail::raise(message, actual, bound);
    }
}

/// actual >= bound
template <typename Actual, typename Bound>
void at_least(const Actual& actual, const Bound& bound,
              const std::string& message = "expected value to be at least bound") {
    if (!(actual >= bound)) {
        detail::raise(message, actual, bound);
    }
}

/// actual < bound
template <typename Actual, typename Bound>
void below(const Actual& actual, const Bound& bound, const std::string& message = "expected value to be below bound") {
    if (!(actual < bound)) {
        detail::raise(message, actual, bound);
    }
}

/// actual <= bound
template <typename Actual, typename Bound>
void at_most(const Actual& actual, const Bound& bound,
             const std::string& message = "expected value to be at most bound") {
    if (!(actual <= bound)) {
        detail::raise(message, actual, bound);
    }
}

void file_exists(const std::filesystem::path& path, const std::string& message);

/// What a program is expected to do for a given input
struct OutputExpectation
{
    std::string executable;
    std::vector<std::string> arguments;

    std::optional<std::string> input;

    std::string expected_output;
    std::string expected_error;
    /// Not checked if not given
    std::optional<int> expected_exit_code;

    std::optional<std::chrono::milliseconds> timeout;
};

/// Run the program described by ``expectation`` in the sandbox and compare what it did.
/// Returns the execution for further checks.
///
/// Raises ``InfrastructureError`` if the program could not be run at all.
ExecutionResult output(const OutputExpectation& expectation, const std::string& message);

struct Version
{
    int major = 0;
    int minor = 0;
    int patch = 0;

    auto operator<=>(const Version&) const = default;
};

inline std::string format_as(const Version& version) {
    return fmt::format("{}.{}.{}", version.major, version.minor, version.patch);
}

/// The first ``major.minor[.patch]`` in ``text``, e.g. "v18.19.1" -> 18.19.1
/// std::nullopt if there is none, or if a component doesn't fit in an int
std::optional<Version> parse_version(std::string_view text);

/// ``range`` is a comparison (``>=``, ``>``, ``<=``, ``<``, ``=``, or none for equality) followed by a
/// version, e.g. ">=10.0". Throws std::invalid_argument if ``range`` is malformed.
bool satisfies(const Version& version, std::string_view range);

/// Runs ``tool --version`` and checks the reported version against ``range``.
/// A tool that can't be run fails the check rather than the grader.
Version tool_version(const std::string& tool, std::string_view range, const std::string& message);

} // namespace grader::assertions
