#include <grader/api/assertions.hpp>

#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/sandbox/execute.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <filesystem>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace grader::assertions {

void ok(bool condition, const std::string& message) {
    if (!condition) {
        throw AssertionError{message, "false", "true"};
    }
}

void fail(const std::string& message) {
    throw AssertionError{message};
}

void file_exists(const std::filesystem::path& path, const std::string& message) {
    std::error_code err;

    if (!std::filesystem::exists(path, err)) {
        LOG_DEBUG("{} does not exist ({})", path.string(), err ? err.message() : "no such file");
        throw AssertionError{message, std::nullopt, detail::stringize(path.string())};
    }
}

ExecutionResult output(const OutputExpectation& expectation, const std::string& message) {
    ExecuteOptions options;
    options.standard_input = expectation.input;
    options.timeout = expectation.timeout;

    auto res = execute(expectation.executable, expectation.arguments, options);

    if (!res) {
        throw InfrastructureError{fmt::format("Could not run {:?}", expectation.executable), res.error()};
    }

    ExecutionResult execution = std::move(res).value();

    if (execution.reason != ExecutionReason::Success) {
        throw AssertionError{fmt::format("{} (the program was stopped: {})", message, execution.reason)};
    }

    if (execution.standard_output != expectation.expected_output) {
        detail::raise(fmt::format("{} (standard output differs)", message), execution.standard_output,
                      expectation.expected_output);
    }

    if (execution.standard_error != expectation.expected_error) {
        detail::raise(fmt::format("{} (standard error differs)", message), execution.standard_error,
                      expectation.expected_error);
    }

    if (expectation.expected_exit_code && execution.exit_code != expectation.expected_exit_code) {
        std::string actual = execution.exit_code ? fmt::format("{}", *execution.exit_code)
                                                 : execution.termination_signal.value_or("<none>");
        throw AssertionError{fmt::format("{} (exit code differs)", message), std::move(actual),
                             fmt::format("{}", *expectation.expected_exit_code)};
    }

    return execution;
}

namespace {

/// Digits of a version component. Components too large for an int are not a version.
std::optional<int> parse_component(const std::ssub_match& digits) {
    int value{};
    const std::string text = digits.str();
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);

    if (res.ec != std::errc{}) {
        LOG_DEBUG("Version component {:?} is unreadable: {}", text, std::make_error_code(res.ec).message());
        return std::nullopt;
    }

    return value;
}

} // namespace

std::optional<Version> parse_version(std::string_view text) {
    static const std::regex version_regex{R"((\d+)\.(\d+)(?:\.(\d+))?)"};

    const std::string haystack{text};
    std::smatch match;

    if (!std::regex_search(haystack, match, version_regex)) {
        return std::nullopt;
    }

    auto major = parse_component(match[1]);
    auto minor = parse_component(match[2]);
    auto patch = match[3].matched ? parse_component(match[3]) : std::optional<int>{0};

    if (!major || !minor || !patch) {
        return std::nullopt;
    }

    return Version{.major = *major, .minor = *minor, .patch = *patch};
}

bool satisfies(const Version& version, std::string_view range) {
    while (!range.empty() && range.front() == ' ') {
        range.remove_prefix(1);
    }

    std::string_view op = "=";
    for (std::string_view candidate : {">=", "<=", ">", "<", "="}) {
        if (range.starts_with(candidate)) {
            op = candidate;
            range.remove_prefix(candidate.size());
            break;
        }
    }

    auto bound = parse_version(range);
    if (!bound) {
        throw std::invalid_argument{fmt::format("Malformed version range {:?}", range)};
    }

    if (op == ">=") {
        return version >= *bound;
    }
    if (op == "<=") {
        return version <= *bound;
    }
    if (op == ">") {
        return version > *bound;
    }
    if (op == "<") {
        return version < *bound;
    }
    return version == *bound;
}

Version tool_version(const std::string& tool, std::string_view range, const std::string& message) {
    using namespace std::chrono_literals;

    ExecuteOptions options;
    options.timeout = 10s;

    auto res = execute(tool, {"--version"}, options);

    if (!res) {
        throw AssertionError{fmt::format("{} (could not run {:?}: {})", message, tool, res.error().message()),
                             std::nullopt, std::string{range}};
    }

    const ExecutionResult& execution = res.value();

    auto version = parse_version(execution.standard_output);
    if (!version) {
        version = parse_version(execution.standard_error);
    }

    if (!version) {
        throw AssertionError{fmt::format("{} (no version reported by {:?})", message, tool),
                             detail::stringize(execution.standard_output), std::string{range}};
    }

    if (!satisfies(*version, range)) {
        throw AssertionError{message, format_as(*version), std::string{range}};
    }

    return *version;
}

} // namespace grader::assertions
