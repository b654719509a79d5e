/// \file
/// Run an external program under output and wall-clock bounds
#pragma once

#include <grader/common/expected.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace grader {

inline constexpr std::size_t DEFAULT_OUTPUT_LIMIT = 64 * 1024;

struct ExecuteOptions
{
    /// Written to the program followed by a newline, after which stdin is closed.
    /// When not given, stdin is closed right away.
    std::optional<std::string> standard_input;

    std::size_t standard_output_limit = DEFAULT_OUTPUT_LIMIT;
    std::size_t standard_error_limit = DEFAULT_OUTPUT_LIMIT;

    /// No deadline if not given
    std::optional<std::chrono::milliseconds> timeout;
};

/// Why an execution ended
enum class ExecutionReason { Success, StandardOutputExceeded, StandardErrorExceeded, TimedOut };

constexpr std::string_view format_as(ExecutionReason reason) {
    switch (reason) {
    case ExecutionReason::Success:
        return "success";
    case ExecutionReason::StandardOutputExceeded:
        return "standard_output_exceeded";
    case ExecutionReason::StandardErrorExceeded:
        return "standard_error_exceeded";
    case ExecutionReason::TimedOut:
        return "timed_out";
    }

    return "<unknown>";
}

struct ExecutionResult
{
    /// Set if the program exited on its own
    std::optional<int> exit_code;
    /// Set if the program was terminated by a signal, e.g. "SIGKILL"
    std::optional<std::string> termination_signal;

    /// Captured output, truncated to the configured limits
    std::string standard_output;
    std::string standard_error;

    ExecutionReason reason = ExecutionReason::Success;

    bool operator==(const ExecutionResult&) const = default;
};

/// Runs ``executable`` (looked up in PATH if it has no slash) with ``arguments`` and waits for it.
///
/// The program is SIGKILLed, together with its process group, as soon as either output exceeds
/// its limit or the timeout elapses. Such outcomes, like a non-zero exit, are reported through
/// ``ExecutionResult::reason``.
///
/// Returns an error only if the program could not be run at all (e.g., not found, not executable,
/// or a resource limit was hit while setting up).
Expected<ExecutionResult> execute(const std::string& executable, const std::vector<std::string>& arguments,
                                  const ExecuteOptions& options = {});

/// ``execute`` on another thread. Invocations share no state, so any number may run concurrently.
std::future<Expected<ExecutionResult>> execute_async(std::string executable, std::vector<std::string> arguments,
                                                     ExecuteOptions options = {});

} // namespace grader
