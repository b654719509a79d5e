#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace grader {

/// Tally of one run
struct Stats
{
    /// Suites entered, the root excluded
    std::size_t suites = 0;
    /// Tests that reached a final state
    std::size_t tests = 0;
    std::size_t passes = 0;
    std::size_t pending = 0;
    /// Failed tests. Failing hooks are counted separately in ``hook_failures``.
    std::size_t failures = 0;
    std::size_t hook_failures = 0;
    /// Tests selected to run when the run began
    std::size_t total = 0;

    std::optional<std::chrono::system_clock::time_point> start;
    std::optional<std::chrono::system_clock::time_point> end;
    std::chrono::milliseconds duration{0};

    bool operator==(const Stats&) const = default;
};

} // namespace grader
