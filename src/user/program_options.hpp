#pragma once

#include <grader/common/expected.hpp>
#include <grader/registrars/exercise_registrar.hpp>
#include <grader/runner/run_options.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace grader {

struct ProgramOptions
{

    // ###### Argument fields

    /// Handle of the exercise to grade, e.g. "basics/factorial"
    std::string exercise;

    /// One command line per submission, e.g. "./a.out" or "python3 hello.py"
    std::vector<std::string> submissions;

    /// Only run tests whose full title matches this ECMAScript regex
    std::optional<std::string> grep;
    bool invert = false;

    bool bail = false;
    bool forbid_only = false;
    bool forbid_pending = false;

    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> slow;
    std::optional<int> retries;

    /// Number of submissions graded concurrently
    std::size_t jobs = DEFAULT_JOBS;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Print the registered exercises and exit
    bool list = false;

    // ###### Argument defaults

    static constexpr std::size_t DEFAULT_JOBS = 1;

    /// The options handed to each runner
    RunOptions to_run_options() const {
        return RunOptions{.grep = grep,
                          .invert = invert,
                          .bail = bail,
                          .forbid_only = forbid_only,
                          .forbid_pending = forbid_pending,
                          .timeout = timeout,
                          .slow = slow,
                          .retries = retries};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (list) {
            return {};
        }

        if (jobs == 0) {
            return std::string{"The number of jobs must be at least 1"};
        }

        if (exercise.empty()) {
            return std::string{"No exercise specified"};
        }

        // The CLI should verify that the specified exercise is valid
        // We'll check here just in case and return an error if it's not
        if (!ExerciseRegistrar::get().find(exercise)) {
            return fmt::format("Unknown exercise {:?}", exercise);
        }

        if (submissions.empty()) {
            return std::string{"No submission specified"};
        }

        return {};
    }
};

constexpr std::string_view format_as(ProgramOptions::ColorizeOpt opt) {
    switch (opt) {
    case ProgramOptions::ColorizeOpt::Auto:
        return "auto";
    case ProgramOptions::ColorizeOpt::Always:
        return "always";
    case ProgramOptions::ColorizeOpt::Never:
        return "never";
    }

    return "<unknown>";
}

inline std::string format_as(const ProgramOptions& opts) {
    return fmt::format("{{exercise={:?}, submissions={}, grep={}, invert={}, bail={}, forbid_only={}, "
                       "forbid_pending={}, timeout={}, slow={}, retries={}, jobs={}, color={}, list={}}}",
                       opts.exercise, opts.submissions, opts.grep, opts.invert, opts.bail, opts.forbid_only,
                       opts.forbid_pending, opts.timeout, opts.slow, opts.retries, opts.jobs, opts.colorize_option,
                       opts.list);
}

} // namespace grader
