#pragma once

#include "app/trace_exception.hpp" // IWYU pragma: export
#include "user/program_options.hpp"

#include <grader/api/exercise.hpp>
#include <grader/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace grader {

/// Grades every submission given on the command line against one exercise.
///
/// Exit status is the number of submissions that did not pass (capped at 254),
/// ``CONFIGURATION_ERROR_EXIT_CODE`` if the run could not be set up, or
/// ``UNEXPECTED_ERROR_EXIT_CODE`` if an exception escaped (it is logged with its stack trace).
class GraderApp : NonCopyable
{
public:
    explicit GraderApp(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&GraderApp::run_impl, this);

        return res.value_or(UNEXPECTED_ERROR_EXIT_CODE);
    }

    const ProgramOptions OPTS;

    static constexpr int CONFIGURATION_ERROR_EXIT_CODE = 2;
    static constexpr int MAX_FAILED_EXIT_CODE = 254;
    static constexpr int UNEXPECTED_ERROR_EXIT_CODE = 255;

private:
    int run_impl();

    int list_exercises() const;

    bool should_colorize() const;
};

} // namespace grader
