#include "app/grader_app.hpp"

#include "common/terminal_checks.hpp"
#include "multi_submission_runner.hpp"
#include "output/sink.hpp"
#include "user/program_options.hpp"

#include <grader/api/exercise.hpp>
#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/registrars/exercise_registrar.hpp>

#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace grader {

int GraderApp::run_impl() {
    if (OPTS.list) {
        return list_exercises();
    }

    auto exercise = ExerciseRegistrar::get().find(OPTS.exercise);

    if (!exercise) {
        fmt::println(stderr, "Unknown exercise {:?}. Use --list to see the registered exercises.", OPTS.exercise);
        return CONFIGURATION_ERROR_EXIT_CODE;
    }

    const std::vector<Submission> submissions = OPTS.submissions                                 //
                                                | ranges::views::transform(&Submission::parse) //
                                                | ranges::to<std::vector>();

    MultiSubmissionRunner runner{exercise->get(), OPTS.to_run_options(), should_colorize(), OPTS.jobs};
    std::vector<SubmissionResult> results;

    try {
        results = runner.run_all(submissions);
    } catch (const GraderError& err) {
        switch (err.get_kind()) {
        case ErrorKind::ExclusivityForbidden:
        case ErrorKind::PendingForbidden:
        case ErrorKind::InvalidFilter:
            fmt::println(stderr, "{}", styled(fmt::format("{}: {}", err.get_kind(), err.what()), fg(fmt::color::red)));
            return CONFIGURATION_ERROR_EXIT_CODE;
        default:
            throw;
        }
    }

    FileSink output_sink{stdout};
    for (const SubmissionResult& result : results) {
        output_sink.write(result.report);
    }
    output_sink.flush();

    auto num_failed = ranges::count_if(results, [](const SubmissionResult& result) { return !result.all_passed(); });

    LOG_DEBUG("{} of {} submissions failed", num_failed, results.size());

    return static_cast<int>(std::min<long>(num_failed, MAX_FAILED_EXIT_CODE));
}

int GraderApp::list_exercises() const {
    FileSink output_sink{stdout};

    for (const Exercise& exercise : ExerciseRegistrar::get().get_exercises()) {
        output_sink.write(fmt::format("{:<24} {}\n", exercise.get_handle(), exercise.get_title()));
    }
    output_sink.flush();

    return 0;
}

bool GraderApp::should_colorize() const {
    using enum ProgramOptions::ColorizeOpt;

    if (OPTS.colorize_option == Never) {
        return false;
    }
    if (OPTS.colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

} // namespace grader
