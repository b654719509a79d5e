#include "multi_submission_runner.hpp"

#include "output/sink.hpp"
#include "output/spec_reporter.hpp"

#include <grader/api/exercise.hpp>
#include <grader/core/suite.hpp>
#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/runner/runner.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <future>
#include <memory>
#include <utility>
#include <vector>

namespace grader {

MultiSubmissionRunner::MultiSubmissionRunner(const Exercise& exercise, RunOptions options, bool colorize,
                                             std::size_t jobs)
    : exercise_{&exercise}
    , options_{std::move(options)}
    , colorize_{colorize}
    , jobs_{std::max<std::size_t>(jobs, 1)} {
    // Each runner grades exactly one submission and is disposed afterwards
    options_.reusable = false;
}

std::vector<SubmissionResult> MultiSubmissionRunner::run_all(const std::vector<Submission>& submissions) const {
    std::vector<SubmissionResult> results;
    results.reserve(submissions.size());

    for (std::size_t first = 0; first < submissions.size(); first += jobs_) {
        const std::size_t last = std::min(first + jobs_, submissions.size());

        std::vector<std::future<SubmissionResult>> batch;
        for (std::size_t i = first; i < last; ++i) {
            batch.push_back(std::async(std::launch::async, &MultiSubmissionRunner::run_one, this,
                                       std::cref(submissions[i])));
        }

        for (auto& result : batch) {
            results.push_back(result.get());
        }
    }

    return results;
}

SubmissionResult MultiSubmissionRunner::run_one(const Submission& submission) const {
    SubmissionResult result{.submission = submission, .stats = {}, .report = {}, .infrastructure_error = {}};

    LOG_DEBUG("Grading {:?} against {:?}", submission.to_string(), exercise_->get_handle());

    std::unique_ptr<Suite> root = exercise_->instantiate(submission);

    Runner runner{options_};

    StringSink sink;
    sink.write(fmt::format("Submission: {}\n", submission.to_string()));

    SpecReporter reporter{sink, colorize_};
    reporter.attach(runner.get_event_bus());

    try {
        result.stats = runner.run(*root);
    } catch (const InfrastructureError& err) {
        LOG_ERROR("Grading of {:?} stopped: {}", submission.to_string(), err.what());
        result.stats = runner.get_stats();
        result.infrastructure_error = err.what();
        sink.write(fmt::format("Grading stopped because the grader failed: {}\n", err.what()));
    }

    reporter.detach();
    result.report = sink.take();

    return result;
}

} // namespace grader
