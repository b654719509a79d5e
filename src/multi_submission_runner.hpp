#pragma once

#include <grader/api/exercise.hpp>
#include <grader/runner/run_options.hpp>
#include <grader/runner/stats.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace grader {

struct SubmissionResult
{
    Submission submission;
    Stats stats;

    /// Rendered report of the run
    std::string report;

    /// Set if grading stopped because the grader itself failed
    std::optional<std::string> infrastructure_error;

    bool all_passed() const { return !infrastructure_error && stats.failures == 0 && stats.hook_failures == 0; }
};

/// Grades several submissions of one exercise, each with a fresh tree and runner.
/// Up to ``jobs`` submissions are graded at once; results keep the order of the submissions.
class MultiSubmissionRunner
{
public:
    MultiSubmissionRunner(const Exercise& exercise, RunOptions options, bool colorize, std::size_t jobs);

    /// Configuration errors (e.g. a forbidden ``only``) are the same for every submission
    /// and are thrown from here.
    std::vector<SubmissionResult> run_all(const std::vector<Submission>& submissions) const;

    SubmissionResult run_one(const Submission& submission) const;

private:
    const Exercise* exercise_;
    RunOptions options_;
    bool colorize_;
    std::size_t jobs_;
};

} // namespace grader
