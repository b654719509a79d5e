#pragma once

#include <grader/core/runnable.hpp>
#include <grader/core/test.hpp>

#include <chrono>

namespace grader {

class Runner;

/// Handed to every test and hook body while it runs
class Context
{
public:
    Context(Runnable& runnable, Test* current_test, Runner* runner)
        : runnable_{&runnable}
        , current_test_{current_test}
        , runner_{runner} {}

    /// The test or hook being run
    Runnable& get_runnable() const { return *runnable_; }

    /// The test being run, or the test an each-hook is running for.
    /// nullptr inside ``before all`` / ``after all`` hooks.
    Test* get_current_test() const { return current_test_; }

    /// Stop the body here and mark it pending.
    /// Inside a ``before all`` hook the rest of the suite becomes pending, inside a
    /// ``before each`` hook the current test does. Ignored by after-hooks.
    [[noreturn]] void skip() const;

    /// Adjust the deadline of the running body. Takes effect for the remainder of the attempt.
    void timeout(std::chrono::milliseconds timeout) const { runnable_->set_timeout(timeout); }

    std::chrono::milliseconds timeout() const { return runnable_->get_timeout(); }

    void slow(std::chrono::milliseconds slow) const { runnable_->set_slow(slow); }

    void retries(int retries) const { runnable_->set_retries(retries); }

    /// Ask the runner to stop once the current suites have cleaned up
    void abort_run() const;

private:
    Runnable* runnable_;
    Test* current_test_;
    Runner* runner_;
};

} // namespace grader
