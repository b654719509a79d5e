#pragma once

#include <grader/common/class_traits.hpp>
#include <grader/core/completion.hpp>
#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/runner/event_bus.hpp>
#include <grader/runner/run_options.hpp>
#include <grader/runner/selection.hpp>
#include <grader/runner/stats.hpp>
#include <grader/runner/stats_collector.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace grader {

/// Lifecycle of a runner instance.
/// Idle -> Running -> ReferencesCleaned -> Idle (reusable) or Disposed (terminal).
enum class RunnerState { Idle, Running, ReferencesCleaned, Disposed };

constexpr std::string_view format_as(RunnerState state) {
    switch (state) {
    case RunnerState::Idle:
        return "idle";
    case RunnerState::Running:
        return "running";
    case RunnerState::ReferencesCleaned:
        return "referencesCleaned";
    case RunnerState::Disposed:
        return "disposed";
    }

    return "<unknown>";
}

/// Executes a suite tree depth-first in declaration order and reports every step on its event bus.
///
/// One runnable executes at a time, on the thread that called ``run``. Test and hook failures are
/// reported as events and never escape ``run``. Only configuration errors (thrown before
/// anything runs), misuse of the runner, and infrastructure errors (rethrown after the run
/// has been wound down and ``RunEnd`` emitted) leave ``run`` as exceptions.
class Runner : NonMovable
{
public:
    explicit Runner(RunOptions options = {});
    ~Runner();

    EventBus& get_event_bus() { return bus_; }

    const RunOptions& get_options() const { return options_; }

    RunnerState get_state() const { return state_; }

    /// Stats of the latest (or current) run
    const Stats& get_stats() const { return stats_collector_.get_stats(); }

    /// Run every selected test of the tree rooted at ``root``.
    /// The tree is reset first, so the same tree may be run again.
    Stats run(Suite& root);

    /// Stop the current run as soon as possible. Suites already entered still run their
    /// "after all" hooks. May be called from any thread.
    void abort() { aborted_ = true; }

    bool is_aborted() const { return aborted_; }

    /// Refuse any further run
    void dispose();

private:
    /// Result of running one body once
    struct Attempt
    {
        RunnableState state = RunnableState::Unset;
        std::optional<Failure> failure;
        std::chrono::milliseconds duration{0};
    };

    void run_suite(Suite& suite);
    void run_test(Test& test);

    /// Run the "before each" chain, the body and the "after each" chain once
    Attempt run_test_attempt(Test& test, const std::vector<Suite*>& chain, const Hook*& failing_hook);

    /// Run every hook of ``phase`` declared by ``suite``, stopping at the first that does not pass.
    /// Returns that hook along with its attempt, or nullptr if all passed.
    std::pair<const Hook*, Attempt> run_hooks(Suite& suite, HookPhase phase, Test* current_test);

    /// Run the after-hooks of ``phase``. Every hook runs; failures are reported.
    void run_cleanup_hooks(Suite& suite, HookPhase phase, Test* current_test);

    Attempt run_runnable(Runnable& runnable, Test* current_test);

    /// Report completions that arrived after their attempt had settled
    void report_extra_completions();

    void note_failure(const Failure& failure);

    bool is_skipped(const Suite& suite) const;

    void emit(const Event& event) const { bus_.emit(event); }

    void clean_references() noexcept;

    RunOptions options_;
    EventBus bus_;
    StatsCollector stats_collector_;

    std::atomic<RunnerState> state_ = RunnerState::Idle;
    std::atomic<bool> aborted_ = false;

    // Per-run state. Cleared by clean_references()
    Selection selection_;
    std::unordered_set<const Suite*> skipped_suites_;
    std::exception_ptr infrastructure_error_;
    std::vector<std::pair<const Runnable*, std::shared_ptr<Completion>>> settled_completions_;
    /// Futures of async bodies that timed out. Their destructors may block, so they are only
    /// released once the run is over.
    std::vector<std::future<void>> parked_futures_;
};

} // namespace grader
