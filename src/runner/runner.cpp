#include <grader/runner/runner.hpp>

#include <grader/core/completion.hpp>
#include <grader/core/context.hpp>
#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/runner/events.hpp>
#include <grader/runner/selection.hpp>
#include <grader/runner/stats.hpp>

#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace grader {

namespace {

/// Suites from the root down to ``suite``
std::vector<Suite*> ancestry(Suite& suite) {
    std::vector<Suite*> chain;

    for (Suite* current = &suite; current != nullptr; current = current->get_parent()) {
        chain.push_back(current);
    }

    std::reverse(chain.begin(), chain.end());

    return chain;
}

void record(Runnable& runnable, const auto& attempt) {
    runnable.set_state(attempt.state);
    runnable.set_duration(attempt.duration);
    runnable.set_failure(attempt.failure);
}

} // namespace

Runner::Runner(RunOptions options)
    : options_{std::move(options)}
    , stats_collector_{bus_} {}

Runner::~Runner() = default;

Stats Runner::run(Suite& root) {
    RunnerState expected = RunnerState::Idle;

    if (!state_.compare_exchange_strong(expected, RunnerState::Running)) {
        if (expected == RunnerState::Disposed) {
            throw RunnerStateError{ErrorKind::InstanceAlreadyDisposed, "This runner has been disposed"};
        }
        throw RunnerStateError{ErrorKind::InstanceAlreadyRunning, "This runner is already running"};
    }

    LOG_DEBUG("Runner state: {} -> {}", RunnerState::Idle, RunnerState::Running);

    auto cleanup = gsl::finally([this] { clean_references(); });

    aborted_ = false;

    if (options_.timeout) {
        root.set_timeout(*options_.timeout);
    }
    if (options_.slow) {
        root.set_slow(*options_.slow);
    }
    if (options_.retries) {
        root.set_retries(*options_.retries);
    }

    root.reset();

    // Configuration errors surface here, before anything is emitted
    selection_ = select_tests(root, options_);

    Stats initial;
    initial.total = selection_.num_tests();

    emit({.kind = EventKind::RunBegin, .stats = &initial});

    run_suite(root);
    report_extra_completions();

    emit({.kind = EventKind::RunEnd, .stats = &stats_collector_.get_stats()});

    if (std::exception_ptr infrastructure_error = infrastructure_error_) {
        LOG_DEBUG("Rethrowing infrastructure error after wind-down");
        std::rethrow_exception(infrastructure_error);
    }

    return stats_collector_.get_stats();
}

void Runner::dispose() {
    RunnerState expected = RunnerState::Idle;

    if (state_.compare_exchange_strong(expected, RunnerState::Disposed) || expected == RunnerState::Disposed) {
        LOG_DEBUG("Runner disposed");
        return;
    }

    throw RunnerStateError{ErrorKind::InstanceAlreadyRunning, "Cannot dispose of a running runner"};
}

void Runner::clean_references() noexcept {
    for (auto& [runnable, completion] : settled_completions_) {
        std::ignore = completion->abandon();
    }
    settled_completions_.clear();

    // May block on bodies that are still running
    parked_futures_.clear();

    selection_ = Selection{};
    skipped_suites_.clear();
    infrastructure_error_ = nullptr;

    state_ = RunnerState::ReferencesCleaned;

    const RunnerState next = options_.reusable ? RunnerState::Idle : RunnerState::Disposed;
    LOG_DEBUG("Runner state: {} -> {}", RunnerState::ReferencesCleaned, next);

    state_ = next;
}

void Runner::run_suite(Suite& suite) {
    if (!suite.is_root() && !selection_.contains(suite)) {
        LOG_TRACE("Suite {:?} has no selected tests", suite.get_full_title());
        return;
    }

    emit({.kind = EventKind::SuiteBegin, .suite = &suite});

    const bool runs_hooks = selection_.contains(suite) && !suite.is_pending() && !is_skipped(suite);
    bool setup_ok = true;

    if (runs_hooks) {
        auto [hook, attempt] = run_hooks(suite, HookPhase::BeforeAll, nullptr);
        report_extra_completions();

        if (hook != nullptr && attempt.state == RunnableState::Pending) {
            LOG_DEBUG("Suite {:?} skipped from {}", suite.get_full_title(), hook->get_title());
            skipped_suites_.insert(&suite);
        } else if (hook != nullptr) {
            setup_ok = false;
            emit({.kind = EventKind::HookFailed, .suite = &suite, .hook = hook, .failure = &*attempt.failure});

            if (options_.bail) {
                aborted_ = true;
            }
        }
    }

    if (setup_ok) {
        for (const auto& test : suite.get_tests()) {
            if (aborted_) {
                break;
            }
            if (selection_.contains(*test)) {
                run_test(*test);
            }
        }

        for (const auto& child : suite.get_children()) {
            if (aborted_) {
                break;
            }
            run_suite(*child);
        }
    }

    if (runs_hooks) {
        run_cleanup_hooks(suite, HookPhase::AfterAll, nullptr);
        report_extra_completions();
    }

    emit({.kind = EventKind::SuiteEnd, .suite = &suite});
}

void Runner::run_test(Test& test) {
    Suite& suite = test.get_suite();

    if (test.is_pending() || is_skipped(suite)) {
        if (options_.forbid_pending && !test.is_pending()) {
            // Skipped at runtime by a "before all" hook
            test.set_state(RunnableState::Failed);
            test.set_failure(describe_failure(PendingForbiddenError{"Pending test forbidden"}));
        } else {
            test.set_state(RunnableState::Pending);
        }

        emit({.kind = EventKind::TestEnd,
              .suite = &suite,
              .test = &test,
              .failure = test.get_failure() ? &*test.get_failure() : nullptr});
        return;
    }

    emit({.kind = EventKind::TestBegin, .suite = &suite, .test = &test});

    const std::vector<Suite*> chain = ancestry(suite);
    const Hook* failing_hook = nullptr;
    Attempt attempt;

    while (true) {
        failing_hook = nullptr;
        attempt = run_test_attempt(test, chain, failing_hook);
        report_extra_completions();

        const bool retryable = attempt.state == RunnableState::Failed && failing_hook == nullptr;

        if (!retryable || test.get_current_retry() >= test.get_retries() || aborted_) {
            break;
        }

        LOG_DEBUG("Retrying {:?} ({} of {})", test.get_full_title(), test.get_current_retry() + 1, test.get_retries());

        emit({.kind = EventKind::TestRetry, .suite = &suite, .test = &test, .failure = &*attempt.failure});

        test.set_current_retry(test.get_current_retry() + 1);
    }

    if (attempt.state == RunnableState::Pending && options_.forbid_pending) {
        attempt.state = RunnableState::Failed;
        attempt.failure = describe_failure(PendingForbiddenError{"Pending test forbidden"});
    }

    record(test, attempt);

    emit({.kind = EventKind::TestEnd,
          .suite = &suite,
          .test = &test,
          .hook = failing_hook,
          .failure = test.get_failure() ? &*test.get_failure() : nullptr});

    if (attempt.state == RunnableState::Failed && options_.bail) {
        LOG_DEBUG("Bailing after failure of {:?}", test.get_full_title());
        aborted_ = true;
    }
}

Runner::Attempt Runner::run_test_attempt(Test& test, const std::vector<Suite*>& chain, const Hook*& failing_hook) {
    Attempt result;
    std::size_t levels_entered = 0;
    bool hooks_ok = true;

    for (Suite* level : chain) {
        ++levels_entered;

        auto [hook, hook_attempt] = run_hooks(*level, HookPhase::BeforeEach, &test);

        if (hook == nullptr) {
            continue;
        }

        hooks_ok = false;

        if (hook_attempt.state == RunnableState::Pending) {
            result.state = RunnableState::Pending;
        } else {
            failing_hook = hook;
            result.state = RunnableState::Failed;
            result.failure = std::move(hook_attempt.failure);
        }
        break;
    }

    if (hooks_ok) {
        result = run_runnable(test, &test);
    }

    // From the innermost level entered back out to the root
    for (std::size_t level = levels_entered; level-- > 0;) {
        run_cleanup_hooks(*chain[level], HookPhase::AfterEach, &test);
    }

    return result;
}

std::pair<const Hook*, Runner::Attempt> Runner::run_hooks(Suite& suite, HookPhase phase, Test* current_test) {
    for (const auto& hook : suite.get_hooks(phase)) {
        Attempt attempt = run_runnable(*hook, current_test);
        record(*hook, attempt);

        if (attempt.state != RunnableState::Passed) {
            return {hook.get(), std::move(attempt)};
        }
    }

    return {nullptr, Attempt{}};
}

void Runner::run_cleanup_hooks(Suite& suite, HookPhase phase, Test* current_test) {
    for (const auto& hook : suite.get_hooks(phase)) {
        Attempt attempt = run_runnable(*hook, current_test);
        record(*hook, attempt);

        if (attempt.state != RunnableState::Failed) {
            continue;
        }

        emit({.kind = EventKind::HookFailed,
              .suite = &suite,
              .test = current_test,
              .hook = hook.get(),
              .failure = &*hook->get_failure()});

        if (options_.bail) {
            aborted_ = true;
        }
    }
}

Runner::Attempt Runner::run_runnable(Runnable& runnable, Test* current_test) {
    using std::chrono::steady_clock;

    DEBUG_ASSERT(runnable.get_body().has_value(), "Pending runnables are never run");

    auto completion = std::make_shared<Completion>(runnable.get_full_title());
    Context context{runnable, current_test, this};

    const Body& body = *runnable.get_body();
    std::optional<std::future<void>> future;
    bool skipped = false;
    bool timed_out = false;

    LOG_TRACE("Running {:?}", runnable.get_full_title());

    const auto start = steady_clock::now();

    try {
        if (const auto* sync = std::get_if<SyncBody>(&body)) {
            (*sync)(context);
            completion->complete();
        } else if (const auto* callback = std::get_if<CallbackBody>(&body)) {
            (*callback)(context, Done{completion});
        } else {
            future = std::get<AsyncBody>(body)(context);
        }
    } catch (const PendingSignal&) {
        skipped = true;
    } catch (...) {
        // Recorded as the outcome of this attempt
        completion->complete(std::current_exception());
    }

    // Read after the synchronous part, so that the body may adjust its own timeout
    const auto timeout = runnable.get_timeout();
    const bool has_deadline = is_timeout_enabled(timeout);
    const auto deadline = start + timeout;

    if (!skipped && !completion->is_complete() && future) {
        if (!future->valid()) {
            completion->complete();
        } else if (!has_deadline || future->wait_until(deadline) != std::future_status::timeout) {
            try {
                future->get();
                completion->complete();
            } catch (const PendingSignal&) {
                skipped = true;
            } catch (...) {
                completion->complete(std::current_exception());
            }
        } else {
            timed_out = completion->abandon();
            parked_futures_.push_back(std::move(*future));
        }
    } else if (!skipped && !completion->is_complete()) {
        if (has_deadline) {
            timed_out = !completion->wait_until(deadline) && completion->abandon();
        } else {
            completion->wait();
        }
    }

    if (skipped) {
        std::ignore = completion->abandon();
    }

    Attempt attempt;
    attempt.duration = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start);

    if (skipped) {
        attempt.state = RunnableState::Pending;
    } else if (timed_out) {
        attempt.state = RunnableState::Failed;
        attempt.failure = describe_failure(TimeoutError{timeout});
    } else if (std::exception_ptr error = completion->get_error()) {
        attempt.state = RunnableState::Failed;
        attempt.failure = describe_failure(error);
    } else if (has_deadline && attempt.duration > timeout) {
        // Synchronous bodies can't be interrupted, so the overrun is only noticed afterwards
        attempt.state = RunnableState::Failed;
        attempt.failure = describe_failure(TimeoutError{timeout});
    } else {
        attempt.state = RunnableState::Passed;
    }

    settled_completions_.emplace_back(&runnable, std::move(completion));

    if (attempt.failure) {
        note_failure(*attempt.failure);
    }

    LOG_TRACE("{:?} finished as {} in {}", runnable.get_full_title(), attempt.state, attempt.duration);

    return attempt;
}

void Runner::note_failure(const Failure& failure) {
    if (failure.kind != ErrorKind::Infrastructure || infrastructure_error_) {
        return;
    }

    LOG_ERROR("Infrastructure failure, aborting run: {}", failure.message);

    infrastructure_error_ = failure.exception;
    aborted_ = true;
}

void Runner::report_extra_completions() {
    for (auto& [runnable, completion] : settled_completions_) {
        for (const Failure& failure : completion->take_extra_completions()) {
            LOG_WARN("{}", failure.message);

            Event event{.kind = EventKind::RunnableError, .suite = runnable->get_parent(), .failure = &failure};

            if (runnable->get_type() == RunnableType::Hook) {
                event.hook = static_cast<const Hook*>(runnable);
            } else {
                event.test = static_cast<const Test*>(runnable);
            }

            emit(event);
        }
    }
}

bool Runner::is_skipped(const Suite& suite) const {
    for (const Suite* current = &suite; current != nullptr; current = current->get_parent()) {
        if (skipped_suites_.contains(current)) {
            return true;
        }
    }

    return false;
}

} // namespace grader
