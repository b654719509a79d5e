#include "catch2_custom.hpp"

#include "event_recorder.hpp"

#include <grader/api/suite_builder.hpp>
#include <grader/common/error_types.hpp>
#include <grader/core/context.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/runner/events.hpp>
#include <grader/runner/runner.hpp>
#include <grader/runner/stats.hpp>

#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

using namespace grader;

namespace {

/// A body that appends ``entry`` to ``log``
auto logging_body(std::vector<std::string>& log, std::string entry) {
    return [&log, entry = std::move(entry)](Context&) { log.push_back(entry); };
}

auto failing_body(std::string message) {
    return [message = std::move(message)](Context&) { throw AssertionError{message}; };
}

} // namespace

TEST_CASE("Hooks and tests run in order") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;

    builder.before_each(logging_body(log, "root beforeEach"));
    builder.after_each(logging_body(log, "root afterEach"));

    builder.describe("outer", [&](SuiteBuilder& outer) {
        outer.before_all(logging_body(log, "outer beforeAll"));
        outer.before_each(logging_body(log, "outer beforeEach"));
        outer.after_each(logging_body(log, "outer afterEach"));
        outer.after_all(logging_body(log, "outer afterAll"));

        outer.it("first", logging_body(log, "first"));

        outer.describe("inner", [&](SuiteBuilder& inner) {
            inner.before_each(logging_body(log, "inner beforeEach"));
            inner.after_each(logging_body(log, "inner afterEach"));

            inner.it("second", logging_body(log, "second"));
        });
    });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(log == std::vector<std::string>{
                       "outer beforeAll",
                       "root beforeEach",
                       "outer beforeEach",
                       "first",
                       "outer afterEach",
                       "root afterEach",
                       "root beforeEach",
                       "outer beforeEach",
                       "inner beforeEach",
                       "second",
                       "inner afterEach",
                       "outer afterEach",
                       "root afterEach",
                       "outer afterAll",
                   });

    REQUIRE(recorder.get_events() == std::vector<std::string>{
                                         "runBegin",
                                         "suiteBegin",
                                         "suiteBegin outer",
                                         "testBegin outer first",
                                         "testEnd outer first passed",
                                         "suiteBegin outer inner",
                                         "testBegin outer inner second",
                                         "testEnd outer inner second passed",
                                         "suiteEnd outer inner",
                                         "suiteEnd outer",
                                         "suiteEnd",
                                         "runEnd",
                                     });

    REQUIRE(stats.suites == 2);
    REQUIRE(stats.tests == 2);
    REQUIRE(stats.passes == 2);
    REQUIRE(stats.failures == 0);
    REQUIRE(stats.total == 2);
    REQUIRE(stats.start.has_value());
    REQUIRE(stats.end.has_value());
    REQUIRE(*stats.start <= *stats.end);
}

TEST_CASE("Each-hooks know the test they run for") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> seen;

    builder.before_all([&](Context& ctx) { seen.push_back(ctx.get_current_test() == nullptr ? "none" : "?"); });
    builder.before_each([&](Context& ctx) { seen.push_back(ctx.get_current_test()->get_title()); });
    builder.it("t", [&](Context& ctx) { seen.push_back(ctx.get_runnable().get_title()); });

    Runner runner;
    std::ignore = runner.run(*root);

    REQUIRE(seen == std::vector<std::string>{"none", "t", "t"});
}

TEST_CASE("A failing \"before all\" hook is reported once and skips its suite") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;

    builder.describe("broken", [&](SuiteBuilder& suite) {
        suite.before_all(failing_body("setup failed"), "setup");
        suite.after_all(logging_body(log, "cleanup"));
        suite.it("a", logging_body(log, "a"));
        suite.it("b", logging_body(log, "b"));
        suite.describe("child", [&](SuiteBuilder& child) { child.it("c", logging_body(log, "c")); });
    });

    builder.describe("fine", [&](SuiteBuilder& suite) { suite.it("ok", logging_body(log, "ok")); });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(log == std::vector<std::string>{"cleanup", "ok"});

    REQUIRE(recorder.get_events(EventKind::HookFailed) ==
            std::vector<std::string>{"hookFailed broken \"before all\" hook: setup"});
    REQUIRE(recorder.get_events(EventKind::TestEnd) == std::vector<std::string>{"testEnd fine ok passed"});

    REQUIRE(stats.passes == 1);
    REQUIRE(stats.failures == 0);
    REQUIRE(stats.hook_failures == 1);

    const auto failures = recorder.get_failures();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures.front().kind == ErrorKind::Assertion);
    REQUIRE(failures.front().message == "setup failed");
}

TEST_CASE("A failing \"before each\" hook fails only the current test") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;
    int calls = 0;

    builder.describe("suite", [&](SuiteBuilder& suite) {
        suite.before_each([&](Context&) {
            if (calls++ == 0) {
                throw AssertionError{"first setup failed"};
            }
        });
        suite.after_each(logging_body(log, "teardown"));

        suite.it("a", logging_body(log, "a"));
        suite.it("b", logging_body(log, "b"));
    });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(log == std::vector<std::string>{"teardown", "b", "teardown"});
    REQUIRE(recorder.get_events(EventKind::TestEnd) ==
            std::vector<std::string>{"testEnd suite a failed", "testEnd suite b passed"});
    REQUIRE(recorder.get_events(EventKind::HookFailed).empty());

    const Test& a = *root->get_children().front()->get_tests().front();
    REQUIRE(a.get_failure().has_value());
    REQUIRE(a.get_failure()->message == "first setup failed");

    REQUIRE(stats.failures == 1);
    REQUIRE(stats.passes == 1);
}

TEST_CASE("Failing \"after\" hooks are reported without changing the test") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};

    builder.describe("suite", [&](SuiteBuilder& suite) {
        suite.after_each(failing_body("teardown failed"), "teardown");
        suite.after_all(failing_body("cleanup failed"), "cleanup");
        suite.it("t", [](Context&) {});
    });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(recorder.get_events(EventKind::TestEnd) == std::vector<std::string>{"testEnd suite t passed"});
    REQUIRE(recorder.get_events(EventKind::HookFailed) ==
            std::vector<std::string>{"hookFailed suite \"after each\" hook: teardown",
                                     "hookFailed suite \"after all\" hook: cleanup"});
    REQUIRE(stats.passes == 1);
    REQUIRE(stats.hook_failures == 2);
}

TEST_CASE("Bail stops after the first failure but cleans up entered suites") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;

    builder.after_all(logging_body(log, "root cleanup"));

    builder.describe("first", [&](SuiteBuilder& suite) {
        suite.after_all(logging_body(log, "first cleanup"));
        suite.it("fails", failing_body("nope"));
        suite.it("never runs", logging_body(log, "never runs"));
    });

    builder.describe("second", [&](SuiteBuilder& suite) {
        suite.before_all(logging_body(log, "second setup"));
        suite.it("never runs either", logging_body(log, "never runs either"));
    });

    Runner runner{{.bail = true}};
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(log == std::vector<std::string>{"first cleanup", "root cleanup"});
    REQUIRE(recorder.get_events(EventKind::SuiteBegin) == std::vector<std::string>{"suiteBegin", "suiteBegin first"});
    REQUIRE(stats.tests == 1);
    REQUIRE(stats.failures == 1);
    REQUIRE(runner.is_aborted());
}

TEST_CASE("Pending tests") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;

    builder.describe("suite", [&](SuiteBuilder& suite) {
        suite.before_each(logging_body(log, "setup"));

        suite.it("declared without a body");
        suite.it("marked", logging_body(log, "marked")).skip();
        suite
            .it("skips itself",
                [&](Context& ctx) {
                    log.push_back("skips itself");
                    ctx.skip();
                })
            .retries(3);
    });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    // Skipping is terminal, so no retries
    REQUIRE(log == std::vector<std::string>{"setup", "skips itself"});

    REQUIRE(recorder.get_events(EventKind::TestBegin) == std::vector<std::string>{"testBegin suite skips itself"});
    REQUIRE(recorder.get_events(EventKind::TestEnd) ==
            std::vector<std::string>{"testEnd suite declared without a body pending", "testEnd suite marked pending",
                                     "testEnd suite skips itself pending"});

    REQUIRE(stats.pending == 3);
    REQUIRE(stats.failures == 0);
}

TEST_CASE("Skipping from hooks") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;

    builder.describe("skipped suite", [&](SuiteBuilder& suite) {
        suite.before_all([](Context& ctx) { ctx.skip(); });
        suite.after_all(logging_body(log, "cleanup"));
        suite.it("a", logging_body(log, "a"));
        suite.describe("child", [&](SuiteBuilder& child) { child.it("b", logging_body(log, "b")); });
    });

    builder.describe("skipped test", [&](SuiteBuilder& suite) {
        suite.before_each([](Context& ctx) {
            if (ctx.get_current_test()->get_title() == "c") {
                ctx.skip();
            }
        });
        suite.it("c", logging_body(log, "c"));
        suite.it("d", logging_body(log, "d"));
    });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(log == std::vector<std::string>{"cleanup", "d"});
    REQUIRE(recorder.get_events(EventKind::TestEnd) ==
            std::vector<std::string>{"testEnd skipped suite a pending", "testEnd skipped suite child b pending",
                                     "testEnd skipped test c pending", "testEnd skipped test d passed"});
    REQUIRE(recorder.get_events(EventKind::HookFailed).empty());
    REQUIRE(stats.pending == 3);
    REQUIRE(stats.passes == 1);

    SECTION("Forbidden pending fails tests skipped at runtime") {
        Runner strict{{.forbid_pending = true}};
        EventRecorder strict_recorder{strict.get_event_bus()};

        Stats strict_stats = strict.run(*root);

        REQUIRE(strict_stats.pending == 0);
        REQUIRE(strict_stats.failures == 3);
        REQUIRE(strict_stats.passes == 1);
        REQUIRE(strict_recorder.get_failures().front().kind == ErrorKind::PendingForbidden);
    }
}

TEST_CASE("Forbidden configurations are rejected before anything runs") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    bool ran = false;

    builder.it("marked", [&](Context&) { ran = true; }).only();

    Runner runner{{.forbid_only = true}};
    EventRecorder recorder{runner.get_event_bus()};

    REQUIRE_THROWS_AS(runner.run(*root), ExclusivityForbiddenError);
    REQUIRE_FALSE(ran);
    REQUIRE(recorder.get_events().empty());

    // The runner is usable again
    REQUIRE(runner.get_state() == RunnerState::Idle);

    Runner filter_runner{{.grep = "[unclosed"}};
    REQUIRE_THROWS_AS(filter_runner.run(*root), InvalidFilterError);
}

TEST_CASE("Runner lifecycle") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::optional<RunnerState> state_during_run;

    Runner runner;

    builder.it("observes the runner", [&](Context&) { state_during_run = runner.get_state(); });

    REQUIRE(runner.get_state() == RunnerState::Idle);

    std::ignore = runner.run(*root);

    REQUIRE(state_during_run == RunnerState::Running);
    REQUIRE(runner.get_state() == RunnerState::Idle);

    SECTION("A running runner can't be started again") {
        std::optional<ErrorKind> nested_error;
        auto other = Suite::create_root();
        SuiteBuilder{*other}.it("nested", [&](Context&) {
            try {
                std::ignore = runner.run(*other);
            } catch (const RunnerStateError& err) {
                nested_error = err.get_kind();
            }
        });

        std::ignore = runner.run(*other);

        REQUIRE(nested_error == ErrorKind::InstanceAlreadyRunning);
    }

    SECTION("A disposed runner never runs again") {
        runner.dispose();

        REQUIRE(runner.get_state() == RunnerState::Disposed);
        REQUIRE_THROWS_AS(runner.run(*root), RunnerStateError);
    }

    SECTION("A non-reusable runner disposes itself") {
        Runner once{{.reusable = false}};
        std::ignore = once.run(*root);

        REQUIRE(once.get_state() == RunnerState::Disposed);

        try {
            std::ignore = once.run(*root);
            FAIL("Expected a RunnerStateError");
        } catch (const RunnerStateError& err) {
            REQUIRE(err.get_kind() == ErrorKind::InstanceAlreadyDisposed);
        }
    }
}

TEST_CASE("Re-running a tree gives the same results") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};

    builder.describe("suite", [](SuiteBuilder& suite) {
        suite.it("passes", [](Context&) {});
        suite.it("fails", failing_body("always"));
        suite.it("pending");
    });

    Runner runner;

    Stats first = runner.run(*root);
    std::vector<RunnableState> first_states;
    for (const auto& test : root->get_children().front()->get_tests()) {
        first_states.push_back(test->get_state());
    }

    Stats second = runner.run(*root);
    std::vector<RunnableState> second_states;
    for (const auto& test : root->get_children().front()->get_tests()) {
        second_states.push_back(test->get_state());
    }

    REQUIRE(first_states == second_states);
    REQUIRE(first.passes == second.passes);
    REQUIRE(first.failures == second.failures);
    REQUIRE(first.pending == second.pending);
    REQUIRE(first.tests == second.tests);
    REQUIRE(first.suites == second.suites);
}

TEST_CASE("Completion styles") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};

    builder.it("callback", [](Context&, Done done) { done(); });
    builder.it("callback with error", [](Context&, Done done) {
        done(std::make_exception_ptr(std::runtime_error{"callback error"}));
    });
    builder.it("callback fail", [](Context&, Done done) { done.fail("explicit failure"); });
    builder.it("callback from another thread", [](Context&, Done done) {
        std::thread{[done] { done(); }}.detach();
    });
    builder.it("future", [](Context&) { return std::async(std::launch::async, [] {}); });
    builder.it("failing future", [](Context&) -> std::future<void> {
        return std::async(std::launch::async, [] { throw AssertionError{"future failed"}; });
    });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    std::ignore = runner.run(*root);

    REQUIRE(recorder.get_events(EventKind::TestEnd) ==
            std::vector<std::string>{"testEnd callback passed", "testEnd callback with error failed",
                                     "testEnd callback fail failed", "testEnd callback from another thread passed",
                                     "testEnd future passed", "testEnd failing future failed"});

    const auto failures = recorder.get_failures();
    REQUIRE(failures.size() == 3);
    REQUIRE(failures.at(0).message == "callback error");
    REQUIRE(failures.at(1).kind == ErrorKind::Assertion);
    REQUIRE(failures.at(1).message == "explicit failure");
    REQUIRE(failures.at(2).message == "future failed");
}

TEST_CASE("Completing twice is a non-fatal error") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};

    builder.it("done twice", [](Context&, Done done) {
        done();
        done(std::make_exception_ptr(std::runtime_error{"late"}));
    });
    builder.it("next", [](Context&) {});

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(stats.passes == 2);
    REQUIRE(recorder.get_events(EventKind::RunnableError) == std::vector<std::string>{"runnableError done twice"});

    const auto failures = recorder.get_failures();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures.front().kind == ErrorKind::MultipleCompletion);
    REQUIRE_THAT(failures.front().message, Catch::Matchers::ContainsSubstring("late"));
}

TEST_CASE("Thrown values that are not exceptions are normalized") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};

    builder.it("throws an int", [](Context&) { throw 42; });
    builder.it("throws a string", [](Context&) { throw std::string{"oops"}; });

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    Stats stats = runner.run(*root);

    REQUIRE(stats.failures == 2);

    const auto failures = recorder.get_failures();
    REQUIRE(failures.size() == 2);
    REQUIRE(failures.at(0).kind == ErrorKind::InvalidException);
    REQUIRE_THAT(failures.at(0).message, Catch::Matchers::ContainsSubstring("int"));
    REQUIRE(failures.at(1).kind == ErrorKind::InvalidException);
    REQUIRE_THAT(failures.at(1).message, Catch::Matchers::ContainsSubstring("oops"));
}

TEST_CASE("Infrastructure errors end the run and are rethrown") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;

    builder.after_all(logging_body(log, "cleanup"));
    builder.it("can't spawn", [](Context&) {
        throw InfrastructureError{"could not start program", std::make_error_code(std::errc::no_such_file_or_directory)};
    });
    builder.it("never runs", logging_body(log, "never runs"));

    Runner runner;
    EventRecorder recorder{runner.get_event_bus()};

    REQUIRE_THROWS_AS(runner.run(*root), InfrastructureError);

    REQUIRE(log == std::vector<std::string>{"cleanup"});
    REQUIRE(recorder.get_events().back() == "runEnd");
    REQUIRE(runner.get_state() == RunnerState::Idle);
}

TEST_CASE("Bodies may abort the run") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};
    std::vector<std::string> log;

    builder.it("aborts", [](Context& ctx) { ctx.abort_run(); });
    builder.it("never runs", logging_body(log, "never runs"));

    Runner runner;
    Stats stats = runner.run(*root);

    REQUIRE(log.empty());
    REQUIRE(stats.passes == 1);
    REQUIRE(stats.tests == 1);
}
