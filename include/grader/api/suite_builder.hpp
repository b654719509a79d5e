/// \file
/// Declaration API for building suite trees.
///
/// Every builder wraps exactly one node and is handed explicitly to the code declaring that
/// node's contents:
///
/// \code
/// root.describe("factorial", [&](SuiteBuilder& suite) {
///     suite.before_each([](Context&) { /* ... */ });
///     suite.it("computes 5!", [&](Context&) { assertions::equal(factorial(5), 120); });
///     suite.it("handles negative input"); // pending
/// });
/// \endcode
#pragma once

#include <grader/core/context.hpp>
#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace grader {

class TestBuilder
{
public:
    explicit TestBuilder(Test& test)
        : test_{&test} {}

    TestBuilder& only();
    TestBuilder& skip();
    TestBuilder& timeout(std::chrono::milliseconds timeout);
    TestBuilder& slow(std::chrono::milliseconds slow);
    TestBuilder& retries(int retries);
    TestBuilder& description(std::string description);

    Test& get_test() const { return *test_; }

private:
    Test* test_;
};

class SuiteBuilder
{
public:
    explicit SuiteBuilder(Suite& suite)
        : suite_{&suite} {}

    /// Create a child suite and declare its contents with ``declare``.
    /// Returns a builder for the child, so that it may be marked afterwards.
    SuiteBuilder describe(std::string title, const std::function<void(SuiteBuilder&)>& declare);

    template <typename Func>
    TestBuilder it(std::string title, Func&& body) {
        return TestBuilder{suite_->add_test(std::move(title), make_body(std::forward<Func>(body)))};
    }

    /// A test without a body; always pending
    TestBuilder it(std::string title);

    template <typename Func>
    SuiteBuilder& before_all(Func&& body, const std::optional<std::string>& name = std::nullopt) {
        suite_->add_hook(HookPhase::BeforeAll, make_body(std::forward<Func>(body)), name);
        return *this;
    }

    template <typename Func>
    SuiteBuilder& after_all(Func&& body, const std::optional<std::string>& name = std::nullopt) {
        suite_->add_hook(HookPhase::AfterAll, make_body(std::forward<Func>(body)), name);
        return *this;
    }

    template <typename Func>
    SuiteBuilder& before_each(Func&& body, const std::optional<std::string>& name = std::nullopt) {
        suite_->add_hook(HookPhase::BeforeEach, make_body(std::forward<Func>(body)), name);
        return *this;
    }

    template <typename Func>
    SuiteBuilder& after_each(Func&& body, const std::optional<std::string>& name = std::nullopt) {
        suite_->add_hook(HookPhase::AfterEach, make_body(std::forward<Func>(body)), name);
        return *this;
    }

    SuiteBuilder& only();
    SuiteBuilder& skip();
    SuiteBuilder& timeout(std::chrono::milliseconds timeout);
    SuiteBuilder& slow(std::chrono::milliseconds slow);
    SuiteBuilder& retries(int retries);

    SuiteBuilder& handle(std::string handle);
    SuiteBuilder& description(std::string description);
    SuiteBuilder& tag(std::string tag);

    Suite& get_suite() const { return *suite_; }

private:
    Suite* suite_;
};

} // namespace grader
