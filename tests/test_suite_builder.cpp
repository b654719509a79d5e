#include "catch2_custom.hpp"

#include <grader/api/exercise.hpp>
#include <grader/api/suite_builder.hpp>
#include <grader/core/context.hpp>
#include <grader/core/hook.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>

#include <chrono>
#include <set>
#include <string>
#include <vector>

using namespace grader;
using namespace std::chrono_literals;

TEST_CASE("Declaring a tree with the builder") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};

    SuiteBuilder factorial = builder.describe("factorial", [](SuiteBuilder& suite) {
        suite.before_all([](Context&) {}, "compile");
        suite.before_each([](Context&, Done done) { done(); });
        suite.after_each([](Context&) {});
        suite.after_all([](Context&) {});

        suite.it("computes 5!", [](Context&) {}).timeout(100ms).slow(10ms).retries(2).description("5! = 120");
        suite.it("handles negative input");
        suite.it("is skipped", [](Context&) {}).skip();

        suite.describe("nested", [](SuiteBuilder& nested) { nested.it("runs", [](Context&) {}); });
    });

    factorial.timeout(1s).tag("math").handle("math/factorial");

    Suite& suite = factorial.get_suite();

    REQUIRE(root->get_children().size() == 1);
    REQUIRE(suite.get_title() == "factorial");
    REQUIRE(suite.get_timeout() == 1s);
    REQUIRE(suite.get_tags() == std::set<std::string>{"math"});
    REQUIRE(suite.get_handle() == "math/factorial");

    REQUIRE(suite.get_hooks(HookPhase::BeforeAll).size() == 1);
    REQUIRE(suite.get_hooks(HookPhase::BeforeAll).front()->get_title() == "\"before all\" hook: compile");
    REQUIRE(suite.get_hooks(HookPhase::BeforeEach).size() == 1);
    REQUIRE(suite.get_hooks(HookPhase::AfterEach).size() == 1);
    REQUIRE(suite.get_hooks(HookPhase::AfterAll).size() == 1);

    REQUIRE(suite.get_tests().size() == 3);

    const Test& computes = *suite.get_tests().at(0);
    REQUIRE(computes.get_timeout() == 100ms);
    REQUIRE(computes.get_slow() == 10ms);
    REQUIRE(computes.get_retries() == 2);
    REQUIRE(computes.get_description() == "5! = 120");
    REQUIRE_FALSE(computes.is_pending());

    REQUIRE(suite.get_tests().at(1)->is_pending());
    REQUIRE(suite.get_tests().at(2)->is_pending());

    REQUIRE(suite.get_children().size() == 1);
    REQUIRE(suite.get_children().front()->get_tests().front()->get_full_title() == "factorial nested runs");
}

TEST_CASE("Only marks from the builder") {
    auto root = Suite::create_root();
    SuiteBuilder builder{*root};

    builder.describe("a", [](SuiteBuilder& suite) { suite.it("t", [](Context&) {}).only(); });
    builder.describe("b", [](SuiteBuilder&) {}).only();

    REQUIRE(root->has_only());
    REQUIRE(root->get_children().at(0)->get_tests().front()->is_only());
    REQUIRE(root->get_children().at(1)->is_only_marked());
}

TEST_CASE("Submission command lines") {
    Submission compiled = Submission::parse("./a.out");
    REQUIRE(compiled.executable == "./a.out");
    REQUIRE(compiled.arguments.empty());

    Submission interpreted = Submission::parse("python3  hello.py --fast");
    REQUIRE(interpreted.executable == "python3");
    REQUIRE(interpreted.arguments == std::vector<std::string>{"hello.py", "--fast"});
    REQUIRE(interpreted.to_string() == "python3 hello.py --fast");

    REQUIRE(Submission::parse("").executable.empty());
}

TEST_CASE("Exercises build a fresh tree per submission") {
    Exercise exercise{"basics/echo", "Echo", "Repeat the input", {"basics"},
                      [](SuiteBuilder& suite, const Submission& submission) {
                          suite.it("runs " + submission.to_string(), [](Context&) {});
                      }};

    REQUIRE(exercise.get_handle() == "basics/echo");
    REQUIRE(exercise.get_title() == "Echo");
    REQUIRE(exercise.get_description() == "Repeat the input");
    REQUIRE(exercise.get_tags() == std::set<std::string>{"basics"});

    auto first = exercise.instantiate(Submission::parse("./one"));
    auto second = exercise.instantiate(Submission::parse("./two"));

    REQUIRE(first.get() != second.get());
    REQUIRE(first->get_title().empty());
    REQUIRE(first->get_children().size() == 1);

    const Suite& suite = *first->get_children().front();
    REQUIRE(suite.get_title() == "Echo");
    REQUIRE(suite.get_handle() == "basics/echo");
    REQUIRE(suite.get_description() == "Repeat the input");
    REQUIRE(suite.get_tags().contains("basics"));
    REQUIRE(suite.get_tests().front()->get_full_title() == "Echo runs ./one");
    REQUIRE(second->get_children().front()->get_tests().front()->get_title() == "runs ./two");
}
