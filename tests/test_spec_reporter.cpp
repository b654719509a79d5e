#include "catch2_custom.hpp"

#include "output/sink.hpp"
#include "output/spec_reporter.hpp"

#include <grader/api/suite_builder.hpp>
#include <grader/core/context.hpp>
#include <grader/core/suite.hpp>
#include <grader/exceptions.hpp>
#include <grader/runner/runner.hpp>

#include <memory>
#include <string>
#include <tuple>

using namespace grader;
using Catch::Matchers::ContainsSubstring;

namespace {

/// Run ``root`` with a SpecReporter attached and return everything it wrote
std::string report(Suite& root, bool colorize = false) {
    StringSink sink;
    SpecReporter reporter{sink, colorize};
    Runner runner;

    reporter.attach(runner.get_event_bus());
    std::ignore = runner.run(root);
    reporter.detach();

    return sink.take();
}

std::unique_ptr<Suite> make_math_tree() {
    auto root = Suite::create_root();

    SuiteBuilder{*root}.describe("math", [](SuiteBuilder& suite) {
        suite.it("adds", [](Context&) {});
        suite.it("subtracts");
        suite.it("multiplies", [](Context&) { throw AssertionError{"wrong product", "6\n", "8\n"}; });
    });

    return root;
}

} // namespace

TEST_CASE("Tests are listed under their suites") {
    auto root = make_math_tree();
    std::string out = report(*root);

    REQUIRE_THAT(out, ContainsSubstring("  math\n"
                                        "    ✓ adds\n"
                                        "    - subtracts\n"
                                        "    1) multiplies\n"
                                        "\n"));
}

TEST_CASE("The summary counts outcomes") {
    auto root = make_math_tree();
    std::string out = report(*root);

    REQUIRE_THAT(out, ContainsSubstring("  1 passing ("));
    REQUIRE_THAT(out, ContainsSubstring("  1 pending\n"));
    REQUIRE_THAT(out, ContainsSubstring("  1 failing\n"));
}

TEST_CASE("Failures are detailed with a diff") {
    auto root = make_math_tree();
    std::string out = report(*root);

    REQUIRE_THAT(out, ContainsSubstring("  1) math\n"
                                        "       multiplies:\n"
                                        "     AssertionError: wrong product\n"
                                        "      + expected - actual\n"
                                        "\n"
                                        "      -6\n"
                                        "      +8\n"));
}

TEST_CASE("Identical lines are not marked in diffs") {
    auto root = Suite::create_root();
    SuiteBuilder{*root}.it("prints", [](Context&) { throw AssertionError{"output", "a\nb\n", "a\nc\n"}; });

    std::string out = report(*root);

    REQUIRE_THAT(out, ContainsSubstring("       a\n"
                                        "      -b\n"
                                        "      +c\n"));
}

TEST_CASE("Hook failures are attributed to the hook") {
    auto root = Suite::create_root();

    SuiteBuilder{*root}.describe("suite", [](SuiteBuilder& suite) {
        suite.before_each([](Context&) { throw AssertionError{"setup broke"}; }, "setup");
        suite.it("t", [](Context&) {});
    });

    std::string out = report(*root);

    REQUIRE_THAT(out, ContainsSubstring("    1) t\n"));
    REQUIRE_THAT(out, ContainsSubstring("\"before each\" hook: setup for \"t\":\n"
                                        "     AssertionError: setup broke\n"));
    REQUIRE_THAT(out, ContainsSubstring("  0 passing"));
    REQUIRE_THAT(out, ContainsSubstring("  1 failing"));

    SECTION("\"before all\" hooks get their own entry") {
        auto other = Suite::create_root();

        SuiteBuilder{*other}.describe("suite", [](SuiteBuilder& suite) {
            suite.before_all([](Context&) { throw AssertionError{"no database"}; });
            suite.it("t", [](Context&) {});
        });

        std::string other_out = report(*other);

        REQUIRE_THAT(other_out, ContainsSubstring("    1) \"before all\" hook\n"));
        REQUIRE_THAT(other_out, ContainsSubstring("     AssertionError: no database\n"));
    }
}

TEST_CASE("Colors are only used when asked for") {
    auto root = make_math_tree();

    REQUIRE_THAT(report(*root, false), !ContainsSubstring("\x1b["));
    REQUIRE_THAT(report(*root, true), ContainsSubstring("\x1b["));
}
