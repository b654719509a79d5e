#include <grader/api/assertions.hpp>
#include <grader/api/exercise.hpp>
#include <grader/api/suite_builder.hpp>
#include <grader/core/context.hpp>
#include <grader/registrars/exercise_registrar.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace grader::exercises {

namespace {

constexpr std::uint64_t factorial(std::uint64_t n) {
    return n <= 1 ? 1 : n * factorial(n - 1);
}

static_assert(factorial(6) == 720);

void build(SuiteBuilder& suite, const Submission& submission) {
    using namespace std::chrono_literals;

    suite.timeout(3s);

    suite.it("Write the program", [submission](Context&) {
        std::filesystem::path file = submission.arguments.empty() ? submission.executable : submission.arguments.back();
        assertions::file_exists(file, "Cannot find `" + file.string() + "`");
    });

    suite.describe("Calculate the factorial of a given integer", [&](SuiteBuilder& cases) {
        for (std::uint64_t n : std::vector<std::uint64_t>{0, 1, 5, 6, 10, 20}) {
            cases.it(fmt::format("Calculate the factorial of {}", n), [submission, n](Context&) {
                assertions::output({.executable = submission.executable,
                                    .arguments = submission.arguments,
                                    .input = std::to_string(n),
                                    .expected_output = fmt::format("{}\n", factorial(n)),
                                    .expected_error = "",
                                    .expected_exit_code = 0,
                                    .timeout = 1500ms},
                                   fmt::format("factorial({}) should print {}", n, factorial(n)));
            });
        }
    });
}

const ExerciseAutoRegistrar factorial_registrar{Exercise{
    "basics/factorial", "Calculate the factorial of a given integer.",
    "Factorial of a non-negative integer, is multiplication of all integers smaller than or equal to n.\n"
    "For example factorial of 6 is 6 * 5 * 4 * 3 * 2 * 1 which is 720.\n\n"
    "Read n from standard input and print n! followed by a newline. Factorial can be calculated\n"
    "iteratively or recursively. You can solve using any approach.",
    {"basics", "factorial"}, build}};

} // namespace

} // namespace grader::exercises
