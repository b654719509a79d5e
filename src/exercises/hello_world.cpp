#include <grader/api/assertions.hpp>
#include <grader/api/exercise.hpp>
#include <grader/api/suite_builder.hpp>
#include <grader/core/context.hpp>
#include <grader/registrars/exercise_registrar.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace grader::exercises {

namespace {

/// The program file is the last word of the command line: the executable itself for compiled
/// programs, the script for interpreted ones
std::filesystem::path program_file(const Submission& submission) {
    return submission.arguments.empty() ? submission.executable : submission.arguments.back();
}

void build(SuiteBuilder& suite, const Submission& submission) {
    using namespace std::chrono_literals;

    suite.it("Write the program", [submission](Context&) {
             assertions::file_exists(program_file(submission),
                                     "Cannot find `" + program_file(submission).string() + "`");
         })
        .description("The program should be at the path given for the submission.");

    suite.it("Print the message \"Hello, world!\" on the console", [submission](Context&) {
             assertions::output({.executable = submission.executable,
                                 .arguments = submission.arguments,
                                 .input = std::nullopt,
                                 .expected_output = "Hello, world!\n",
                                 .expected_error = "",
                                 .expected_exit_code = 0,
                                 .timeout = 1500ms},
                                "Print the message \"Hello, world!\" followed by a newline");
         })
        .description("Nothing else may be printed, on either output stream.");
}

const ExerciseAutoRegistrar hello_world_registrar{
    Exercise{"basics/hello-world", "Hello, world!",
             "The Hello World program is a program that prints \"Hello, world!\". It is very simple in most\n"
             "programming languages, and is used to show the basic syntax of a programming language.\n\n"
             "Write a program to print \"Hello, world!\" on the console.",
             {"basics", "hello-world"}, build}};

} // namespace

} // namespace grader::exercises
