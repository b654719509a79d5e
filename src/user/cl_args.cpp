#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <grader/common/expected.hpp>
#include <grader/logging.hpp>
#include <grader/registrars/exercise_registrar.hpp>

#include <argparse/argparse.hpp>
#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace grader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ GRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

long parse_integer(std::string_view opt, std::string_view what, long min_value) {
    long value = 0;
    auto [end, err] = std::from_chars(opt.data(), opt.data() + opt.size(), value);

    if (err != std::errc{} || end != opt.data() + opt.size()) {
        throw std::invalid_argument(fmt::format("{} {:?} is not an integer", what, opt));
    }

    if (value < min_value) {
        throw std::invalid_argument(fmt::format("{} must be at least {} (got {})", what, min_value, value));
    }

    return value;
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("Grader v{}\nRuns an exercise's test tree against learner programs.",
                                            GRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("exercise")
        .nargs(argparse::nargs_pattern::optional)
        .action([this] (const std::string& opt) { opts_buffer_.exercise = opt; })
        // argparse won't add choices to the help message by itself
        .help(fmt::format("The exercise to grade\nOne of: {}", ExerciseRegistrar::get().get_handles()));

    arg_parser_.add_argument("submissions")
        .nargs(argparse::nargs_pattern::any)
        .metavar("COMMAND")
        .help("Command line of a submission, e.g. \"./a.out\" or \"python3 hello.py\". Several may be given.");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(GRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-l", "--list")
        .flag()
        .store_into(opts_buffer_.list)
        .help("List the registered exercises and exit.");

    arg_parser_.add_argument("-g", "--grep")
        .metavar("REGEX")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.grep = opt; })
        .help("Only run tests whose full title matches REGEX (ECMAScript syntax).");

    arg_parser_.add_argument("-i", "--invert")
        .flag()
        .store_into(opts_buffer_.invert)
        .help("Run the tests that do NOT match --grep instead.");

    arg_parser_.add_argument("-b", "--bail")
        .flag()
        .store_into(opts_buffer_.bail)
        .help("Stop grading a submission after its first failure.");

    arg_parser_.add_argument("--forbid-only")
        .flag()
        .store_into(opts_buffer_.forbid_only)
        .help("Fail if an exercise restricts itself with `only`.");

    arg_parser_.add_argument("--forbid-pending")
        .flag()
        .store_into(opts_buffer_.forbid_pending)
        .help("Fail if any test is pending or skipped.");

    arg_parser_.add_argument("-t", "--timeout")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout = std::chrono::milliseconds{parse_integer(opt, "Timeout", 0)};
        })
        .help("Default timeout of tests and hooks in milliseconds. 0 disables timeouts.");

    arg_parser_.add_argument("-s", "--slow")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.slow = std::chrono::milliseconds{parse_integer(opt, "Slow threshold", 0)};
        })
        .help("Tests taking longer than this many milliseconds are reported as slow.");

    arg_parser_.add_argument("-r", "--retries")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.retries = static_cast<int>(parse_integer(opt, "Retries", 0));
        })
        .help("Retry failing tests up to N times.");

    arg_parser_.add_argument("-j", "--jobs")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.jobs = static_cast<std::size_t>(parse_integer(opt, "Number of jobs", 1));
        })
        .help("Grade up to N submissions at the same time.");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (auto submissions = arg_parser_.present<std::vector<std::string>>("submissions")) {
        opts_buffer_.submissions = *submissions;
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace grader
