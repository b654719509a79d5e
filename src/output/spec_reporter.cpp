#include "output/spec_reporter.hpp"

#include "output/sink.hpp"

#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/runner/stats.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace grader {

namespace {

bool is_printed(const Suite& suite) {
    return !(suite.is_root() && suite.get_title().empty());
}

std::vector<std::string> split_lines(const std::string& text) {
    return text | ranges::views::split('\n') |
           ranges::views::transform([](auto&& line) { return line | ranges::to<std::string>; }) |
           ranges::to<std::vector>;
}

} // namespace

SpecReporter::SpecReporter(Sink& sink, bool colorize)
    : sink_{sink}
    , do_colorize_{colorize} {}

void SpecReporter::on_run_begin(const Stats& /*stats*/) {
    depth_ = 0;
    failures_.clear();

    sink_.write("\n");
}

void SpecReporter::on_suite_begin(const Suite& suite) {
    if (!is_printed(suite)) {
        return;
    }

    sink_.write(fmt::format("{}{}\n", indent(), style_str(suite.get_title(), SUITE_STYLE)));
    ++depth_;
}

void SpecReporter::on_suite_end(const Suite& suite) {
    if (!is_printed(suite)) {
        return;
    }

    --depth_;

    // Blank line between top level suites
    if (depth_ == 0) {
        sink_.write("\n");
    }
}

void SpecReporter::on_test_end(const Test& test, const Hook* failing_hook) {
    switch (test.get_state()) {
    case RunnableState::Passed: {
        std::string line = fmt::format("{}{} {}", indent(), style_str(CHECK_MARK, PASS_STYLE), test.get_title());

        if (TestSpeed speed = test.get_speed(); speed != TestSpeed::Fast) {
            auto duration = fmt::format("({}ms)", test.get_duration().count());
            line += " " + style_str(duration, speed == TestSpeed::Slow ? SLOW_STYLE : MEDIUM_STYLE);
        }

        sink_.write(line + "\n");
        break;
    }

    case RunnableState::Pending:
        sink_.write(fmt::format("{}{}\n", indent(), style_str(fmt::format("- {}", test.get_title()), PENDING_STYLE)));
        break;

    case RunnableState::Failed: {
        if (!test.get_failure()) {
            LOG_WARN("Test {:?} failed without a recorded failure", test.get_full_title());
            break;
        }

        std::vector<std::string> title_path = test.get_title_path();

        if (failing_hook != nullptr) {
            title_path = failing_hook->get_title_path();
            title_path.back() += fmt::format(" for {:?}", test.get_title());
        }

        std::size_t number = add_failure(std::move(title_path), *test.get_failure());
        sink_.write(fmt::format("{}{}\n", indent(), style_str(fmt::format("{}) {}", number, test.get_title()), FAIL_STYLE)));
        break;
    }

    case RunnableState::Unset:
        LOG_WARN("Test {:?} ended without a state", test.get_full_title());
        break;
    }
}

void SpecReporter::on_hook_failed(const Hook& hook, const Failure& failure) {
    std::size_t number = add_failure(hook.get_title_path(), failure);
    sink_.write(fmt::format("{}{}\n", indent(), style_str(fmt::format("{}) {}", number, hook.get_title()), FAIL_STYLE)));
}

void SpecReporter::on_runnable_error(const Runnable& runnable, const Failure& failure) {
    std::size_t number = add_failure(runnable.get_title_path(), failure);
    sink_.write(fmt::format("{}{}\n", indent(),
                            style_str(fmt::format("{}) {} ({})", number, runnable.get_title(), failure.kind), FAIL_STYLE)));
}

void SpecReporter::on_run_end(const Stats& stats) {
    std::string out = "\n";

    out += fmt::format("  {} {}\n", style_str(fmt::format("{} passing", stats.passes), PASS_STYLE),
                       style_str(fmt::format("({}ms)", stats.duration.count()), DIM_STYLE));

    if (stats.pending > 0) {
        out += fmt::format("  {}\n", style_str(fmt::format("{} pending", stats.pending), PENDING_STYLE));
    }

    if (!failures_.empty()) {
        out += fmt::format("  {}\n", style_str(fmt::format("{} failing", failures_.size()), FAIL_STYLE));
    }

    out += "\n";
    sink_.write(out);

    for (std::size_t i = 0; i < failures_.size(); ++i) {
        write_failure(i + 1, failures_[i]);
    }

    sink_.flush();
}

std::size_t SpecReporter::add_failure(std::vector<std::string> title_path, const Failure& failure) {
    failures_.push_back({.title_path = std::move(title_path), .failure = failure});
    return failures_.size();
}

void SpecReporter::write_failure(std::size_t number, const ReportedFailure& reported) {
    const auto& [title_path, failure] = reported;

    std::string out = fmt::format("  {}) ", number);
    const std::size_t title_indent = out.size();

    for (std::size_t i = 0; i < title_path.size(); ++i) {
        if (i > 0) {
            out += std::string(title_indent + INDENT_WIDTH * i, ' ');
        }
        out += title_path[i];
        out += i + 1 == title_path.size() ? ":\n" : "\n";
    }

    out += style_str(fmt::format("     {}: {}", failure.kind, failure.message), FAIL_STYLE);
    out += "\n";

    if (failure.actual && failure.expected) {
        out += fmt::format("      {} {}\n\n", style_str(std::string_view{"+ expected"}, PASS_STYLE),
                          style_str(std::string_view{"- actual"}, FAIL_STYLE));
        out += diff(*failure.actual, *failure.expected);
    }

    out += "\n";
    sink_.write(out);
}

std::string SpecReporter::diff(const std::string& actual, const std::string& expected) const {
    const std::vector<std::string> actual_lines = split_lines(actual);
    const std::vector<std::string> expected_lines = split_lines(expected);

    std::string out;

    for (std::size_t i = 0; i < std::max(actual_lines.size(), expected_lines.size()); ++i) {
        const std::string* actual_line = i < actual_lines.size() ? &actual_lines[i] : nullptr;
        const std::string* expected_line = i < expected_lines.size() ? &expected_lines[i] : nullptr;

        if (actual_line != nullptr && expected_line != nullptr && *actual_line == *expected_line) {
            out += fmt::format("       {}\n", *actual_line);
            continue;
        }

        if (actual_line != nullptr) {
            out += fmt::format("      {}\n", style_str("-" + *actual_line, FAIL_STYLE));
        }
        if (expected_line != nullptr) {
            out += fmt::format("      {}\n", style_str("+" + *expected_line, PASS_STYLE));
        }
    }

    return out;
}

} // namespace grader
