#pragma once

#include "output/sink.hpp"

#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/runner/reporter.hpp>
#include <grader/runner/stats.hpp>

#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace grader {

/// Hierarchical, human readable report of a run: one line per suite and test, indented by depth,
/// followed by a summary and the details of every failure.
///
/// \code
///   Hello, world!
///     ✓ Write the program
///     1) Print the message "Hello, world!" on the console
///
///   1 passing (12ms)
///   1 failing
///
///   1) Hello, world!
///        Print the message "Hello, world!" on the console:
///      AssertionError: Print the message "Hello, world!" followed by a newline
///      + expected - actual
/// \endcode
class SpecReporter : public Reporter
{
public:
    SpecReporter(Sink& sink, bool colorize);

    void on_run_begin(const Stats& stats) override;
    void on_suite_begin(const Suite& suite) override;
    void on_suite_end(const Suite& suite) override;
    void on_test_end(const Test& test, const Hook* failing_hook) override;
    void on_hook_failed(const Hook& hook, const Failure& failure) override;
    void on_runnable_error(const Runnable& runnable, const Failure& failure) override;
    void on_run_end(const Stats& stats) override;

private:
    struct ReportedFailure
    {
        std::vector<std::string> title_path;
        Failure failure;
    };

    std::size_t add_failure(std::vector<std::string> title_path, const Failure& failure);

    void write_failure(std::size_t number, const ReportedFailure& reported);

    /// Line by line comparison of the actual and expected values
    std::string diff(const std::string& actual, const std::string& expected) const;

    std::string indent() const { return std::string(INDENT_WIDTH * (depth_ + 1), ' '); }

    template <fmt::formattable T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    static constexpr std::size_t INDENT_WIDTH = 2;
    static constexpr std::string_view CHECK_MARK = "✓";

    static constexpr auto PASS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto FAIL_STYLE = fmt::fg(fmt::color::red);
    static constexpr auto PENDING_STYLE = fmt::fg(fmt::color::cyan);
    static constexpr auto MEDIUM_STYLE = fmt::fg(fmt::color::yellow);
    static constexpr auto SLOW_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto SUITE_STYLE = fmt::emphasis::bold;
    static constexpr auto DIM_STYLE = fmt::fg(fmt::color::gray);

    Sink& sink_;
    bool do_colorize_;

    std::size_t depth_ = 0;
    std::vector<ReportedFailure> failures_;
};

template <fmt::formattable T>
std::string SpecReporter::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }

    return fmt::format(style, "{}", arg);
}

} // namespace grader
