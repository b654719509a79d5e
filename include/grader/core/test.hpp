#pragma once

#include <grader/core/runnable.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace grader {

enum class TestSpeed { Fast, Medium, Slow };

constexpr std::string_view format_as(TestSpeed speed) {
    switch (speed) {
    case TestSpeed::Fast:
        return "fast";
    case TestSpeed::Medium:
        return "medium";
    case TestSpeed::Slow:
        return "slow";
    }

    return "<unknown>";
}

class Test : public Runnable
{
public:
    /// A test without a body is pending
    Test(std::string title, std::optional<Body> body, Suite& suite);

    RunnableType get_type() const override { return RunnableType::Test; }

    Suite& get_suite() const;

    /// Restrict the run to this test (and any other ``only`` tests or suites)
    void mark_only();

    bool is_only() const { return only_; }

    /// Classify the last duration against the slow threshold
    TestSpeed get_speed() const;

private:
    bool only_ = false;
};

} // namespace grader
