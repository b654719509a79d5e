#pragma once

#include <grader/api/suite_builder.hpp>
#include <grader/core/suite.hpp>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace grader {

/// The learner program under test
struct Submission
{
    std::string executable;
    std::vector<std::string> arguments;

    /// Split a command line on spaces, e.g. "python3 hello.py"
    static Submission parse(std::string_view command_line);

    std::string to_string() const;
};

/// A gradable exercise: its metadata, and how to build the suite tree for one submission
class Exercise
{
public:
    using BuildFn = std::function<void(SuiteBuilder&, const Submission&)>;

    Exercise(std::string handle, std::string title, std::string description, std::set<std::string> tags,
             BuildFn build);

    const std::string& get_handle() const { return handle_; }

    const std::string& get_title() const { return title_; }

    const std::string& get_description() const { return description_; }

    const std::set<std::string>& get_tags() const { return tags_; }

    /// Build a fresh tree for ``submission``. The exercise's suite is the only child of an untitled root.
    std::unique_ptr<Suite> instantiate(const Submission& submission) const;

private:
    std::string handle_;
    std::string title_;
    std::string description_;
    std::set<std::string> tags_;
    BuildFn build_;
};

} // namespace grader
