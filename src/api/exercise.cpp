#include <grader/api/exercise.hpp>

#include <grader/api/suite_builder.hpp>
#include <grader/core/suite.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace grader {

Submission Submission::parse(std::string_view command_line) {
    std::vector<std::string> words = command_line | ranges::views::split(' ') |
                                     ranges::views::transform([](auto&& word) { return word | ranges::to<std::string>; }) |
                                     ranges::views::filter([](const std::string& word) { return !word.empty(); }) |
                                     ranges::to<std::vector>;

    Submission submission;

    if (words.empty()) {
        return submission;
    }

    submission.executable = std::move(words.front());
    submission.arguments.assign(std::make_move_iterator(words.begin() + 1), std::make_move_iterator(words.end()));

    return submission;
}

std::string Submission::to_string() const {
    if (arguments.empty()) {
        return executable;
    }

    return fmt::format("{} {}", executable, fmt::join(arguments, " "));
}

Exercise::Exercise(std::string handle, std::string title, std::string description, std::set<std::string> tags,
                   BuildFn build)
    : handle_{std::move(handle)}
    , title_{std::move(title)}
    , description_{std::move(description)}
    , tags_{std::move(tags)}
    , build_{std::move(build)} {}

std::unique_ptr<Suite> Exercise::instantiate(const Submission& submission) const {
    auto root = Suite::create_root();

    SuiteBuilder{*root}.describe(title_, [&](SuiteBuilder& suite) {
        suite.handle(handle_).description(description_);

        for (const std::string& tag : tags_) {
            suite.tag(tag);
        }

        if (build_) {
            build_(suite, submission);
        }
    });

    return root;
}

} // namespace grader
