#include <grader/runner/selection.hpp>

#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/runner/run_options.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace grader {

void Selection::add(const Test& test) {
    tests_.insert(&test);

    for (const Suite* suite = &test.get_suite(); suite != nullptr; suite = suite->get_parent()) {
        suites_.insert(suite);
    }
}

namespace {

void collect_all(const Suite& suite, std::vector<const Test*>& out) {
    for (const auto& test : suite.get_tests()) {
        out.push_back(test.get());
    }

    for (const auto& child : suite.get_children()) {
        collect_all(*child, out);
    }
}

/// Returns whether anything below ``suite`` was selected
bool collect_only(const Suite& suite, std::vector<const Test*>& out) {
    const auto& tests = suite.get_tests();

    // Marked tests take precedence over everything else in the suite, children included
    if (ranges::any_of(tests, [](const auto& test) { return test->is_only(); })) {
        for (const auto& test : tests) {
            if (test->is_only()) {
                out.push_back(test.get());
            }
        }
        return true;
    }

    bool any_selected = false;

    for (const auto& child : suite.get_children()) {
        if (child->is_only_marked()) {
            if (child->has_only()) {
                collect_only(*child, out);
            } else {
                collect_all(*child, out);
            }
            any_selected = true;
        } else {
            any_selected = collect_only(*child, out) || any_selected;
        }
    }

    return any_selected;
}

std::optional<std::regex> compile_grep(const RunOptions& options) {
    if (!options.grep) {
        return std::nullopt;
    }

    try {
        return std::regex{*options.grep, std::regex::ECMAScript};
    } catch (const std::regex_error& err) {
        throw InvalidFilterError{*options.grep, err.what()};
    }
}

} // namespace

Selection select_tests(const Suite& root, const RunOptions& options) {
    const bool has_only = root.has_only() || root.is_only_marked();

    if (options.forbid_only && has_only) {
        throw ExclusivityForbiddenError{};
    }

    auto grep = compile_grep(options);

    std::vector<const Test*> candidates;
    if (root.has_only()) {
        collect_only(root, candidates);
    } else {
        collect_all(root, candidates);
    }

    Selection selection;

    for (const Test* test : candidates) {
        if (grep && std::regex_search(test->get_full_title(), *grep) == options.invert) {
            continue;
        }

        selection.add(*test);
    }

    if (options.forbid_pending) {
        auto pending = ranges::find_if(candidates, [&](const Test* test) {
            return selection.contains(*test) && test->is_pending();
        });

        if (pending != candidates.end()) {
            throw PendingForbiddenError{fmt::format("Pending test forbidden: {:?}", (*pending)->get_full_title())};
        }
    }

    LOG_DEBUG("Selected {} of {} tests", selection.num_tests(), root.total_tests());

    return selection;
}

} // namespace grader
