#pragma once

#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/runner/run_options.hpp>

#include <cstddef>
#include <unordered_set>

namespace grader {

/// The subset of a tree that a run will execute
class Selection
{
public:
    bool contains(const Test& test) const { return tests_.contains(&test); }

    /// Whether ``suite`` has at least one selected test in its subtree
    bool contains(const Suite& suite) const { return suites_.contains(&suite); }

    std::size_t num_tests() const { return tests_.size(); }

    void add(const Test& test);

private:
    std::unordered_set<const Test*> tests_;
    std::unordered_set<const Suite*> suites_;
};

/// Compute the selection for a run of ``root``. Does not modify the tree.
///
/// ``only`` marks anywhere in the tree restrict the run to the marked tests and suites. A suite
/// that is marked runs entirely unless it contains marks of its own, and a suite holding marked
/// tests runs only those tests, ignoring its child suites. ``grep`` then filters the result by
/// full title.
///
/// Throws ``ExclusivityForbiddenError``, ``InvalidFilterError`` or ``PendingForbiddenError``
/// when ``options`` rule the tree out.
Selection select_tests(const Suite& root, const RunOptions& options);

} // namespace grader
