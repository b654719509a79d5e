#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace grader {

/// Options the loader hands to the runner together with the tree
struct RunOptions
{
    /// ECMAScript regex matched (searched) against each test's full title
    std::optional<std::string> grep;
    /// Run the tests that do NOT match ``grep``
    bool invert = false;

    /// Stop after the first test failure. Suites already entered still run their cleanup hooks.
    bool bail = false;

    /// Refuse to run a tree that marks anything ``only``
    bool forbid_only = false;
    /// Refuse to run pending tests, and fail tests that skip at runtime
    bool forbid_pending = false;

    /// Applied to the root suite, and therefore inherited by everything that doesn't override it
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> slow;
    std::optional<int> retries;

    /// Whether the runner goes back to idle after a run, or becomes disposed
    bool reusable = true;
};

} // namespace grader
