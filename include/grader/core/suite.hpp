#pragma once

#include <grader/common/class_traits.hpp>
#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/test.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace grader {

/// A node of the suite tree. Owns its child suites, tests and hooks.
///
/// The tree is acyclic by construction: children are only ever appended, and the parent of a
/// suite is fixed when it is created. Nothing may be added while a runner is running the tree.
class Suite : NonMovable
{
public:
    /// Create the root of a new tree. The root is usually untitled.
    static std::unique_ptr<Suite> create_root(std::string title = "");

    ~Suite();

    Suite& create_child(std::string title);

    /// A test without a body is pending
    Test& add_test(std::string title, std::optional<Body> body);

    Hook& add_hook(HookPhase phase, Body body, const std::optional<std::string>& name = std::nullopt);

    const std::string& get_title() const { return title_; }

    /// Titles from the outermost titled suite down to this one. An untitled root is left out.
    std::vector<std::string> get_title_path() const;

    std::string get_full_title() const;

    Suite* get_parent() const { return parent_; }

    bool is_root() const { return parent_ == nullptr; }

    const std::vector<std::unique_ptr<Suite>>& get_children() const { return children_; }

    const std::vector<std::unique_ptr<Test>>& get_tests() const { return tests_; }

    const std::vector<std::unique_ptr<Hook>>& get_hooks(HookPhase phase) const;

    /// Restrict the run to this suite (and any other ``only`` tests or suites).
    /// Ancestors are told that a descendant is selected.
    void mark_only();

    bool is_only_marked() const { return only_marked_; }

    /// Whether some test or suite strictly below this one is marked ``only``
    bool has_only() const { return has_only_descendant_; }

    void mark_pending() { pending_ = true; }

    /// Whether this suite or any ancestor is pending
    bool is_pending() const;

    void set_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds get_timeout() const;

    void set_slow(std::chrono::milliseconds slow);
    std::chrono::milliseconds get_slow() const;

    /// Negative means "inherit from the parent"
    void set_retries(int retries);
    int get_retries() const;

    const std::optional<std::string>& get_handle() const { return handle_; }

    void set_handle(std::string handle) { handle_ = std::move(handle); }

    const std::string& get_description() const { return description_; }

    void set_description(std::string description) { description_ = std::move(description); }

    const std::set<std::string>& get_tags() const { return tags_; }

    void add_tag(std::string tag) { tags_.insert(std::move(tag)); }

    /// Number of tests in this suite and all of its descendants
    std::size_t total_tests() const;

    /// Reset every runnable in the subtree. See ``Runnable::reset``
    void reset();

private:
    friend class Test;

    Suite(std::string title, Suite* parent);

    void note_only_descendant();

    std::string title_;
    std::optional<std::string> handle_;
    std::string description_;
    std::set<std::string> tags_;

    Suite* parent_;
    std::vector<std::unique_ptr<Suite>> children_;
    std::vector<std::unique_ptr<Test>> tests_;
    std::array<std::vector<std::unique_ptr<Hook>>, 4> hooks_;

    RunnableConfig config_;
    bool pending_ = false;
    bool only_marked_ = false;
    bool has_only_descendant_ = false;
};

} // namespace grader
