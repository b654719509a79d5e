#include <grader/core/suite.hpp>

#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/test.hpp>
#include <grader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace grader {

Suite::Suite(std::string title, Suite* parent)
    : title_{std::move(title)}
    , parent_{parent} {}

Suite::~Suite() = default;

std::unique_ptr<Suite> Suite::create_root(std::string title) {
    // Constructor is private, so make_unique is not an option
    return std::unique_ptr<Suite>(new Suite(std::move(title), nullptr));
}

Suite& Suite::create_child(std::string title) {
    children_.push_back(std::unique_ptr<Suite>(new Suite(std::move(title), this)));
    return *children_.back();
}

Test& Suite::add_test(std::string title, std::optional<Body> body) {
    tests_.push_back(std::make_unique<Test>(std::move(title), std::move(body), *this));
    return *tests_.back();
}

Hook& Suite::add_hook(HookPhase phase, Body body, const std::optional<std::string>& name) {
    auto& hooks = hooks_.at(static_cast<std::size_t>(phase));
    hooks.push_back(std::make_unique<Hook>(phase, std::move(body), *this, name));
    return *hooks.back();
}

const std::vector<std::unique_ptr<Hook>>& Suite::get_hooks(HookPhase phase) const {
    return hooks_.at(static_cast<std::size_t>(phase));
}

std::vector<std::string> Suite::get_title_path() const {
    std::vector<std::string> path;

    if (parent_ != nullptr) {
        path = parent_->get_title_path();
    }

    if (!(is_root() && title_.empty())) {
        path.push_back(title_);
    }

    return path;
}

std::string Suite::get_full_title() const {
    return fmt::format("{}", fmt::join(get_title_path(), " "));
}

void Suite::mark_only() {
    only_marked_ = true;

    if (parent_ != nullptr) {
        parent_->note_only_descendant();
    }
}

void Suite::note_only_descendant() {
    for (Suite* suite = this; suite != nullptr; suite = suite->parent_) {
        suite->has_only_descendant_ = true;
    }
}

bool Suite::is_pending() const {
    return pending_ || (parent_ != nullptr && parent_->is_pending());
}

void Suite::set_timeout(std::chrono::milliseconds timeout) {
    config_.timeout = clamp_timeout(timeout);
}

std::chrono::milliseconds Suite::get_timeout() const {
    if (config_.timeout) {
        return *config_.timeout;
    }

    return parent_ != nullptr ? parent_->get_timeout() : DEFAULT_TIMEOUT;
}

void Suite::set_slow(std::chrono::milliseconds slow) {
    config_.slow = std::max(slow, std::chrono::milliseconds{0});
}

std::chrono::milliseconds Suite::get_slow() const {
    if (config_.slow) {
        return *config_.slow;
    }

    return parent_ != nullptr ? parent_->get_slow() : DEFAULT_SLOW;
}

void Suite::set_retries(int retries) {
    if (retries < 0) {
        config_.retries.reset();
        return;
    }

    config_.retries = retries;
}

int Suite::get_retries() const {
    if (config_.retries) {
        return *config_.retries;
    }

    return parent_ != nullptr ? parent_->get_retries() : DEFAULT_RETRIES;
}

std::size_t Suite::total_tests() const {
    auto child_totals = children_ | ranges::views::transform([](const auto& child) { return child->total_tests(); });

    return tests_.size() + ranges::accumulate(child_totals, std::size_t{0});
}

void Suite::reset() {
    for (auto& test : tests_) {
        test->reset();
    }

    for (auto& hooks : hooks_) {
        for (auto& hook : hooks) {
            hook->reset();
        }
    }

    for (auto& child : children_) {
        child->reset();
    }
}

Test::Test(std::string title, std::optional<Body> body, Suite& suite)
    : Runnable{std::move(title), std::move(body), &suite} {}

Suite& Test::get_suite() const {
    Suite* suite = get_parent();
    DEBUG_ASSERT(suite != nullptr, "A test always belongs to a suite");
    return *suite;
}

void Test::mark_only() {
    only_ = true;
    get_suite().note_only_descendant();
}

TestSpeed Test::get_speed() const {
    const auto slow = get_slow();

    if (get_duration() > slow) {
        return TestSpeed::Slow;
    }

    if (get_duration() > slow / 2) {
        return TestSpeed::Medium;
    }

    return TestSpeed::Fast;
}

namespace {

std::string hook_title(HookPhase phase, const std::optional<std::string>& name) {
    if (name && !name->empty()) {
        return fmt::format("\"{}\" hook: {}", phase, *name);
    }

    return fmt::format("\"{}\" hook", phase);
}

} // namespace

Hook::Hook(HookPhase phase, Body body, Suite& suite, const std::optional<std::string>& name)
    : Runnable{hook_title(phase, name), std::move(body), &suite}
    , phase_{phase} {}

} // namespace grader
