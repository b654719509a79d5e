#include <grader/core/runnable.hpp>

#include <grader/core/suite.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace grader {

namespace {

constexpr std::chrono::milliseconds MAX_TIMEOUT{std::numeric_limits<int>::max()};

} // namespace

std::chrono::milliseconds clamp_timeout(std::chrono::milliseconds timeout) {
    return std::clamp(timeout, std::chrono::milliseconds{0}, MAX_TIMEOUT);
}

bool is_timeout_enabled(std::chrono::milliseconds timeout) {
    auto clamped = clamp_timeout(timeout);
    return clamped.count() != 0 && clamped != MAX_TIMEOUT;
}

Runnable::Runnable(std::string title, std::optional<Body> body, Suite* parent)
    : title_{std::move(title)}
    , body_{std::move(body)}
    , parent_{parent} {}

std::vector<std::string> Runnable::get_title_path() const {
    std::vector<std::string> path;

    if (parent_ != nullptr) {
        path = parent_->get_title_path();
    }

    path.push_back(title_);

    return path;
}

std::string Runnable::get_full_title() const {
    return fmt::format("{}", fmt::join(get_title_path(), " "));
}

void Runnable::set_timeout(std::chrono::milliseconds timeout) {
    config_.timeout = clamp_timeout(timeout);
}

std::chrono::milliseconds Runnable::get_timeout() const {
    if (config_.timeout) {
        return *config_.timeout;
    }

    return parent_ != nullptr ? parent_->get_timeout() : DEFAULT_TIMEOUT;
}

void Runnable::set_slow(std::chrono::milliseconds slow) {
    config_.slow = std::max(slow, std::chrono::milliseconds{0});
}

std::chrono::milliseconds Runnable::get_slow() const {
    if (config_.slow) {
        return *config_.slow;
    }

    return parent_ != nullptr ? parent_->get_slow() : DEFAULT_SLOW;
}

void Runnable::set_retries(int retries) {
    // Negative means "inherit"
    if (retries < 0) {
        config_.retries.reset();
        return;
    }

    config_.retries = retries;
}

int Runnable::get_retries() const {
    if (config_.retries) {
        return *config_.retries;
    }

    return parent_ != nullptr ? parent_->get_retries() : DEFAULT_RETRIES;
}

bool Runnable::is_pending() const {
    return marked_pending_ || !body_.has_value() || (parent_ != nullptr && parent_->is_pending());
}

void Runnable::reset() {
    state_ = RunnableState::Unset;
    duration_ = std::chrono::milliseconds{0};
    failure_.reset();
    current_retry_ = 0;
}

} // namespace grader
