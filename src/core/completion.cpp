#include <grader/core/completion.hpp>

#include <grader/exceptions.hpp>
#include <grader/logging.hpp>

#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace grader {

Completion::Completion(std::string runnable_title)
    : runnable_title_{std::move(runnable_title)} {}

void Completion::complete(std::exception_ptr error) {
    {
        std::lock_guard lock{mutex_};

        if (abandoned_) {
            LOG_DEBUG("Ignoring late completion of {:?}", runnable_title_);
            return;
        }

        if (completed_) {
            std::optional<std::string> reason;
            if (error) {
                reason = describe_failure(error).message;
            }
            extra_completions_.push_back(describe_failure(MultipleCompletionError{runnable_title_, reason}));
            return;
        }

        completed_ = true;
        error_ = std::move(error);
    }

    cv_.notify_all();
}

bool Completion::wait_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock{mutex_};
    return cv_.wait_until(lock, deadline, [this] { return completed_; });
}

void Completion::wait() {
    std::unique_lock lock{mutex_};
    cv_.wait(lock, [this] { return completed_; });
}

bool Completion::abandon() {
    std::lock_guard lock{mutex_};

    if (completed_) {
        return false;
    }

    abandoned_ = true;
    return true;
}

bool Completion::is_complete() const {
    std::lock_guard lock{mutex_};
    return completed_;
}

std::exception_ptr Completion::get_error() const {
    std::lock_guard lock{mutex_};
    return error_;
}

std::vector<Failure> Completion::take_extra_completions() {
    std::lock_guard lock{mutex_};
    return std::exchange(extra_completions_, {});
}

void Done::fail(const std::string& message) const {
    completion_->complete(std::make_exception_ptr(AssertionError{message}));
}

} // namespace grader
