#pragma once

#include <grader/common/class_traits.hpp>
#include <grader/exceptions.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace grader {

/// Completion state for one attempt of one runnable.
///
/// The first call to ``complete`` settles the attempt. Any further call is recorded as a
/// ``MultipleCompletionError`` instead of overwriting the settled result. Once abandoned (the
/// attempt timed out), every later call is ignored.
///
/// Thread safe; shared between the runner and any ``Done`` handles through a shared_ptr.
class Completion : NonMovable
{
public:
    explicit Completion(std::string runnable_title);

    void complete(std::exception_ptr error = nullptr);

    /// Returns whether the attempt was settled before ``deadline``
    bool wait_until(std::chrono::steady_clock::time_point deadline);
    void wait();

    /// Stop accepting completions.
    /// Returns false if the attempt had already been settled, in which case nothing changes.
    bool abandon();

    bool is_complete() const;

    std::exception_ptr get_error() const;

    /// Extra completions recorded since the last call
    std::vector<Failure> take_extra_completions();

private:
    std::string runnable_title_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool completed_ = false;
    bool abandoned_ = false;
    std::exception_ptr error_;
    std::vector<Failure> extra_completions_;
};

/// Handle passed to explicit-completion bodies. Cheap to copy, and may be called from any thread.
class Done
{
public:
    explicit Done(std::shared_ptr<Completion> completion)
        : completion_{std::move(completion)} {}

    void operator()() const { completion_->complete(); }

    void operator()(std::exception_ptr error) const { completion_->complete(std::move(error)); }

    /// Complete with an ``AssertionError`` carrying ``message``
    void fail(const std::string& message) const;

private:
    std::shared_ptr<Completion> completion_;
};

} // namespace grader
