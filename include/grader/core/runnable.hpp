#pragma once

#include <grader/common/class_traits.hpp>
#include <grader/core/completion.hpp>
#include <grader/exceptions.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace grader {

class Context;
class Suite;

enum class RunnableState { Unset, Passed, Failed, Pending };

constexpr std::string_view format_as(RunnableState state) {
    switch (state) {
    case RunnableState::Unset:
        return "unset";
    case RunnableState::Passed:
        return "passed";
    case RunnableState::Failed:
        return "failed";
    case RunnableState::Pending:
        return "pending";
    }

    return "<unknown>";
}

enum class RunnableType { Test, Hook };

/// Body that finishes when it returns
using SyncBody = std::function<void(Context&)>;
/// Body that finishes when the ``Done`` handle is invoked
using CallbackBody = std::function<void(Context&, Done)>;
/// Body that finishes when the returned future becomes ready
using AsyncBody = std::function<std::future<void>(Context&)>;

using Body = std::variant<SyncBody, CallbackBody, AsyncBody>;

/// Wrap ``func`` in the body kind matching its signature
template <typename Func>
Body make_body(Func&& func) {
    if constexpr (std::is_invocable_v<Func&, Context&, Done>) {
        return CallbackBody{std::forward<Func>(func)};
    } else if constexpr (std::is_invocable_r_v<std::future<void>, Func&, Context&> &&
                         !std::is_void_v<std::invoke_result_t<Func&, Context&>>) {
        return AsyncBody{std::forward<Func>(func)};
    } else {
        static_assert(std::is_invocable_v<Func&, Context&>,
                      "A body must be callable as void(Context&), void(Context&, Done) or "
                      "std::future<void>(Context&)");
        return SyncBody{std::forward<Func>(func)};
    }
}

/// Timeout, slow threshold and retry count. Unset values are inherited from the parent suite.
struct RunnableConfig
{
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> slow;
    std::optional<int> retries;
};

inline constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{2000};
inline constexpr std::chrono::milliseconds DEFAULT_SLOW{75};
inline constexpr int DEFAULT_RETRIES = 0;

/// Clamp a timeout to [0, INT_MAX] milliseconds
std::chrono::milliseconds clamp_timeout(std::chrono::milliseconds timeout);

/// 0 and INT_MAX both disable the deadline
bool is_timeout_enabled(std::chrono::milliseconds timeout);

/// Common base of tests and hooks: a titled body plus its configuration and latest outcome.
/// Owned by the suite it belongs to.
class Runnable : NonMovable
{
public:
    Runnable(std::string title, std::optional<Body> body, Suite* parent);
    virtual ~Runnable() = default;

    virtual RunnableType get_type() const = 0;

    const std::string& get_title() const { return title_; }

    /// Titles from the outermost titled suite down to this runnable
    std::vector<std::string> get_title_path() const;

    std::string get_full_title() const;

    const std::string& get_description() const { return description_; }

    void set_description(std::string description) { description_ = std::move(description); }

    const std::optional<Body>& get_body() const { return body_; }

    Suite* get_parent() const { return parent_; }

    void set_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds get_timeout() const;

    void set_slow(std::chrono::milliseconds slow);
    std::chrono::milliseconds get_slow() const;

    void set_retries(int retries);
    int get_retries() const;

    void mark_pending() { marked_pending_ = true; }

    /// Explicitly marked, missing a body, or inside a pending suite
    bool is_pending() const;

    RunnableState get_state() const { return state_; }

    void set_state(RunnableState state) { state_ = state; }

    std::chrono::milliseconds get_duration() const { return duration_; }

    void set_duration(std::chrono::milliseconds duration) { duration_ = duration; }

    const std::optional<Failure>& get_failure() const { return failure_; }

    void set_failure(std::optional<Failure> failure) { failure_ = std::move(failure); }

    int get_current_retry() const { return current_retry_; }

    void set_current_retry(int current_retry) { current_retry_ = current_retry; }

    /// Forget the outcome of any previous run. Configuration is kept.
    virtual void reset();

private:
    std::string title_;
    std::string description_;
    std::optional<Body> body_;
    Suite* parent_;

    RunnableConfig config_;
    bool marked_pending_ = false;

    RunnableState state_ = RunnableState::Unset;
    std::chrono::milliseconds duration_{0};
    std::optional<Failure> failure_;
    int current_retry_ = 0;
};

} // namespace grader
