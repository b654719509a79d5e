#pragma once

#include <grader/common/class_traits.hpp>
#include <grader/core/hook.hpp>
#include <grader/core/runnable.hpp>
#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>
#include <grader/exceptions.hpp>
#include <grader/runner/event_bus.hpp>
#include <grader/runner/events.hpp>
#include <grader/runner/stats.hpp>

#include <optional>

namespace grader {

/// Base for anything that renders a run. Override only the callbacks of interest.
class Reporter : NonMovable
{
public:
    Reporter() = default;
    virtual ~Reporter();

    /// Start receiving events from ``bus``. The bus must outlive the reporter, or ``detach``
    /// must be called first.
    void attach(EventBus& bus);
    void detach();

    virtual void on_run_begin(const Stats& /*stats*/) {}

    virtual void on_suite_begin(const Suite& /*suite*/) {}

    virtual void on_suite_end(const Suite& /*suite*/) {}

    virtual void on_test_begin(const Test& /*test*/) {}

    virtual void on_test_retry(const Test& /*test*/, const Failure& /*failure*/) {}

    /// ``failing_hook`` is set if a "before each" hook failed the test
    virtual void on_test_end(const Test& /*test*/, const Hook* /*failing_hook*/) {}

    virtual void on_hook_failed(const Hook& /*hook*/, const Failure& /*failure*/) {}

    virtual void on_runnable_error(const Runnable& /*runnable*/, const Failure& /*failure*/) {}

    virtual void on_run_end(const Stats& /*stats*/) {}

private:
    void dispatch(const Event& event);

    EventBus* bus_ = nullptr;
    std::optional<EventBus::SubscriptionId> subscription_;
};

} // namespace grader
