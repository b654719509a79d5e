#include <grader/runner/reporter.hpp>

#include <grader/runner/event_bus.hpp>
#include <grader/runner/events.hpp>

#include <libassert/assert.hpp>

namespace grader {

Reporter::~Reporter() {
    detach();
}

void Reporter::attach(EventBus& bus) {
    detach();

    bus_ = &bus;
    subscription_ = bus.subscribe_all([this](const Event& event) { dispatch(event); });
}

void Reporter::detach() {
    if (bus_ != nullptr && subscription_) {
        bus_->unsubscribe(*subscription_);
    }

    bus_ = nullptr;
    subscription_.reset();
}

void Reporter::dispatch(const Event& event) {
    switch (event.kind) {
    case EventKind::RunBegin:
        ASSERT(event.stats != nullptr);
        on_run_begin(*event.stats);
        break;
    case EventKind::SuiteBegin:
        ASSERT(event.suite != nullptr);
        on_suite_begin(*event.suite);
        break;
    case EventKind::SuiteEnd:
        ASSERT(event.suite != nullptr);
        on_suite_end(*event.suite);
        break;
    case EventKind::TestBegin:
        ASSERT(event.test != nullptr);
        on_test_begin(*event.test);
        break;
    case EventKind::TestRetry:
        ASSERT(event.test != nullptr && event.failure != nullptr);
        on_test_retry(*event.test, *event.failure);
        break;
    case EventKind::TestEnd:
        ASSERT(event.test != nullptr);
        on_test_end(*event.test, event.hook);
        break;
    case EventKind::HookFailed:
        ASSERT(event.hook != nullptr && event.failure != nullptr);
        on_hook_failed(*event.hook, *event.failure);
        break;
    case EventKind::RunnableError: {
        ASSERT(event.failure != nullptr);
        const Runnable* runnable = event.hook != nullptr ? static_cast<const Runnable*>(event.hook) : event.test;
        ASSERT(runnable != nullptr);
        on_runnable_error(*runnable, *event.failure);
        break;
    }
    case EventKind::RunEnd:
        ASSERT(event.stats != nullptr);
        on_run_end(*event.stats);
        break;
    }
}

} // namespace grader
