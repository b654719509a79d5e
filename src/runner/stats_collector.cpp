#include <grader/runner/stats_collector.hpp>

#include <grader/core/runnable.hpp>
#include <grader/runner/event_bus.hpp>
#include <grader/runner/events.hpp>
#include <grader/runner/stats.hpp>

#include <chrono>

namespace grader {

StatsCollector::StatsCollector(EventBus& bus)
    : bus_{&bus}
    , subscription_{bus.subscribe_all([this](const Event& event) { on_event(event); })} {}

StatsCollector::~StatsCollector() {
    bus_->unsubscribe(subscription_);
}

void StatsCollector::on_event(const Event& event) {
    using std::chrono::system_clock;

    switch (event.kind) {
    case EventKind::RunBegin:
        stats_ = Stats{};
        stats_.total = event.stats != nullptr ? event.stats->total : 0;
        stats_.start = system_clock::now();
        break;

    case EventKind::SuiteBegin:
        if (event.suite != nullptr && !event.suite->is_root()) {
            ++stats_.suites;
        }
        break;

    case EventKind::TestEnd:
        ++stats_.tests;
        switch (event.test->get_state()) {
        case RunnableState::Passed:
            ++stats_.passes;
            break;
        case RunnableState::Failed:
            ++stats_.failures;
            break;
        case RunnableState::Pending:
            ++stats_.pending;
            break;
        case RunnableState::Unset:
            break;
        }
        break;

    case EventKind::HookFailed:
        ++stats_.hook_failures;
        break;

    case EventKind::RunEnd:
        stats_.end = system_clock::now();
        if (stats_.start) {
            stats_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(*stats_.end - *stats_.start);
        }
        break;

    default:
        break;
    }
}

} // namespace grader
