#pragma once

#include <grader/common/class_traits.hpp>
#include <grader/runner/event_bus.hpp>
#include <grader/runner/events.hpp>
#include <grader/runner/stats.hpp>

namespace grader {

/// Derives ``Stats`` from the event stream of a run
class StatsCollector : NonMovable
{
public:
    /// Subscribes to ``bus``; must be detached before ``bus`` is destroyed if it outlives it
    explicit StatsCollector(EventBus& bus);
    ~StatsCollector();

    const Stats& get_stats() const { return stats_; }

private:
    void on_event(const Event& event);

    EventBus* bus_;
    EventBus::SubscriptionId subscription_;
    Stats stats_;
};

} // namespace grader
