#pragma once

#include <grader/runner/events.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace grader {

/// Synchronous dispatch of lifecycle events to subscribers, in subscription order.
///
/// Subscribers are consumers only: an exception escaping a handler is logged and dropped so
/// that rendering problems can never change the outcome of a run.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::size_t;

    SubscriptionId subscribe(EventKind kind, Handler handler);

    SubscriptionId subscribe_all(Handler handler);

    void unsubscribe(SubscriptionId id);

    void emit(const Event& event) const;

    std::size_t num_subscribers() const { return subscriptions_.size(); }

private:
    struct Subscription
    {
        SubscriptionId id;
        std::optional<EventKind> kind; ///< nullopt = every kind
        Handler handler;
    };

    std::vector<Subscription> subscriptions_;
    SubscriptionId next_id_ = 0;
};

} // namespace grader
