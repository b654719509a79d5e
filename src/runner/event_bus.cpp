#include <grader/runner/event_bus.hpp>

#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/runner/events.hpp>

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/remove_if.hpp>

#include <exception>
#include <utility>
#include <vector>

namespace grader {

EventBus::SubscriptionId EventBus::subscribe(EventKind kind, Handler handler) {
    subscriptions_.push_back({.id = next_id_, .kind = kind, .handler = std::move(handler)});
    return next_id_++;
}

EventBus::SubscriptionId EventBus::subscribe_all(Handler handler) {
    subscriptions_.push_back({.id = next_id_, .kind = std::nullopt, .handler = std::move(handler)});
    return next_id_++;
}

void EventBus::unsubscribe(SubscriptionId id) {
    auto removed = ranges::remove_if(subscriptions_, [id](const Subscription& sub) { return sub.id == id; });
    subscriptions_.erase(removed, subscriptions_.end());
}

void EventBus::emit(const Event& event) const {
    LOG_TRACE("Emitting {}", event.kind);

    // Handlers may subscribe or unsubscribe while we dispatch. Those subscribed now don't see
    // this event; those removed now are skipped.
    std::vector<SubscriptionId> ids;
    ids.reserve(subscriptions_.size());
    for (const Subscription& sub : subscriptions_) {
        if (!sub.kind || *sub.kind == event.kind) {
            ids.push_back(sub.id);
        }
    }

    for (SubscriptionId id : ids) {
        auto iter = ranges::find(subscriptions_, id, &Subscription::id);
        if (iter == subscriptions_.end()) {
            continue;
        }

        // Copied, as the handler may unsubscribe itself
        Handler handler = iter->handler;

        try {
            handler(event);
        } catch (const std::exception& ex) {
            LOG_ERROR("Event handler for {} threw: {}", event.kind, ex.what());
        } catch (...) {
            LOG_ERROR("Event handler for {} threw: {}", event.kind,
                      describe_failure(std::current_exception()).message);
        }
    }
}

} // namespace grader
