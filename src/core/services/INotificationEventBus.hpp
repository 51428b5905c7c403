#pragma once

#include "core/notify/NotificationEvent.hpp"
#include <functional>

namespace herald {

/// Publish/subscribe stream of notification events.
/// Subscribers are invoked on the dispatcher thread (Qt::QueuedConnection).
class INotificationEventBus {
public:
    virtual ~INotificationEventBus() = default;

    using Callback = std::function<void(const NotificationEvent& event)>;

    /// Returns a subscription ID for unsubscribe. Thread-safe.
    virtual int subscribe(Callback callback) = 0;

    /// Thread-safe.
    virtual void unsubscribe(int subscriptionId) = 0;

    /// Thread-safe (can be called from any thread). Delivery is deferred.
    virtual void publish(NotificationEventType type, const QString& identifier = {},
                         const QString& title = {}, const QString& body = {},
                         const NotificationError& error = {}) = 0;
};

} // namespace herald
