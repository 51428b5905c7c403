#pragma once

#include "INotificationEventBus.hpp"
#include "core/notify/ObjectPool.hpp"
#include <QObject>
#include <QMutex>
#include <QMap>

namespace herald {

class NotificationEventBus : public QObject, public INotificationEventBus {
    Q_OBJECT
public:
    explicit NotificationEventBus(int poolCapacity = 10, QObject* parent = nullptr);

    int subscribe(Callback callback) override;
    void unsubscribe(int subscriptionId) override;
    void publish(NotificationEventType type, const QString& identifier = {},
                 const QString& title = {}, const QString& body = {},
                 const NotificationError& error = {}) override;

    void clear();
    int subscriberCount() const;

    /// Number of subscriber callbacks that threw.
    int failedDeliveries() const;

    ObjectPool<NotificationEvent>& pool() { return pool_; }

private:
    mutable QMutex mutex_;
    int nextId_ = 1;
    int failedDeliveries_ = 0;
    QMap<int, Callback> subscriptions_;
    ObjectPool<NotificationEvent> pool_;
};

} // namespace herald
