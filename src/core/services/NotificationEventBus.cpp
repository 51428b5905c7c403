#include "NotificationEventBus.hpp"
#include <QMetaObject>
#include <boost/log/trivial.hpp>
#include <memory>

namespace herald {

NotificationEventBus::NotificationEventBus(int poolCapacity, QObject* parent)
    : QObject(parent)
    , pool_(poolCapacity)
{
}

int NotificationEventBus::subscribe(Callback callback)
{
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    subscriptions_.insert(id, std::move(callback));
    return id;
}

void NotificationEventBus::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    subscriptions_.remove(subscriptionId);
}

void NotificationEventBus::clear()
{
    QMutexLocker lock(&mutex_);
    subscriptions_.clear();
}

int NotificationEventBus::subscriberCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(subscriptions_.size());
}

int NotificationEventBus::failedDeliveries() const
{
    QMutexLocker lock(&mutex_);
    return failedDeliveries_;
}

void NotificationEventBus::publish(NotificationEventType type, const QString& identifier,
                                   const QString& title, const QString& body,
                                   const NotificationError& error)
{
    QList<Callback> callbacks;
    {
        QMutexLocker lock(&mutex_);
        callbacks = subscriptions_.values();  // copy callbacks while holding lock
    }
    if (callbacks.isEmpty()) return;

    // Pooled record; returns to the pool after delivery, freed if the call is dropped.
    auto holder = std::make_shared<std::unique_ptr<NotificationEvent>>(pool_.acquire());
    NotificationEvent& evt = **holder;
    evt.type = type;
    evt.identifier = identifier;
    evt.title = title;
    evt.body = body;
    evt.timestamp = QDateTime::currentDateTimeUtc();
    evt.error = error;

    // Deliver on the dispatcher thread via QueuedConnection
    QMetaObject::invokeMethod(this, [this, holder, callbacks]() {
        const NotificationEvent& e = **holder;
        for (const auto& cb : callbacks) {
            try {
                cb(e);
            } catch (const std::exception& ex) {
                {
                    QMutexLocker lock(&mutex_);
                    ++failedDeliveries_;
                }
                BOOST_LOG_TRIVIAL(error) << "[NotificationEventBus] Subscriber threw on "
                                         << eventTypeName(e.type) << ": " << ex.what();
            }
        }
        pool_.release(std::move(*holder));
    }, Qt::QueuedConnection);
}

} // namespace herald
