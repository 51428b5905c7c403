#pragma once

#include "core/notify/NotificationDescriptor.hpp"
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace herald {

class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// Schedule a notification. Required: title, body, fireDelaySeconds >= 0.
    /// A missing identifier is generated. Re-using an identifier replaces
    /// the earlier notification. Dispatcher thread only.
    virtual bool schedule(const NotificationDescriptor& descriptor) = 0;

    /// Cancel by identifier. Returns false when it was not tracked.
    virtual bool cancel(const QString& identifier) = 0;

    /// Cancel every notification tagged with groupKey. Returns the count.
    virtual int cancelGroup(const QString& groupKey) = 0;

    virtual void cancelAllScheduled() = 0;
    virtual void cancelAllDisplayed() = 0;

    // Queries, any thread.
    virtual int count() const = 0;
    virtual int countByGroup(const QString& groupKey) const = 0;
    virtual QStringList membersOf(const QString& groupKey) const = 0;
    virtual bool isScheduled(const QString& identifier) const = 0;
    virtual bool hasPermission() const = 0;
    virtual QVariantMap debugInfo() const = 0;
};

} // namespace herald
