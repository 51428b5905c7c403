#pragma once

#include "core/notify/NotificationDescriptor.hpp"
#include <QDateTime>

namespace herald {

class INotificationService;

/// Fluent front end over INotificationService::schedule().
///
///   service.createNotification()
///       .withTitle("Daily reward")
///       .withBody("Your chest is ready")
///       .in(3600)
///       .repeating(RepeatInterval::Daily)
///       .schedule();
class NotificationBuilder {
public:
    explicit NotificationBuilder(INotificationService* service);

    NotificationBuilder& withTitle(const QString& title);
    NotificationBuilder& withBody(const QString& body);
    NotificationBuilder& withSubtitle(const QString& subtitle);
    NotificationBuilder& withIdentifier(const QString& identifier);
    NotificationBuilder& in(qint64 seconds);
    NotificationBuilder& in(int days, int hours, int minutes, int seconds);
    NotificationBuilder& at(const QDateTime& when);
    NotificationBuilder& repeating(RepeatInterval interval);
    NotificationBuilder& withSound(const QString& soundName);
    NotificationBuilder& withGroup(const QString& groupKey);
    NotificationBuilder& withBadge(int count);
    NotificationBuilder& withIcons(const QString& smallIcon, const QString& largeIcon);

    const NotificationDescriptor& descriptor() const { return descriptor_; }

    /// Fills in a generated identifier if none was given, then schedules.
    /// identifier() reports what was used.
    bool schedule();

    QString identifier() const { return descriptor_.identifier; }

private:
    INotificationService* service_;
    NotificationDescriptor descriptor_;
};

} // namespace herald
