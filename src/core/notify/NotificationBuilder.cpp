#include "core/notify/NotificationBuilder.hpp"
#include "core/services/INotificationService.hpp"
#include <boost/log/trivial.hpp>

namespace herald {

NotificationBuilder::NotificationBuilder(INotificationService* service)
    : service_(service)
{
}

NotificationBuilder& NotificationBuilder::withTitle(const QString& title)
{
    descriptor_.title = title;
    return *this;
}

NotificationBuilder& NotificationBuilder::withBody(const QString& body)
{
    descriptor_.body = body;
    return *this;
}

NotificationBuilder& NotificationBuilder::withSubtitle(const QString& subtitle)
{
    descriptor_.subtitle = subtitle;
    return *this;
}

NotificationBuilder& NotificationBuilder::withIdentifier(const QString& identifier)
{
    descriptor_.identifier = identifier;
    return *this;
}

NotificationBuilder& NotificationBuilder::in(qint64 seconds)
{
    descriptor_.fireDelaySeconds = seconds;
    return *this;
}

NotificationBuilder& NotificationBuilder::in(int days, int hours, int minutes, int seconds)
{
    descriptor_.fireDelaySeconds = static_cast<qint64>(days) * 86400
        + static_cast<qint64>(hours) * 3600
        + static_cast<qint64>(minutes) * 60
        + seconds;
    return *this;
}

NotificationBuilder& NotificationBuilder::at(const QDateTime& when)
{
    // A time in the past yields a negative delay and fails validation.
    descriptor_.fireDelaySeconds = QDateTime::currentDateTimeUtc().secsTo(when);
    return *this;
}

NotificationBuilder& NotificationBuilder::repeating(RepeatInterval interval)
{
    descriptor_.repeats = interval != RepeatInterval::None;
    descriptor_.repeatInterval = interval;
    return *this;
}

NotificationBuilder& NotificationBuilder::withSound(const QString& soundName)
{
    descriptor_.soundName = soundName;
    return *this;
}

NotificationBuilder& NotificationBuilder::withGroup(const QString& groupKey)
{
    descriptor_.groupKey = groupKey;
    return *this;
}

NotificationBuilder& NotificationBuilder::withBadge(int count)
{
    descriptor_.customBadgeCount = count;
    return *this;
}

NotificationBuilder& NotificationBuilder::withIcons(const QString& smallIcon, const QString& largeIcon)
{
    descriptor_.smallIcon = smallIcon;
    descriptor_.largeIcon = largeIcon;
    return *this;
}

bool NotificationBuilder::schedule()
{
    if (!service_) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationBuilder] No service to schedule on";
        return false;
    }
    if (descriptor_.identifier.isEmpty())
        descriptor_.identifier = generateIdentifier();
    return service_->schedule(descriptor_);
}

} // namespace herald
