#include "core/platform/CalendarPlatformAdapter.hpp"
#include <QMetaObject>
#include <boost/log/trivial.hpp>

namespace herald {

CalendarPlatformAdapter::CalendarPlatformAdapter(bool permissionGranted,
                                                 bool autoIncrementBadge,
                                                 QObject* parent)
    : IPlatformAdapter(parent)
    , permissionGranted_(permissionGranted)
    , autoIncrementBadge_(autoIncrementBadge)
{
    connect(&table_, &PendingNotificationTable::fired, this,
            [this](const NotificationDescriptor& d, const QString& platformId) {
                if (!table_.contains(platformId))
                    badges_.remove(platformId);
                emit notificationFired(d.identifier, d.title, d.body, d.subtitle);
            });
}

bool CalendarPlatformAdapter::initialize()
{
    if (initialized_) return true;
    initialized_ = true;
    BOOST_LOG_TRIVIAL(info) << "[CalendarPlatformAdapter] Initialized (max pending " << kMaxPending
                            << ", auto-increment badge " << (autoIncrementBadge_ ? "on" : "off") << ")";
    return true;
}

CalendarPlatformAdapter::CalendarTrigger CalendarPlatformAdapter::triggerFor(RepeatInterval interval,
                                                                             const QDateTime& fireAt)
{
    CalendarTrigger t;
    t.interval = interval;
    const QTime time = fireAt.time();
    t.hour = time.hour();
    t.minute = time.minute();
    if (interval == RepeatInterval::Weekly)
        t.weekday = fireAt.date().dayOfWeek();
    else
        t.second = time.second();
    return t;
}

QDateTime CalendarPlatformAdapter::nextOccurrence(const CalendarTrigger& trigger, const QDateTime& after)
{
    const QTime time(trigger.hour, trigger.minute, trigger.second);
    const QDateTime local = after.toLocalTime();
    QDateTime candidate(local.date(), time);

    if (trigger.interval == RepeatInterval::Weekly) {
        while (candidate.date().dayOfWeek() != trigger.weekday || candidate <= local)
            candidate = candidate.addDays(1);
        return candidate;
    }

    while (candidate <= local)
        candidate = candidate.addDays(1);
    return candidate;
}

int CalendarPlatformAdapter::nextBadgeFor(const NotificationDescriptor& descriptor)
{
    if (descriptor.hasBadgeOverride()) {
        if (!autoIncrementBadge_)
            badgeCount_ = descriptor.customBadgeCount;
        return descriptor.customBadgeCount;
    }
    if (autoIncrementBadge_)
        return ++badgeCount_;
    return badgeCount_;
}

PlatformResult CalendarPlatformAdapter::schedule(const NotificationDescriptor& descriptor)
{
    const QString platformId = descriptor.identifier;
    if (platformId.isEmpty())
        return PlatformResult::failure(ErrorKind::Platform, "schedule", "request identifier is empty");

    if (!table_.contains(platformId) && table_.count() >= kMaxPending) {
        return PlatformResult::failure(ErrorKind::CapacityExceeded, "schedule",
                                       QStringLiteral("calendar backend holds %1 pending requests").arg(kMaxPending));
    }

    const QDateTime fireAt = QDateTime::currentDateTime().addSecs(descriptor.fireDelaySeconds);

    PendingNotificationTable::NextFireFn nextFire;
    if (descriptor.repeats && (descriptor.repeatInterval == RepeatInterval::Daily
                               || descriptor.repeatInterval == RepeatInterval::Weekly)) {
        const CalendarTrigger trigger = triggerFor(descriptor.repeatInterval, fireAt);
        nextFire = [trigger](const QDateTime& last) { return nextOccurrence(trigger, last); };
    }

    const int badge = nextBadgeFor(descriptor);
    table_.arm(platformId, descriptor, fireAt, std::move(nextFire));
    badges_.insert(platformId, badge);

    BOOST_LOG_TRIVIAL(debug) << "[CalendarPlatformAdapter] Scheduled '" << platformId.toStdString()
                             << "' in " << descriptor.fireDelaySeconds << "s (badge " << badge
                             << ", repeat " << repeatIntervalName(descriptor.repeats ? descriptor.repeatInterval
                                                                                     : RepeatInterval::None).toStdString()
                             << ")";
    return PlatformResult::success(platformId);
}

bool CalendarPlatformAdapter::cancel(const QString& identifier, const QString& platformId)
{
    const QString key = platformId.isEmpty() ? identifier : platformId;
    badges_.remove(key);
    return table_.remove(key);
}

void CalendarPlatformAdapter::cancelAllScheduled()
{
    table_.clear();
    badges_.clear();
}

void CalendarPlatformAdapter::cancelAllDisplayed()
{
    table_.clearDelivered();
    badgeCount_ = 0;
}

void CalendarPlatformAdapter::requestPermission(PermissionCallback callback)
{
    QMetaObject::invokeMethod(this, [this, callback]() {
        if (callback) callback(permissionGranted_);
    }, Qt::QueuedConnection);
}

PlatformStatus CalendarPlatformAdapter::queryStatus(const QString& platformId) const
{
    if (table_.contains(platformId)) return PlatformStatus::Scheduled;
    if (table_.isDelivered(platformId)) return PlatformStatus::Delivered;
    return PlatformStatus::NotFound;
}

void CalendarPlatformAdapter::setPermissionGranted(bool granted)
{
    if (permissionGranted_ == granted) return;
    permissionGranted_ = granted;
    BOOST_LOG_TRIVIAL(info) << "[CalendarPlatformAdapter] Permission " << (granted ? "granted" : "revoked");
    emit permissionChanged(granted);
}

void CalendarPlatformAdapter::setBadgeCount(int count)
{
    badgeCount_ = count < 0 ? 0 : count;
}

} // namespace herald
