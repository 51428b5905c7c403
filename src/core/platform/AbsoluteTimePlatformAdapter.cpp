#include "core/platform/AbsoluteTimePlatformAdapter.hpp"
#include <QMetaObject>
#include <boost/log/trivial.hpp>

namespace herald {

QString channelImportanceName(ChannelImportance importance)
{
    switch (importance) {
    case ChannelImportance::Low: return QStringLiteral("low");
    case ChannelImportance::Default: return QStringLiteral("default");
    case ChannelImportance::High: return QStringLiteral("high");
    }
    return QStringLiteral("default");
}

ChannelImportance channelImportanceFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "low") return ChannelImportance::Low;
    if (n == "high") return ChannelImportance::High;
    return ChannelImportance::Default;
}

AbsoluteTimePlatformAdapter::AbsoluteTimePlatformAdapter(const ChannelConfig& channel,
                                                         bool permissionGranted,
                                                         QObject* parent)
    : IPlatformAdapter(parent)
    , channel_(channel)
    , permissionGranted_(permissionGranted)
{
    connect(&table_, &PendingNotificationTable::fired, this,
            [this](const NotificationDescriptor& d, const QString&) {
                emit notificationFired(d.identifier, d.title, d.body, d.subtitle);
            });
}

bool AbsoluteTimePlatformAdapter::initialize()
{
    if (channelRegistered_) return true;

    if (channel_.id.isEmpty()) {
        BOOST_LOG_TRIVIAL(error) << "[AbsoluteTimePlatformAdapter] Cannot register channel with empty id";
        return false;
    }

    registered_ = channel_;
    channelRegistered_ = true;
    BOOST_LOG_TRIVIAL(info) << "[AbsoluteTimePlatformAdapter] Registered channel '"
                            << registered_.id.toStdString() << "' (" << registered_.name.toStdString()
                            << ", importance " << channelImportanceName(registered_.importance).toStdString() << ")";
    return true;
}

qint64 AbsoluteTimePlatformAdapter::repeatIntervalMs(RepeatInterval interval)
{
    switch (interval) {
    case RepeatInterval::Daily: return 24LL * 60 * 60 * 1000;
    case RepeatInterval::Weekly: return 7LL * 24 * 60 * 60 * 1000;
    case RepeatInterval::None:
    case RepeatInterval::Custom:
        break;
    }
    return 0;
}

PlatformResult AbsoluteTimePlatformAdapter::schedule(const NotificationDescriptor& descriptor)
{
    if (!channelRegistered_) {
        return PlatformResult::failure(ErrorKind::Platform, "schedule",
                                       QStringLiteral("channel '%1' is not registered").arg(channel_.id));
    }

    // Same identifier replaces the earlier request.
    QString platformId = table_.platformIdFor(descriptor.identifier);
    if (platformId.isEmpty() && table_.count() >= kMaxPending) {
        return PlatformResult::failure(ErrorKind::CapacityExceeded, "schedule",
                                       QStringLiteral("absolute-time backend holds %1 pending requests").arg(kMaxPending));
    }
    if (platformId.isEmpty())
        platformId = QString::number(nextId_++);

    const QDateTime fireAt = QDateTime::currentDateTimeUtc().addSecs(descriptor.fireDelaySeconds);
    const qint64 repeatMs = descriptor.repeats ? repeatIntervalMs(descriptor.repeatInterval) : 0;

    PendingNotificationTable::NextFireFn nextFire;
    if (repeatMs > 0)
        nextFire = [repeatMs](const QDateTime& last) { return last.addMSecs(repeatMs); };

    table_.arm(platformId, descriptor, fireAt, std::move(nextFire));

    BOOST_LOG_TRIVIAL(debug) << "[AbsoluteTimePlatformAdapter] Scheduled '" << descriptor.identifier.toStdString()
                             << "' as #" << platformId.toStdString() << " at "
                             << fireAt.toString(Qt::ISODate).toStdString()
                             << (repeatMs > 0 ? " (repeating)" : "");
    return PlatformResult::success(platformId);
}

bool AbsoluteTimePlatformAdapter::cancel(const QString& identifier, const QString& platformId)
{
    const QString key = platformId.isEmpty() ? table_.platformIdFor(identifier) : platformId;
    if (key.isEmpty()) return false;
    return table_.remove(key);
}

void AbsoluteTimePlatformAdapter::cancelAllScheduled()
{
    table_.clear();
}

void AbsoluteTimePlatformAdapter::cancelAllDisplayed()
{
    table_.clearDelivered();
}

void AbsoluteTimePlatformAdapter::requestPermission(PermissionCallback callback)
{
    QMetaObject::invokeMethod(this, [this, callback]() {
        if (callback) callback(permissionGranted_);
    }, Qt::QueuedConnection);
}

PlatformStatus AbsoluteTimePlatformAdapter::queryStatus(const QString& platformId) const
{
    if (table_.contains(platformId)) return PlatformStatus::Scheduled;
    if (table_.isDelivered(platformId)) return PlatformStatus::Delivered;
    return PlatformStatus::NotFound;
}

void AbsoluteTimePlatformAdapter::setPermissionGranted(bool granted)
{
    if (permissionGranted_ == granted) return;
    permissionGranted_ = granted;
    BOOST_LOG_TRIVIAL(info) << "[AbsoluteTimePlatformAdapter] Permission " << (granted ? "granted" : "revoked");
    emit permissionChanged(granted);
}

void AbsoluteTimePlatformAdapter::setChannelConfig(const ChannelConfig& config)
{
    if (config == channel_) return;
    channel_ = config;
    if (channelRegistered_) {
        BOOST_LOG_TRIVIAL(warning) << "[AbsoluteTimePlatformAdapter] Channel config changed after registration, "
                                      "restart to apply";
    }
}

} // namespace herald
