#include "core/notify/ReturnNotificationPolicy.hpp"
#include <boost/log/trivial.hpp>

namespace herald {

QJsonObject ReturnNotificationConfig::toJson() const
{
    QJsonObject obj;
    obj["enabled"] = enabled;
    obj["title"] = title;
    obj["body"] = body;
    obj["hours_before"] = hoursBeforeNotification;
    obj["repeating"] = repeating;
    obj["repeat_interval"] = repeatIntervalName(repeatInterval);
    obj["identifier"] = identifier;
    return obj;
}

ReturnNotificationConfig ReturnNotificationConfig::fromJson(const QJsonObject& obj)
{
    ReturnNotificationConfig c;
    c.enabled = obj.value("enabled").toBool(c.enabled);
    c.title = obj.value("title").toString(c.title);
    c.body = obj.value("body").toString(c.body);
    c.hoursBeforeNotification = obj.value("hours_before").toInt(c.hoursBeforeNotification);
    c.repeating = obj.value("repeating").toBool(c.repeating);
    c.repeatInterval = repeatIntervalFromName(obj.value("repeat_interval").toString(), c.repeatInterval);
    c.identifier = obj.value("identifier").toString(c.identifier);
    if (c.identifier.isEmpty())
        c.identifier = ReturnNotificationConfig{}.identifier;
    return c;
}

ReturnNotificationPolicy::ReturnNotificationPolicy(INotificationScheduler* scheduler,
                                                   WallClockFn wallNow,
                                                   MonotonicFn monoNow)
    : scheduler_(scheduler)
    , wallNow_(std::move(wallNow))
    , monoNow_(std::move(monoNow))
{
}

void ReturnNotificationPolicy::configure(const ReturnNotificationConfig& config)
{
    QMutexLocker lock(&mutex_);
    config_ = config;
    BOOST_LOG_TRIVIAL(info) << "[ReturnNotificationPolicy] Configured: "
                            << (config.enabled ? "enabled" : "disabled") << ", "
                            << config.hoursBeforeNotification << "h before notification";
}

ReturnNotificationConfig ReturnNotificationPolicy::config() const
{
    QMutexLocker lock(&mutex_);
    return config_;
}

void ReturnNotificationPolicy::setEnabled(bool enabled)
{
    QString identifier;
    {
        QMutexLocker lock(&mutex_);
        config_.enabled = enabled;
        identifier = config_.identifier;
    }
    if (!enabled && scheduler_)
        scheduler_->cancel(identifier);
}

NotificationDescriptor ReturnNotificationPolicy::returnDescriptor() const
{
    const ReturnNotificationConfig c = config();
    NotificationDescriptor d;
    d.title = c.title;
    d.body = c.body;
    d.fireDelaySeconds = static_cast<qint64>(c.hoursBeforeNotification) * 3600;
    d.identifier = c.identifier;
    d.repeats = c.repeating;
    d.repeatInterval = c.repeatInterval;
    d.groupKey = groupKey();
    return d;
}

NotificationDescriptor ReturnNotificationPolicy::urgentDescriptor() const
{
    const ReturnNotificationConfig c = config();
    NotificationDescriptor d;
    d.title = QStringLiteral("Long time no see!");
    d.body = QStringLiteral("Special rewards waiting for you!");
    d.fireDelaySeconds = kUrgentDelaySeconds;
    d.identifier = c.urgentIdentifier();
    d.groupKey = groupKey();
    return d;
}

void ReturnNotificationPolicy::onBackground()
{
    recordForeground();

    const ReturnNotificationConfig c = config();
    if (!c.enabled || !scheduler_) return;

    scheduler_->cancel(c.identifier);
    if (!scheduler_->schedule(returnDescriptor())) {
        BOOST_LOG_TRIVIAL(warning) << "[ReturnNotificationPolicy] Failed to schedule return notification";
        return;
    }
    BOOST_LOG_TRIVIAL(info) << "[ReturnNotificationPolicy] Return notification scheduled in "
                            << c.hoursBeforeNotification << "h";
}

bool ReturnNotificationPolicy::onForeground()
{
    const ReturnNotificationConfig c = config();
    const bool hadTimestamp = lastForeground().isValid();
    const double hours = hoursSinceLastForeground();

    if (scheduler_) {
        scheduler_->cancel(c.identifier);
        scheduler_->cancel(c.urgentIdentifier());
    }

    bool urgent = false;
    if (c.enabled && hadTimestamp && hours >= c.hoursBeforeNotification && scheduler_) {
        urgent = scheduler_->schedule(urgentDescriptor());
        BOOST_LOG_TRIVIAL(info) << "[ReturnNotificationPolicy] Inactive for " << hours
                                << "h, urgent notification " << (urgent ? "scheduled" : "failed");
    }

    recordForeground();
    return urgent;
}

double ReturnNotificationPolicy::hoursSinceLastForeground()
{
    const auto mono = monoNow();
    QMutexLocker lock(&mutex_);

    if (cacheValid_ && mono - cachedAt_ <= kHoursCacheTtl)
        return cachedHours_;

    if (!lastForeground_.isValid()) {
        cachedHours_ = 0.0;
    } else {
        const qint64 secs = lastForeground_.secsTo(wallNow());
        cachedHours_ = secs > 0 ? static_cast<double>(secs) / 3600.0 : 0.0;
    }
    cachedAt_ = mono;
    cacheValid_ = true;
    return cachedHours_;
}

QDateTime ReturnNotificationPolicy::lastForeground() const
{
    QMutexLocker lock(&mutex_);
    return lastForeground_;
}

void ReturnNotificationPolicy::setLastForeground(const QDateTime& when)
{
    QMutexLocker lock(&mutex_);
    lastForeground_ = when;
    cacheValid_ = false;
}

void ReturnNotificationPolicy::recordForeground()
{
    const QDateTime now = wallNow();
    QMutexLocker lock(&mutex_);
    lastForeground_ = now;
    cacheValid_ = false;
}

} // namespace herald
