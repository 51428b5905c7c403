#pragma once

#include "core/notify/INotificationScheduler.hpp"
#include "core/notify/NotificationDescriptor.hpp"
#include <QDateTime>
#include <QJsonObject>
#include <QMutex>
#include <chrono>
#include <functional>

namespace herald {

struct ReturnNotificationConfig {
    bool enabled = true;
    QString title = QStringLiteral("We miss you!");
    QString body = QStringLiteral("Come back and claim your rewards!");
    int hoursBeforeNotification = 24;
    bool repeating = false;
    RepeatInterval repeatInterval = RepeatInterval::Daily;
    QString identifier = QStringLiteral("return_notification");

    QString urgentIdentifier() const { return identifier + QStringLiteral("_urgent"); }

    QJsonObject toJson() const;
    static ReturnNotificationConfig fromJson(const QJsonObject& obj);

    bool operator==(const ReturnNotificationConfig& o) const
    {
        return enabled == o.enabled && title == o.title && body == o.body
            && hoursBeforeNotification == o.hoursBeforeNotification && repeating == o.repeating
            && repeatInterval == o.repeatInterval && identifier == o.identifier;
    }
};

/**
 * Schedules a "come back" notification when the app goes to the
 * background and an urgent variant when it returns after the inactivity
 * threshold was already exceeded.
 *
 * Lifecycle hooks run on the dispatcher thread. hoursSinceLastForeground()
 * may be called from any thread; it is cached for 60s on the monotonic
 * clock and the cache is dropped whenever the timestamp changes.
 */
class ReturnNotificationPolicy {
public:
    using WallClockFn = std::function<QDateTime()>;
    using MonotonicFn = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr int kUrgentDelaySeconds = 60;
    static constexpr std::chrono::seconds kHoursCacheTtl{60};

    explicit ReturnNotificationPolicy(INotificationScheduler* scheduler,
                                      WallClockFn wallNow = nullptr,
                                      MonotonicFn monoNow = nullptr);

    static QString groupKey() { return QStringLiteral("return_group"); }

    void configure(const ReturnNotificationConfig& config);
    ReturnNotificationConfig config() const;

    /// Disabling also cancels the pending return notification.
    void setEnabled(bool enabled);

    void onBackground();

    /// Returns true when the urgent variant was scheduled.
    bool onForeground();

    double hoursSinceLastForeground();

    QDateTime lastForeground() const;

    /// Restores a persisted timestamp without touching schedules.
    void setLastForeground(const QDateTime& when);

    NotificationDescriptor returnDescriptor() const;
    NotificationDescriptor urgentDescriptor() const;

private:
    void recordForeground();
    QDateTime wallNow() const { return wallNow_ ? wallNow_() : QDateTime::currentDateTimeUtc(); }
    std::chrono::steady_clock::time_point monoNow() const
    {
        return monoNow_ ? monoNow_() : std::chrono::steady_clock::now();
    }

    INotificationScheduler* scheduler_;
    WallClockFn wallNow_;
    MonotonicFn monoNow_;

    mutable QMutex mutex_;
    ReturnNotificationConfig config_;
    QDateTime lastForeground_;
    double cachedHours_ = 0.0;
    bool cacheValid_ = false;
    std::chrono::steady_clock::time_point cachedAt_{};
};

} // namespace herald
