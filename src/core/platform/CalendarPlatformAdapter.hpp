#pragma once

#include "core/platform/IPlatformAdapter.hpp"
#include "core/platform/PendingNotificationTable.hpp"
#include <QDateTime>

namespace herald {

/// Calendar-trigger backend (64 pending max). One-shot notifications use a
/// time-interval trigger; daily repeats fire at a fixed hour:minute:second
/// and weekly repeats at a fixed weekday and hour:minute. Platform id is the
/// caller identifier, so re-scheduling an identifier replaces the request.
class CalendarPlatformAdapter : public IPlatformAdapter {
    Q_OBJECT
public:
    static constexpr int kMaxPending = 64;

    struct CalendarTrigger {
        RepeatInterval interval = RepeatInterval::None;
        int weekday = 0;   // 1 = Monday .. 7 = Sunday, weekly only
        int hour = 0;
        int minute = 0;
        int second = 0;    // daily only
    };

    explicit CalendarPlatformAdapter(bool permissionGranted = true,
                                     bool autoIncrementBadge = true,
                                     QObject* parent = nullptr);

    PlatformKind kind() const override { return PlatformKind::Calendar; }
    QString name() const override { return QStringLiteral("calendar"); }
    int maxPending() const override { return kMaxPending; }
    int pendingCount() const override { return table_.count(); }

    bool initialize() override;

    PlatformResult schedule(const NotificationDescriptor& descriptor) override;
    bool cancel(const QString& identifier, const QString& platformId) override;
    void cancelAllScheduled() override;
    void cancelAllDisplayed() override;

    bool hasPermission() const override { return permissionGranted_; }
    void requestPermission(PermissionCallback callback) override;
    PlatformStatus queryStatus(const QString& platformId) const override;

    /// Changes the grant state (settings change, test hook). Emits
    /// permissionChanged when it differs.
    void setPermissionGranted(bool granted);

    int badgeCount() const { return badgeCount_; }
    void setBadgeCount(int count);
    bool autoIncrementBadge() const { return autoIncrementBadge_; }
    void setAutoIncrementBadge(bool enabled) { autoIncrementBadge_ = enabled; }

    /// Badge a notification would carry if scheduled now. Advances the
    /// counter exactly as schedule() does.
    int nextBadgeFor(const NotificationDescriptor& descriptor);

    /// Badge recorded with the pending request, -1 if none.
    int badgeOf(const QString& platformId) const { return badges_.value(platformId, -1); }

    static CalendarTrigger triggerFor(RepeatInterval interval, const QDateTime& fireAt);
    static QDateTime nextOccurrence(const CalendarTrigger& trigger, const QDateTime& after);

private:
    PendingNotificationTable table_;
    QHash<QString, int> badges_;
    bool permissionGranted_;
    bool autoIncrementBadge_;
    int badgeCount_ = 0;
    bool initialized_ = false;
};

} // namespace herald
