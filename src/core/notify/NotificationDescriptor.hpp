#pragma once

#include <QString>
#include <QStringList>
#include <QMetaType>

namespace herald {

enum class RepeatInterval {
    None,
    Daily,
    Weekly,
    Custom
};

QString repeatIntervalName(RepeatInterval interval);
RepeatInterval repeatIntervalFromName(const QString& name, RepeatInterval fallback = RepeatInterval::None);

/// One notification to schedule. Plain value type; pooled instances are
/// returned to their defaults with reset().
struct NotificationDescriptor {
    static constexpr qint64 kMaxFireDelaySeconds = 365LL * 24 * 60 * 60;

    QString title;
    QString body;
    QString subtitle;
    qint64 fireDelaySeconds = 0;
    QString smallIcon = QStringLiteral("icon_0");
    QString largeIcon = QStringLiteral("icon_1");
    QString identifier;
    bool repeats = false;
    RepeatInterval repeatInterval = RepeatInterval::None;
    QString soundName = QStringLiteral("default");
    QString groupKey = QStringLiteral("default_group");
    int customBadgeCount = -1;

    bool isValid() const
    {
        return !title.isEmpty() && !body.isEmpty() && fireDelaySeconds >= 0;
    }

    bool hasBadgeOverride() const { return customBadgeCount >= 0; }

    void reset();
    void copyFrom(const NotificationDescriptor& other);
};

/// Lists every problem with the descriptor, empty when it may be scheduled.
/// Covers isValid() plus the one-year fire delay ceiling.
QStringList validationProblems(const NotificationDescriptor& descriptor);

/// Problems joined into one line, e.g. "missing title, invalid fire time: -5".
QString validationMessage(const NotificationDescriptor& descriptor);

/// Fresh identifier for descriptors scheduled without one.
QString generateIdentifier();

} // namespace herald

Q_DECLARE_METATYPE(herald::NotificationDescriptor)
