#include "core/notify/NotificationDescriptor.hpp"
#include <QUuid>

namespace herald {

QString repeatIntervalName(RepeatInterval interval)
{
    switch (interval) {
    case RepeatInterval::None: return QStringLiteral("none");
    case RepeatInterval::Daily: return QStringLiteral("daily");
    case RepeatInterval::Weekly: return QStringLiteral("weekly");
    case RepeatInterval::Custom: return QStringLiteral("custom");
    }
    return QStringLiteral("none");
}

RepeatInterval repeatIntervalFromName(const QString& name, RepeatInterval fallback)
{
    const QString n = name.trimmed().toLower();
    if (n == "none") return RepeatInterval::None;
    if (n == "daily") return RepeatInterval::Daily;
    if (n == "weekly") return RepeatInterval::Weekly;
    if (n == "custom") return RepeatInterval::Custom;
    return fallback;
}

void NotificationDescriptor::reset()
{
    *this = NotificationDescriptor{};
}

void NotificationDescriptor::copyFrom(const NotificationDescriptor& other)
{
    *this = other;
}

QStringList validationProblems(const NotificationDescriptor& d)
{
    QStringList problems;
    if (d.title.isEmpty())
        problems << QStringLiteral("missing title");
    if (d.body.isEmpty())
        problems << QStringLiteral("missing body");
    if (d.fireDelaySeconds < 0)
        problems << QStringLiteral("invalid fire time: %1").arg(d.fireDelaySeconds);
    else if (d.fireDelaySeconds > NotificationDescriptor::kMaxFireDelaySeconds)
        problems << QStringLiteral("fire time beyond one year: %1").arg(d.fireDelaySeconds);
    return problems;
}

QString validationMessage(const NotificationDescriptor& descriptor)
{
    return validationProblems(descriptor).join(QStringLiteral(", "));
}

QString generateIdentifier()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace herald
