#pragma once

#include "core/notify/NotificationError.hpp"
#include <QDateTime>
#include <QString>

namespace herald {

enum class NotificationEventType {
    Received,
    Tapped,
    PermissionGranted,
    PermissionDenied,
    Error
};

inline const char* eventTypeName(NotificationEventType type)
{
    switch (type) {
    case NotificationEventType::Received: return "Received";
    case NotificationEventType::Tapped: return "Tapped";
    case NotificationEventType::PermissionGranted: return "PermissionGranted";
    case NotificationEventType::PermissionDenied: return "PermissionDenied";
    case NotificationEventType::Error: return "Error";
    }
    return "Unknown";
}

struct NotificationEvent {
    NotificationEventType type = NotificationEventType::Received;
    QString identifier;
    QString title;
    QString body;
    QDateTime timestamp;
    NotificationError error;

    void reset() { *this = NotificationEvent{}; }
};

} // namespace herald

Q_DECLARE_METATYPE(herald::NotificationEvent)
