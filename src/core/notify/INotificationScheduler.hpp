#pragma once

#include "core/notify/NotificationDescriptor.hpp"
#include <QString>

namespace herald {

/// Scheduling primitives the return-notification policy drives.
/// Implemented by NotificationService; tests substitute a recorder.
class INotificationScheduler {
public:
    virtual ~INotificationScheduler() = default;

    virtual bool schedule(const NotificationDescriptor& descriptor) = 0;
    virtual bool cancel(const QString& identifier) = 0;
};

} // namespace herald
