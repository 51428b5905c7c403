#pragma once

#include "core/notify/NotificationDescriptor.hpp"
#include "core/notify/NotificationError.hpp"
#include <QObject>
#include <QString>
#include <functional>

namespace herald {

enum class PlatformKind {
    Calendar,
    AbsoluteTime
};

enum class PlatformStatus {
    Unknown,
    Scheduled,
    Delivered,
    NotFound
};

inline const char* platformStatusName(PlatformStatus status)
{
    switch (status) {
    case PlatformStatus::Unknown: return "Unknown";
    case PlatformStatus::Scheduled: return "Scheduled";
    case PlatformStatus::Delivered: return "Delivered";
    case PlatformStatus::NotFound: return "Not Found";
    }
    return "Unknown";
}

struct PlatformResult {
    QString platformId;
    NotificationError error;

    bool ok() const { return !error.isError(); }

    static PlatformResult success(const QString& id) { return {id, {}}; }
    static PlatformResult failure(ErrorKind kind, const QString& op, const QString& message)
    {
        return {QString(), NotificationError{kind, op, message}};
    }
};

/// Capability set over one notification backend. Exactly one concrete
/// adapter is created at startup (see createPlatformAdapter()).
/// All methods must be called on the dispatcher thread.
class IPlatformAdapter : public QObject {
    Q_OBJECT
public:
    using PermissionCallback = std::function<void(bool granted)>;

    explicit IPlatformAdapter(QObject* parent = nullptr) : QObject(parent) {}
    ~IPlatformAdapter() override = default;

    virtual PlatformKind kind() const = 0;
    virtual QString name() const = 0;

    /// Hard cap on simultaneously pending notifications.
    virtual int maxPending() const = 0;
    virtual int pendingCount() const = 0;

    /// One-time backend setup (channel registration etc.). Idempotent.
    virtual bool initialize() = 0;

    virtual PlatformResult schedule(const NotificationDescriptor& descriptor) = 0;
    virtual bool cancel(const QString& identifier, const QString& platformId) = 0;
    virtual void cancelAllScheduled() = 0;
    virtual void cancelAllDisplayed() = 0;

    virtual bool hasPermission() const = 0;

    /// Resolves callback later on the dispatcher thread, never inline.
    virtual void requestPermission(PermissionCallback callback) = 0;

    virtual PlatformStatus queryStatus(const QString& platformId) const = 0;

signals:
    void notificationFired(const QString& identifier, const QString& title,
                           const QString& body, const QString& subtitle);
    void permissionChanged(bool granted);
};

} // namespace herald
