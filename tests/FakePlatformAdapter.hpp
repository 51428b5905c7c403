#pragma once

#include "core/platform/IPlatformAdapter.hpp"
#include <QHash>
#include <QMetaObject>
#include <QSet>

/// In-memory backend with failure injection. Platform ids are "p<N>".
class FakePlatformAdapter : public herald::IPlatformAdapter {
    Q_OBJECT
public:
    explicit FakePlatformAdapter(int maxPending = 64, QObject* parent = nullptr)
        : IPlatformAdapter(parent), maxPending_(maxPending) {}

    herald::PlatformKind kind() const override { return herald::PlatformKind::AbsoluteTime; }
    QString name() const override { return QStringLiteral("fake"); }
    int maxPending() const override { return maxPending_; }
    int pendingCount() const override { return pending_.size(); }

    bool initialize() override
    {
        ++initializeCalls;
        return initializeResult;
    }

    herald::PlatformResult schedule(const herald::NotificationDescriptor& d) override
    {
        ++scheduleCalls;
        if (failSchedule) {
            return herald::PlatformResult::failure(herald::ErrorKind::Platform, "schedule",
                                                   QStringLiteral("injected failure"));
        }
        const QString id = QStringLiteral("p%1").arg(nextId_++);
        pending_.insert(id, d);
        return herald::PlatformResult::success(id);
    }

    bool cancel(const QString&, const QString& platformId) override
    {
        ++cancelCalls;
        return pending_.remove(platformId) > 0;
    }

    void cancelAllScheduled() override { pending_.clear(); }
    void cancelAllDisplayed() override
    {
        ++cancelDisplayedCalls;
        delivered_.clear();
    }

    bool hasPermission() const override { return permission_; }

    void requestPermission(PermissionCallback callback) override
    {
        ++permissionRequests;
        if (!answerPermission) return;
        const bool granted = permission_;
        QMetaObject::invokeMethod(this, [callback, granted]() {
            if (callback) callback(granted);
        }, Qt::QueuedConnection);
    }

    herald::PlatformStatus queryStatus(const QString& platformId) const override
    {
        if (pending_.contains(platformId)) return herald::PlatformStatus::Scheduled;
        if (delivered_.contains(platformId)) return herald::PlatformStatus::Delivered;
        return herald::PlatformStatus::NotFound;
    }

    void setPermission(bool granted)
    {
        if (permission_ == granted) return;
        permission_ = granted;
        emit permissionChanged(granted);
    }

    /// Delivers a pending one-shot request as if its time had come.
    bool fire(const QString& platformId)
    {
        auto it = pending_.find(platformId);
        if (it == pending_.end()) return false;
        const herald::NotificationDescriptor d = it.value();
        pending_.erase(it);
        delivered_.insert(platformId);
        emit notificationFired(d.identifier, d.title, d.body, d.subtitle);
        return true;
    }

    const QHash<QString, herald::NotificationDescriptor>& pending() const { return pending_; }

    bool failSchedule = false;
    bool initializeResult = true;
    bool answerPermission = true;
    int scheduleCalls = 0;
    int cancelCalls = 0;
    int cancelDisplayedCalls = 0;
    int initializeCalls = 0;
    int permissionRequests = 0;

private:
    int maxPending_;
    int nextId_ = 1;
    bool permission_ = true;
    QHash<QString, herald::NotificationDescriptor> pending_;
    QSet<QString> delivered_;
};
