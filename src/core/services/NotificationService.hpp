#pragma once

#include "INotificationService.hpp"
#include "NotificationEventBus.hpp"
#include "core/HeraldConfig.hpp"
#include "core/notify/CancellationToken.hpp"
#include "core/notify/CircuitBreaker.hpp"
#include "core/notify/GroupRegistry.hpp"
#include "core/notify/INotificationScheduler.hpp"
#include "core/notify/MainThreadDispatcher.hpp"
#include "core/notify/NotificationBuilder.hpp"
#include "core/notify/NotificationMetrics.hpp"
#include "core/notify/ObjectPool.hpp"
#include "core/notify/PersistentStore.hpp"
#include "core/notify/ReturnNotificationPolicy.hpp"
#include "core/notify/ScheduleIndex.hpp"
#include "core/platform/IPlatformAdapter.hpp"
#include <QDateTime>
#include <QList>
#include <QObject>
#include <QTimer>
#include <atomic>
#include <memory>

namespace herald {

/**
 * NotificationService: the composition root. Owns the platform adapter,
 * the schedule index with its group registry, the circuit breaker, the
 * persistent store and the return-notification policy, and exposes the
 * command, query and async surfaces over them.
 *
 * Commands must run on the dispatcher thread (the thread that owns the
 * MainThreadDispatcher). Queries are safe from any thread. The *Async
 * wrappers marshal onto the dispatcher and block the caller; they throw
 * TimeoutError, QueueFullError or OperationCancelledError.
 */
class NotificationService : public QObject,
                            public INotificationService,
                            public INotificationScheduler {
    Q_OBJECT
public:
    using PermissionCallback = IPlatformAdapter::PermissionCallback;

    NotificationService(const HeraldConfig& config, MainThreadDispatcher* dispatcher,
                        std::unique_ptr<IPlatformAdapter> platform, QObject* parent = nullptr);
    ~NotificationService() override;

    /// Loads the store, initializes the backend, requests permission and
    /// starts the timers. Idempotent.
    bool initialize();

    /// Stops the timers and writes the final snapshot within the
    /// configured budget. Commands fail afterwards.
    void shutdown();

    bool isInitialized() const { return initialized_.load(); }
    bool isShutDown() const { return shutDown_.load(); }

    // --- Commands (dispatcher thread) ---

    bool schedule(const NotificationDescriptor& descriptor) override;

    /// Convenience front ends. Return the identifier used, or an empty
    /// string when scheduling failed.
    QString send(const QString& title, const QString& body, qint64 delaySeconds,
                 const QString& identifier = {});
    QString send(const QString& title, const QString& body, int days, int hours,
                 int minutes, int seconds, const QString& identifier = {});
    QString sendAt(const QString& title, const QString& body, const QDateTime& when,
                   const QString& identifier = {});
    QString sendRepeating(const QString& title, const QString& body, qint64 delaySeconds,
                          RepeatInterval interval, const QString& identifier = {});

    NotificationBuilder createNotification() { return NotificationBuilder(this); }

    /// Schedules at most limits.max_batch descriptors; the rest is skipped.
    /// Returns the number scheduled.
    int scheduleBatch(const QList<NotificationDescriptor>& descriptors);

    bool cancel(const QString& identifier) override;
    int cancelBatch(const QStringList& identifiers);
    int cancelGroup(const QString& groupKey) override;
    void cancelAllScheduled() override;
    void cancelAllDisplayed() override;
    void cancelAll();

    void configureReturnNotification(const ReturnNotificationConfig& config);
    void setReturnNotificationEnabled(bool enabled);
    ReturnNotificationConfig returnNotificationConfig() const { return returnPolicy_.config(); }

    /// Absolute-time backend only.
    bool setChannelConfig(const ChannelConfig& config);
    /// Calendar backend only.
    bool setBadgeCount(int count);

    void onApplicationBackgrounded();
    void onApplicationForegrounded();

    /// Drops index entries the backend no longer reports as Scheduled.
    int cleanupExpired();

    void requestPermission(PermissionCallback callback = nullptr);

    /// Writes the snapshot now, bypassing the debounce.
    bool flushNow();

    // --- Queries (any thread) ---

    int count() const override;
    int countByGroup(const QString& groupKey) const override;
    QStringList membersOf(const QString& groupKey) const override;
    QStringList allIdentifiers() const;
    bool isScheduled(const QString& identifier) const override;

    /// "Scheduled", "Delivered", "Unknown" or "Not Found".
    QString statusOf(const QString& identifier) const;

    bool hasPermission() const override { return lastPermission_.load(); }
    PerformanceMetrics metrics();
    /// Zeroes every counter and restarts the metrics clock.
    void resetMetrics();
    QVariantMap debugInfo() const override;
    double hoursSinceLastForeground();

    /// Reapplies the Boost.Log filter; false for an unknown level name.
    bool setLogLevel(const QString& level);

    // --- Async (any thread, blocks the caller) ---

    bool scheduleAsync(const NotificationDescriptor& descriptor,
                       const CancellationToken& token = CancellationToken::none());
    bool cancelAsync(const QString& identifier,
                     const CancellationToken& token = CancellationToken::none());
    int countAsync(const CancellationToken& token = CancellationToken::none());
    int scheduleBatchAsync(const QList<NotificationDescriptor>& descriptors,
                           const CancellationToken& token = CancellationToken::none());
    int cancelBatchAsync(const QStringList& identifiers,
                         const CancellationToken& token = CancellationToken::none());
    bool flushAsync(const CancellationToken& token = CancellationToken::none());

    /// Waits for the backend's authorization result (async.permission_timeout_ms).
    /// On the dispatcher thread it cannot wait and returns the cached state.
    bool requestPermissionAsync(const CancellationToken& token = CancellationToken::none());

    // --- Components ---

    IPlatformAdapter* platform() const { return platform_.get(); }
    MainThreadDispatcher* dispatcher() const { return dispatcher_; }
    NotificationEventBus* events() { return &events_; }
    PersistentStore* store() { return &store_; }
    CircuitBreaker* circuitBreaker() { return &breaker_; }
    const ScheduleIndex& index() const { return index_; }
    const GroupRegistry& groups() const { return groups_; }

public slots:
    /// The user activated a delivered notification.
    void notificationTapped(const QString& identifier);

signals:
    void notificationReceived(const QString& identifier, const QString& title,
                              const QString& body, const QString& subtitle);

private:
    bool commandAllowed(const char* operation) const;
    bool scheduleOne(NotificationDescriptor& descriptor);
    void reportError(ErrorKind kind, const QString& operation, const QString& identifier,
                     const QString& message);
    void applyPermission(bool granted, bool announce);
    void refreshPermission();
    void onPlatformFired(const QString& identifier, const QString& title,
                         const QString& body, const QString& subtitle);
    void pollBreaker();
    void foldCounters();
    std::chrono::milliseconds asyncTimeout() const;
    StoreSnapshot currentSnapshot() const;

    HeraldConfig config_;
    MainThreadDispatcher* dispatcher_;
    std::unique_ptr<IPlatformAdapter> platform_;

    // groups_ must outlive index_, which removes members on clear/evict.
    GroupRegistry groups_;
    ScheduleIndex index_;
    CircuitBreaker breaker_;
    mutable NotificationMetrics metrics_;
    std::atomic<uint64_t> dropsAtReset_{0};
    ObjectPool<NotificationDescriptor> descriptorPool_;
    NotificationEventBus events_;
    PersistentStore store_;
    ReturnNotificationPolicy returnPolicy_;

    QTimer breakerTimer_;
    QTimer metricsTimer_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutDown_{false};
    std::atomic<bool> lastPermission_{false};
};

} // namespace herald
