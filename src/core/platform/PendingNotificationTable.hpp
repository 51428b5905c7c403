#pragma once

#include "core/notify/NotificationDescriptor.hpp"
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QSet>
#include <QTimer>
#include <deque>
#include <functional>
#include <optional>

namespace herald {

/**
 * In-process stand-in for the OS scheduler queue both backends sit on.
 *
 * Each pending entry owns a single-shot QTimer. Timers are capped at one
 * day and re-armed until the fire time is reached, so delays of up to a
 * year work. An entry with a nextFire function is re-armed after firing
 * (repeat); otherwise it moves to the delivered (displayed) set. The
 * delivered set keeps at most maxDelivered ids, oldest dropped first.
 *
 * Lives on the dispatcher thread; not thread-safe.
 */
class PendingNotificationTable : public QObject {
    Q_OBJECT
public:
    using NextFireFn = std::function<QDateTime(const QDateTime& lastFire)>;

    struct Entry {
        QString platformId;
        NotificationDescriptor descriptor;
        QDateTime fireAt;
        NextFireFn nextFire;
    };

    static constexpr int kDefaultMaxDelivered = 256;

    explicit PendingNotificationTable(QObject* parent = nullptr);
    PendingNotificationTable(int maxDelivered, QObject* parent);
    ~PendingNotificationTable() override;

    /// Replaces any existing entry with the same platform id.
    void arm(const QString& platformId, const NotificationDescriptor& descriptor,
             const QDateTime& fireAt, NextFireFn nextFire = nullptr);

    bool remove(const QString& platformId);
    void clear();

    int count() const { return static_cast<int>(pending_.size()); }
    bool contains(const QString& platformId) const { return pending_.contains(platformId); }
    std::optional<Entry> entry(const QString& platformId) const;

    /// Platform id of the pending entry carrying identifier, empty if none.
    QString platformIdFor(const QString& identifier) const;

    bool isDelivered(const QString& platformId) const { return delivered_.contains(platformId); }
    int deliveredCount() const { return static_cast<int>(delivered_.size()); }
    int maxDelivered() const { return maxDelivered_; }
    bool forgetDelivered(const QString& platformId);
    void clearDelivered();

signals:
    void fired(const herald::NotificationDescriptor& descriptor, const QString& platformId);

private:
    struct Slot {
        Entry entry;
        QTimer* timer = nullptr;
    };

    void startTimer(Slot& slot);
    void onTimeout(const QString& platformId);
    void markDelivered(const QString& platformId);

    QHash<QString, Slot> pending_;
    QSet<QString> delivered_;
    std::deque<QString> deliveredOrder_;
    int maxDelivered_;
};

} // namespace herald
