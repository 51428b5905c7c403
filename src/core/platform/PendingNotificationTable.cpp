#include "core/platform/PendingNotificationTable.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace herald {

namespace {
constexpr qint64 kMaxTimerSliceMs = 24LL * 60 * 60 * 1000;
}

PendingNotificationTable::PendingNotificationTable(QObject* parent)
    : PendingNotificationTable(kDefaultMaxDelivered, parent)
{
}

PendingNotificationTable::PendingNotificationTable(int maxDelivered, QObject* parent)
    : QObject(parent)
    , maxDelivered_(std::max(1, maxDelivered))
{
}

PendingNotificationTable::~PendingNotificationTable() = default;

void PendingNotificationTable::arm(const QString& platformId, const NotificationDescriptor& descriptor,
                                   const QDateTime& fireAt, NextFireFn nextFire)
{
    remove(platformId);
    forgetDelivered(platformId);

    Slot slot;
    slot.entry = Entry{platformId, descriptor, fireAt, std::move(nextFire)};
    slot.timer = new QTimer(this);
    slot.timer->setSingleShot(true);
    slot.timer->setTimerType(Qt::PreciseTimer);
    connect(slot.timer, &QTimer::timeout, this, [this, platformId]() { onTimeout(platformId); });

    startTimer(slot);
    pending_.insert(platformId, slot);
}

bool PendingNotificationTable::remove(const QString& platformId)
{
    auto it = pending_.find(platformId);
    if (it == pending_.end()) return false;
    // deleteLater: remove() may run from inside this timer's own timeout
    it->timer->stop();
    it->timer->deleteLater();
    pending_.erase(it);
    return true;
}

void PendingNotificationTable::clear()
{
    for (auto& slot : pending_) {
        slot.timer->stop();
        slot.timer->deleteLater();
    }
    pending_.clear();
}

bool PendingNotificationTable::forgetDelivered(const QString& platformId)
{
    if (!delivered_.remove(platformId)) return false;
    deliveredOrder_.erase(std::remove(deliveredOrder_.begin(), deliveredOrder_.end(), platformId),
                          deliveredOrder_.end());
    return true;
}

void PendingNotificationTable::clearDelivered()
{
    delivered_.clear();
    deliveredOrder_.clear();
}

void PendingNotificationTable::markDelivered(const QString& platformId)
{
    if (delivered_.contains(platformId)) return;
    delivered_.insert(platformId);
    deliveredOrder_.push_back(platformId);
    while (static_cast<int>(deliveredOrder_.size()) > maxDelivered_) {
        delivered_.remove(deliveredOrder_.front());
        deliveredOrder_.pop_front();
    }
}

std::optional<PendingNotificationTable::Entry> PendingNotificationTable::entry(const QString& platformId) const
{
    auto it = pending_.constFind(platformId);
    if (it == pending_.constEnd()) return std::nullopt;
    return it->entry;
}

QString PendingNotificationTable::platformIdFor(const QString& identifier) const
{
    for (auto it = pending_.cbegin(); it != pending_.cend(); ++it) {
        if (it->entry.descriptor.identifier == identifier)
            return it.key();
    }
    return {};
}

void PendingNotificationTable::startTimer(Slot& slot)
{
    const qint64 remaining = QDateTime::currentDateTimeUtc().msecsTo(slot.entry.fireAt);
    const qint64 interval = std::clamp<qint64>(remaining, 0, kMaxTimerSliceMs);
    slot.timer->start(static_cast<int>(interval));
}

void PendingNotificationTable::onTimeout(const QString& platformId)
{
    auto it = pending_.find(platformId);
    if (it == pending_.end()) return;

    if (QDateTime::currentDateTimeUtc() < it->entry.fireAt) {
        startTimer(*it);
        return;
    }

    const NotificationDescriptor descriptor = it->entry.descriptor;
    if (it->entry.nextFire) {
        it->entry.fireAt = it->entry.nextFire(it->entry.fireAt);
        startTimer(*it);
        BOOST_LOG_TRIVIAL(debug) << "[PendingNotificationTable] '" << descriptor.identifier.toStdString()
                                 << "' re-armed for "
                                 << it->entry.fireAt.toString(Qt::ISODate).toStdString();
    } else {
        it->timer->deleteLater();
        pending_.erase(it);
    }
    markDelivered(platformId);

    emit fired(descriptor, platformId);
}

} // namespace herald
