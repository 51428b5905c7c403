#include "core/notify/ScheduleIndex.hpp"
#include "core/notify/GroupRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace herald {

ScheduleIndex::ScheduleIndex(int maxTracked, GroupRegistry* groups)
    : maxTracked_(maxTracked > 0 ? maxTracked : 1)
    , groups_(groups)
{
}

std::optional<IndexEntry> ScheduleIndex::insert(const QString& identifier,
                                                const QString& platformId,
                                                const QString& groupKey)
{
    if (identifier.isEmpty()) return std::nullopt;

    std::optional<IndexEntry> evicted;
    bool replaced = false;
    {
        QWriteLocker lock(&lock_);

        auto existing = slots_.find(identifier);
        if (existing != slots_.end()) {
            order_.erase(existing->order);
            slots_.erase(existing);
            replaced = true;
        }

        if (static_cast<int>(slots_.size()) >= maxTracked_ && !order_.empty()) {
            const QString oldest = order_.front();
            order_.pop_front();
            auto it = slots_.find(oldest);
            if (it != slots_.end()) {
                evicted = IndexEntry{oldest, it->platformId, it->groupKey};
                slots_.erase(it);
            }
        }

        order_.push_back(identifier);
        slots_.insert(identifier, Slot{platformId, groupKey, std::prev(order_.end())});

        // Lock order is index then registry.
        if (groups_) {
            if (replaced)
                groups_->removeFromAllGroups(identifier);
            if (evicted)
                groups_->removeFromAllGroups(evicted->identifier);
            if (!groupKey.isEmpty())
                groups_->addToGroup(groupKey, identifier);
        }
    }

    if (evicted) {
        BOOST_LOG_TRIVIAL(info) << "[ScheduleIndex] Max tracked notifications reached ("
                                << maxTracked_ << "), evicted '"
                                << evicted->identifier.toStdString() << "'";
    }
    return evicted;
}

std::optional<QString> ScheduleIndex::remove(const QString& identifier)
{
    QWriteLocker lock(&lock_);
    auto it = slots_.find(identifier);
    if (it == slots_.end()) return std::nullopt;

    const QString platformId = it->platformId;
    order_.erase(it->order);
    slots_.erase(it);

    if (groups_) groups_->removeFromAllGroups(identifier);
    return platformId;
}

int ScheduleIndex::count() const
{
    QReadLocker lock(&lock_);
    return static_cast<int>(slots_.size());
}

bool ScheduleIndex::contains(const QString& identifier) const
{
    QReadLocker lock(&lock_);
    return slots_.contains(identifier);
}

std::optional<QString> ScheduleIndex::platformIdOf(const QString& identifier) const
{
    QReadLocker lock(&lock_);
    auto it = slots_.constFind(identifier);
    if (it == slots_.constEnd()) return std::nullopt;
    return it->platformId;
}

std::optional<IndexEntry> ScheduleIndex::entryOf(const QString& identifier) const
{
    QReadLocker lock(&lock_);
    auto it = slots_.constFind(identifier);
    if (it == slots_.constEnd()) return std::nullopt;
    return IndexEntry{identifier, it->platformId, it->groupKey};
}

QStringList ScheduleIndex::identifiers() const
{
    QReadLocker lock(&lock_);
    QStringList ids;
    ids.reserve(static_cast<int>(order_.size()));
    for (const auto& id : order_)
        ids.append(id);
    return ids;
}

QList<IndexEntry> ScheduleIndex::snapshot() const
{
    QReadLocker lock(&lock_);
    QList<IndexEntry> entries;
    entries.reserve(static_cast<int>(order_.size()));
    for (const auto& id : order_) {
        const Slot& slot = slots_[id];
        entries.append(IndexEntry{id, slot.platformId, slot.groupKey});
    }
    return entries;
}

void ScheduleIndex::restore(const QList<IndexEntry>& entries)
{
    clear();
    for (const auto& e : entries)
        insert(e.identifier, e.platformId, e.groupKey);
}

void ScheduleIndex::clear()
{
    QWriteLocker lock(&lock_);
    if (groups_) {
        for (const auto& id : order_)
            groups_->removeFromAllGroups(id);
    }
    slots_.clear();
    order_.clear();
}

} // namespace herald
