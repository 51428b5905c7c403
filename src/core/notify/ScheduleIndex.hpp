#pragma once

#include <QHash>
#include <QList>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <list>
#include <optional>

namespace herald {

class GroupRegistry;

struct IndexEntry {
    QString identifier;
    QString platformId;
    QString groupKey;

    bool operator==(const IndexEntry& o) const
    {
        return identifier == o.identifier && platformId == o.platformId && groupKey == o.groupKey;
    }
};

/**
 * ScheduleIndex: bounded map from caller identifier to platform id.
 *
 * Insertion order is kept in a linked list so the oldest entry can be
 * evicted in O(1) once maxTracked is reached. Re-inserting an existing
 * identifier is an update: the old entry is dropped and the new one goes
 * to the tail.
 *
 * Thread safety: mutations take the write lock, queries the read lock.
 * Group updates run inside the index write lock, so the registry always
 * agrees with the index. Locks are taken index first, then registry;
 * GroupRegistry never calls back into the index.
 */
class ScheduleIndex {
public:
    explicit ScheduleIndex(int maxTracked = 100, GroupRegistry* groups = nullptr);

    /// Returns the entry evicted to make room, if any.
    std::optional<IndexEntry> insert(const QString& identifier, const QString& platformId,
                                     const QString& groupKey = QString());

    /// Returns the platform id of the removed entry, nullopt if untracked.
    std::optional<QString> remove(const QString& identifier);

    int count() const;
    bool contains(const QString& identifier) const;
    std::optional<QString> platformIdOf(const QString& identifier) const;
    std::optional<IndexEntry> entryOf(const QString& identifier) const;

    /// Identifiers oldest first.
    QStringList identifiers() const;

    /// Copy of every entry, oldest first.
    QList<IndexEntry> snapshot() const;

    /// Replaces the contents with entries (oldest first), trimming to maxTracked.
    void restore(const QList<IndexEntry>& entries);

    void clear();

    int maxTracked() const { return maxTracked_; }

private:
    struct Slot {
        QString platformId;
        QString groupKey;
        std::list<QString>::iterator order;
    };

    mutable QReadWriteLock lock_;
    const int maxTracked_;
    GroupRegistry* groups_;
    QHash<QString, Slot> slots_;
    std::list<QString> order_;
};

} // namespace herald
