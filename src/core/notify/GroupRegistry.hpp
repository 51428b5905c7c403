#pragma once

#include <QHash>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>
#include <functional>

namespace herald {

/// Secondary index from group key to the identifiers tagged with it.
/// Holds no ownership over the scheduled notifications; groups that
/// become empty are pruned immediately.
/// Thread-safe. The registry lock is never held while a callback runs.
class GroupRegistry {
public:
    using CancelFn = std::function<void(const QString& identifier)>;

    void addToGroup(const QString& groupKey, const QString& identifier);

    /// Removes the identifier from every group it belongs to.
    void removeFromAllGroups(const QString& identifier);

    QStringList membersOf(const QString& groupKey) const;
    int countOf(const QString& groupKey) const;
    int groupCount() const;
    QStringList groupKeys() const;

    /// Snapshots the members under the lock, releases it, then calls
    /// cancelFn once per member. Returns the number of members visited.
    int cancelGroup(const QString& groupKey, const CancelFn& cancelFn);

    void clear();

private:
    mutable QMutex mutex_;
    QHash<QString, QSet<QString>> groups_;
};

} // namespace herald
