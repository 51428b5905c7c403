#include "core/notify/GroupRegistry.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace herald {

void GroupRegistry::addToGroup(const QString& groupKey, const QString& identifier)
{
    if (groupKey.isEmpty() || identifier.isEmpty()) return;

    QMutexLocker lock(&mutex_);
    groups_[groupKey].insert(identifier);
}

void GroupRegistry::removeFromAllGroups(const QString& identifier)
{
    QMutexLocker lock(&mutex_);
    for (auto it = groups_.begin(); it != groups_.end();) {
        it->remove(identifier);
        if (it->isEmpty())
            it = groups_.erase(it);
        else
            ++it;
    }
}

QStringList GroupRegistry::membersOf(const QString& groupKey) const
{
    QMutexLocker lock(&mutex_);
    auto it = groups_.constFind(groupKey);
    if (it == groups_.constEnd()) return {};

    QStringList members(it->cbegin(), it->cend());
    std::sort(members.begin(), members.end());
    return members;
}

int GroupRegistry::countOf(const QString& groupKey) const
{
    QMutexLocker lock(&mutex_);
    auto it = groups_.constFind(groupKey);
    return it == groups_.constEnd() ? 0 : static_cast<int>(it->size());
}

int GroupRegistry::groupCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(groups_.size());
}

QStringList GroupRegistry::groupKeys() const
{
    QMutexLocker lock(&mutex_);
    QStringList keys = groups_.keys();
    std::sort(keys.begin(), keys.end());
    return keys;
}

int GroupRegistry::cancelGroup(const QString& groupKey, const CancelFn& cancelFn)
{
    QStringList members;
    {
        QMutexLocker lock(&mutex_);
        auto it = groups_.constFind(groupKey);
        if (it == groups_.constEnd()) {
            BOOST_LOG_TRIVIAL(debug) << "[GroupRegistry] cancelGroup: no group '"
                                     << groupKey.toStdString() << "'";
            return 0;
        }
        members = QStringList(it->cbegin(), it->cend());
    }

    for (const auto& id : members) {
        if (cancelFn) cancelFn(id);
    }

    BOOST_LOG_TRIVIAL(info) << "[GroupRegistry] Cancelled " << members.size()
                            << " notification(s) in group '" << groupKey.toStdString() << "'";
    return static_cast<int>(members.size());
}

void GroupRegistry::clear()
{
    QMutexLocker lock(&mutex_);
    groups_.clear();
}

} // namespace herald
