#include "core/notify/NotificationMetrics.hpp"
#include <algorithm>

namespace herald {

QVariantMap PerformanceMetrics::toVariantMap() const
{
    QVariantMap m;
    m["totalScheduled"] = static_cast<qulonglong>(totalScheduled);
    m["totalCancelled"] = static_cast<qulonglong>(totalCancelled);
    m["totalErrors"] = static_cast<qulonglong>(totalErrors);
    m["poolHits"] = static_cast<qulonglong>(poolHits);
    m["poolMisses"] = static_cast<qulonglong>(poolMisses);
    m["poolHitRate"] = poolHitRate();
    m["dispatcherDrops"] = static_cast<qulonglong>(dispatcherDrops);
    m["saveCount"] = static_cast<qulonglong>(saveCount);
    m["averageSaveTimeMs"] = averageSaveTimeMs;
    m["maxSaveTimeMs"] = maxSaveTimeMs;
    m["startTime"] = startTime.toString(Qt::ISODate);
    return m;
}

NotificationMetrics::NotificationMetrics()
{
    aggregate_.startTime = QDateTime::currentDateTimeUtc();
}

void NotificationMetrics::recordSaveTime(double ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    saveSumMs_ += ms;
    ++aggregate_.saveCount;
    aggregate_.averageSaveTimeMs = saveSumMs_ / static_cast<double>(aggregate_.saveCount);
    aggregate_.maxSaveTimeMs = std::max(aggregate_.maxSaveTimeMs, ms);
}

void NotificationMetrics::fold()
{
    const uint64_t scheduled = pendingScheduled_.exchange(0, std::memory_order_relaxed);
    const uint64_t cancelled = pendingCancelled_.exchange(0, std::memory_order_relaxed);
    const uint64_t errors = pendingErrors_.exchange(0, std::memory_order_relaxed);
    const uint64_t hits = pendingHits_.exchange(0, std::memory_order_relaxed);
    const uint64_t misses = pendingMisses_.exchange(0, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    aggregate_.totalScheduled += scheduled;
    aggregate_.totalCancelled += cancelled;
    aggregate_.totalErrors += errors;
    aggregate_.poolHits += hits;
    aggregate_.poolMisses += misses;
}

void NotificationMetrics::setDispatcherDrops(uint64_t drops)
{
    std::lock_guard<std::mutex> lock(mutex_);
    aggregate_.dispatcherDrops = drops;
}

PerformanceMetrics NotificationMetrics::snapshot()
{
    fold();
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregate_;
}

void NotificationMetrics::reset()
{
    pendingScheduled_.store(0);
    pendingCancelled_.store(0);
    pendingErrors_.store(0);
    pendingHits_.store(0);
    pendingMisses_.store(0);

    std::lock_guard<std::mutex> lock(mutex_);
    aggregate_ = PerformanceMetrics{};
    aggregate_.startTime = QDateTime::currentDateTimeUtc();
    saveSumMs_ = 0.0;
}

} // namespace herald
