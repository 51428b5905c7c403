#pragma once

#include <QDateTime>
#include <QVariantMap>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace herald {

/// Aggregate view handed to callers (metrics(), debugInfo()).
struct PerformanceMetrics {
    uint64_t totalScheduled = 0;
    uint64_t totalCancelled = 0;
    uint64_t totalErrors = 0;
    uint64_t poolHits = 0;
    uint64_t poolMisses = 0;
    uint64_t dispatcherDrops = 0;
    uint64_t saveCount = 0;
    double averageSaveTimeMs = 0.0;
    double maxSaveTimeMs = 0.0;
    QDateTime startTime;

    double poolHitRate() const
    {
        const uint64_t total = poolHits + poolMisses;
        return total > 0 ? static_cast<double>(poolHits) / static_cast<double>(total) : 0.0;
    }

    QVariantMap toVariantMap() const;
};

/**
 * NotificationMetrics: hot-path counters are lock-free atomics; fold()
 * moves them into the aggregate under a mutex once per flush interval.
 * Save timings keep a running average and maximum.
 */
class NotificationMetrics {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    NotificationMetrics();

    void recordScheduled() { pendingScheduled_.fetch_add(1, std::memory_order_relaxed); }
    void recordCancelled(uint64_t n = 1) { pendingCancelled_.fetch_add(n, std::memory_order_relaxed); }
    void recordError() { pendingErrors_.fetch_add(1, std::memory_order_relaxed); }
    void recordPoolCounters(uint64_t hits, uint64_t misses)
    {
        pendingHits_.fetch_add(hits, std::memory_order_relaxed);
        pendingMisses_.fetch_add(misses, std::memory_order_relaxed);
    }

    void recordSaveTime(double ms);

    /// Folds pending atomics into the aggregate.
    void fold();

    /// Dispatcher drops are owned by the dispatcher; it reports its total.
    void setDispatcherDrops(uint64_t drops);

    /// Folds, then returns a copy of the aggregate.
    PerformanceMetrics snapshot();

    void reset();

    static double msElapsed(TimePoint start, TimePoint end)
    {
        return std::chrono::duration<double, std::milli>(end - start).count();
    }

private:
    std::atomic<uint64_t> pendingScheduled_{0};
    std::atomic<uint64_t> pendingCancelled_{0};
    std::atomic<uint64_t> pendingErrors_{0};
    std::atomic<uint64_t> pendingHits_{0};
    std::atomic<uint64_t> pendingMisses_{0};

    std::mutex mutex_;
    PerformanceMetrics aggregate_;
    double saveSumMs_ = 0.0;
};

} // namespace herald
