#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace herald {

/**
 * ObjectPool: bounded LIFO recycling pool for short-lived records
 * (notification descriptors, event records).
 *
 * acquire() pops the most recently released object (hit) or allocates a
 * fresh one (miss). release() calls T::reset() and keeps the object only
 * while the free list is below capacity; otherwise it is destroyed.
 *
 * Thread safety: acquire/release from any thread, protected by mutex.
 * Hit/miss counters are lock-free and drained by takeCounters().
 */
template <typename T>
class ObjectPool {
public:
    struct Counters {
        uint64_t hits = 0;
        uint64_t misses = 0;
    };

    explicit ObjectPool(int capacity)
        : capacity_(capacity > 0 ? capacity : 0)
    {
        freeList_.reserve(static_cast<size_t>(capacity_));
    }

    std::unique_ptr<T> acquire()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!freeList_.empty()) {
                auto obj = std::move(freeList_.back());
                freeList_.pop_back();
                hits_.fetch_add(1, std::memory_order_relaxed);
                return obj;
            }
        }
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::make_unique<T>();
    }

    void release(std::unique_ptr<T> obj)
    {
        if (!obj) return;
        obj->reset();

        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(freeList_.size()) < capacity_)
            freeList_.push_back(std::move(obj));
        // else: dropped, unique_ptr frees it
    }

    /// Returns hits/misses since the last call and zeroes them.
    Counters takeCounters()
    {
        Counters c;
        c.hits = hits_.exchange(0, std::memory_order_relaxed);
        c.misses = misses_.exchange(0, std::memory_order_relaxed);
        return c;
    }

    int capacity() const { return capacity_; }
    int freeCount() const { std::lock_guard<std::mutex> lock(mutex_); return static_cast<int>(freeList_.size()); }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        freeList_.clear();
    }

private:
    mutable std::mutex mutex_;
    const int capacity_;
    std::vector<std::unique_ptr<T>> freeList_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace herald
