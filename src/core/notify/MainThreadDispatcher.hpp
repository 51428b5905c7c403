#pragma once

#include "core/notify/CancellationToken.hpp"
#include "core/notify/NotificationError.hpp"
#include <QMutex>
#include <QObject>
#include <QTimer>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace herald {

/**
 * MainThreadDispatcher: bounded FIFO of closures drained on the thread
 * that owns this object (the dispatcher thread).
 *
 * Each tick runs at most maxActionsPerTick closures and stops early once
 * tickBudget is spent; leftovers wait for the next tick. A closure that
 * throws is logged and counted, and the drain continues.
 *
 * Thread safety: post() and awaitResult() from any thread. drain() only on
 * the dispatcher thread.
 */
class MainThreadDispatcher : public QObject {
    Q_OBJECT
public:
    using Action = std::function<void()>;

    enum class OverflowPolicy {
        Reject,
        DropOldest
    };

    struct Settings {
        int capacity = 1024;
        int maxActionsPerTick = 128;
        std::chrono::microseconds tickBudget = std::chrono::milliseconds(2);
        std::chrono::milliseconds tickInterval = std::chrono::milliseconds(16);
    };

    explicit MainThreadDispatcher(QObject* parent = nullptr);
    explicit MainThreadDispatcher(const Settings& settings, QObject* parent = nullptr);
    ~MainThreadDispatcher() override;

    void start();
    void stop();
    bool isRunning() const { return timer_.isActive(); }

    /// Queues an action. On a full queue: Reject returns false; DropOldest
    /// discards the oldest queued action (counted) and accepts this one.
    bool post(Action action, OverflowPolicy policy = OverflowPolicy::Reject);

    /// Runs inline on the dispatcher thread, otherwise posts (DropOldest).
    void runOrPost(Action action);

    /// Runs up to maxActionsPerTick queued actions within the tick budget.
    /// Returns the number executed.
    int drain();

    bool isDispatcherThread() const;

    int pendingCount() const;
    uint64_t droppedCount() const { return dropped_.load(std::memory_order_relaxed); }
    uint64_t rejectedCount() const { return rejected_.load(std::memory_order_relaxed); }
    uint64_t failedCount() const { return failed_.load(std::memory_order_relaxed); }
    const Settings& settings() const { return settings_; }

    /**
     * Runs work on the dispatcher thread and blocks the caller until it
     * completes. Throws QueueFullError when the post is rejected,
     * TimeoutError when timeout elapses, OperationCancelledError when the
     * token fires. Once started, work runs to completion regardless.
     * On the dispatcher thread the work runs inline.
     */
    template <typename R>
    R awaitResult(std::function<R()> work, const CancellationToken& token,
                  std::chrono::milliseconds timeout);

    /// Blocks until future is ready, honoring token and timeout.
    template <typename R>
    static R waitFor(std::future<R>& future, const CancellationToken& token,
                     std::chrono::milliseconds timeout);

signals:
    void actionDropped(quint64 totalDropped);

private:
    template <typename R>
    static void fulfil(std::promise<R>& promise, const std::function<R()>& work)
    {
        if constexpr (std::is_void_v<R>) {
            work();
            promise.set_value();
        } else {
            promise.set_value(work());
        }
    }

    Settings settings_;
    QTimer timer_;
    mutable QMutex mutex_;
    std::deque<Action> queue_;
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> failed_{0};
};

template <typename R>
R MainThreadDispatcher::awaitResult(std::function<R()> work, const CancellationToken& token,
                                    std::chrono::milliseconds timeout)
{
    if (token.isCancelled())
        throw OperationCancelledError("operation cancelled before dispatch");

    if (isDispatcherThread())
        return work();

    auto promise = std::make_shared<std::promise<R>>();
    std::future<R> future = promise->get_future();

    const bool posted = post([promise, work = std::move(work)]() {
        try {
            fulfil(*promise, work);
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }, OverflowPolicy::Reject);

    if (!posted)
        throw QueueFullError("dispatcher queue full");

    return waitFor(future, token, timeout);
}

template <typename R>
R MainThreadDispatcher::waitFor(std::future<R>& future, const CancellationToken& token,
                                std::chrono::milliseconds timeout)
{
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;
    const auto slice = std::chrono::milliseconds(5);

    for (;;) {
        if (token.isCancelled())
            throw OperationCancelledError("operation cancelled while waiting");

        const auto now = Clock::now();
        if (now >= deadline)
            throw TimeoutError("operation timed out after " + std::to_string(timeout.count()) + " ms");

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (future.wait_for(std::min<std::chrono::milliseconds>(slice, remaining)) == std::future_status::ready)
            return future.get();
    }
}

} // namespace herald
