#pragma once

#include <chrono>
#include <functional>
#include <mutex>

namespace herald {

/// Consecutive-failure breaker. Closed -> open after `threshold` errors in
/// a row; open -> closed once `cooldown` has elapsed and poll() observes it.
/// The open state is evaluated only in poll(), never per operation.
/// Thread-safe.
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    CircuitBreaker(int threshold = 5,
                   std::chrono::milliseconds cooldown = std::chrono::seconds(60),
                   NowFn now = nullptr);

    void recordError();
    void recordSuccess();

    bool isOpen() const;
    int consecutiveErrors() const;
    int threshold() const { return threshold_; }
    std::chrono::milliseconds cooldown() const { return cooldown_; }

    /// Closes the breaker if it is open and the cooldown has elapsed.
    /// Returns true when this call closed it.
    bool poll();

    void reset();

private:
    Clock::time_point now() const { return now_ ? now_() : Clock::now(); }

    mutable std::mutex mutex_;
    const int threshold_;
    const std::chrono::milliseconds cooldown_;
    NowFn now_;
    int consecutiveErrors_ = 0;
    bool open_ = false;
    Clock::time_point openedAt_{};
};

} // namespace herald
