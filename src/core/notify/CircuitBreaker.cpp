#include "core/notify/CircuitBreaker.hpp"
#include <boost/log/trivial.hpp>

namespace herald {

CircuitBreaker::CircuitBreaker(int threshold, std::chrono::milliseconds cooldown, NowFn now)
    : threshold_(threshold > 0 ? threshold : 1)
    , cooldown_(cooldown)
    , now_(std::move(now))
{
}

void CircuitBreaker::recordError()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++consecutiveErrors_;
    if (!open_ && consecutiveErrors_ >= threshold_) {
        open_ = true;
        openedAt_ = now();
        BOOST_LOG_TRIVIAL(warning) << "[CircuitBreaker] Opened after " << consecutiveErrors_
                                   << " consecutive errors, cooling down for "
                                   << cooldown_.count() << " ms";
    }
}

void CircuitBreaker::recordSuccess()
{
    std::lock_guard<std::mutex> lock(mutex_);
    consecutiveErrors_ = 0;
}

bool CircuitBreaker::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

int CircuitBreaker::consecutiveErrors() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutiveErrors_;
}

bool CircuitBreaker::poll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) return false;
    if (now() - openedAt_ < cooldown_) return false;

    open_ = false;
    consecutiveErrors_ = 0;
    BOOST_LOG_TRIVIAL(info) << "[CircuitBreaker] Closed after cooldown";
    return true;
}

void CircuitBreaker::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    consecutiveErrors_ = 0;
}

} // namespace herald
