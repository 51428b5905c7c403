#pragma once

#include <atomic>
#include <memory>

namespace herald {

/// Read side of a cancellation flag shared with a CancellationSource.
/// A default-constructed token can never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const
    {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    bool canBeCancelled() const { return static_cast<bool>(flag_); }

    static CancellationToken none() { return {}; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(flag_); }

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace herald
