#include "core/notify/MainThreadDispatcher.hpp"
#include <QElapsedTimer>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace herald {

MainThreadDispatcher::MainThreadDispatcher(QObject* parent)
    : MainThreadDispatcher(Settings{}, parent)
{
}

MainThreadDispatcher::MainThreadDispatcher(const Settings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
{
    settings_.capacity = std::max(1, settings_.capacity);
    settings_.maxActionsPerTick = std::max(1, settings_.maxActionsPerTick);

    timer_.setInterval(static_cast<int>(settings_.tickInterval.count()));
    connect(&timer_, &QTimer::timeout, this, [this]() { drain(); });
}

MainThreadDispatcher::~MainThreadDispatcher()
{
    const int left = pendingCount();
    if (left > 0) {
        BOOST_LOG_TRIVIAL(warning) << "[MainThreadDispatcher] Destroyed with " << left
                                   << " pending action(s)";
    }
}

void MainThreadDispatcher::start()
{
    if (!timer_.isActive())
        timer_.start();
}

void MainThreadDispatcher::stop()
{
    timer_.stop();
}

bool MainThreadDispatcher::post(Action action, OverflowPolicy policy)
{
    if (!action) return false;

    uint64_t droppedNow = 0;
    {
        QMutexLocker lock(&mutex_);
        if (static_cast<int>(queue_.size()) >= settings_.capacity) {
            if (policy == OverflowPolicy::Reject) {
                rejected_.fetch_add(1, std::memory_order_relaxed);
                BOOST_LOG_TRIVIAL(warning) << "[MainThreadDispatcher] Queue full ("
                                           << settings_.capacity << "), rejecting action";
                return false;
            }
            queue_.pop_front();
            droppedNow = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        }
        queue_.push_back(std::move(action));
    }

    if (droppedNow > 0) {
        BOOST_LOG_TRIVIAL(warning) << "[MainThreadDispatcher] Queue full, dropped oldest action (total dropped: "
                                   << droppedNow << ")";
        emit actionDropped(droppedNow);
    }
    return true;
}

void MainThreadDispatcher::runOrPost(Action action)
{
    if (isDispatcherThread()) {
        action();
        return;
    }
    post(std::move(action), OverflowPolicy::DropOldest);
}

int MainThreadDispatcher::drain()
{
    QElapsedTimer elapsed;
    elapsed.start();
    const qint64 budgetNs = std::chrono::duration_cast<std::chrono::nanoseconds>(settings_.tickBudget).count();

    int executed = 0;
    while (executed < settings_.maxActionsPerTick) {
        Action action;
        {
            QMutexLocker lock(&mutex_);
            if (queue_.empty()) break;
            action = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            action();
        } catch (const std::exception& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            BOOST_LOG_TRIVIAL(error) << "[MainThreadDispatcher] Action threw: " << e.what();
        } catch (...) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            BOOST_LOG_TRIVIAL(error) << "[MainThreadDispatcher] Action threw a non-standard exception";
        }
        ++executed;

        if (elapsed.nsecsElapsed() >= budgetNs) break;
    }
    return executed;
}

bool MainThreadDispatcher::isDispatcherThread() const
{
    return QThread::currentThread() == thread();
}

int MainThreadDispatcher::pendingCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(queue_.size());
}

} // namespace herald
