#include <QTest>
#include <QSignalSpy>
#include <QThread>
#include "core/notify/MainThreadDispatcher.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using herald::CancellationSource;
using herald::CancellationToken;
using herald::MainThreadDispatcher;
using namespace std::chrono_literals;

namespace {

MainThreadDispatcher::Settings smallQueue(int capacity)
{
    MainThreadDispatcher::Settings s;
    s.capacity = capacity;
    return s;
}

} // namespace

class TestMainThreadDispatcher : public QObject {
    Q_OBJECT
private slots:
    void testPostAndDrainInOrder()
    {
        MainThreadDispatcher dispatcher;
        QStringList order;
        QVERIFY(dispatcher.post([&]() { order << "a"; }));
        QVERIFY(dispatcher.post([&]() { order << "b"; }));
        QCOMPARE(dispatcher.pendingCount(), 2);

        QCOMPARE(dispatcher.drain(), 2);
        QCOMPARE(order, QStringList({"a", "b"}));
        QCOMPARE(dispatcher.pendingCount(), 0);
    }

    void testRejectWhenFull()
    {
        MainThreadDispatcher dispatcher(smallQueue(2));
        QVERIFY(dispatcher.post([]() {}));
        QVERIFY(dispatcher.post([]() {}));
        QVERIFY(!dispatcher.post([]() {}, MainThreadDispatcher::OverflowPolicy::Reject));
        QCOMPARE(dispatcher.rejectedCount(), uint64_t(1));
        QCOMPARE(dispatcher.pendingCount(), 2);
    }

    void testDropOldestWhenFull()
    {
        MainThreadDispatcher dispatcher(smallQueue(2));
        QSignalSpy dropped(&dispatcher, &MainThreadDispatcher::actionDropped);
        QStringList ran;
        dispatcher.post([&]() { ran << "first"; });
        dispatcher.post([&]() { ran << "second"; });
        QVERIFY(dispatcher.post([&]() { ran << "third"; },
                                MainThreadDispatcher::OverflowPolicy::DropOldest));

        QCOMPARE(dispatcher.droppedCount(), uint64_t(1));
        QCOMPARE(dropped.count(), 1);
        QCOMPARE(dropped.first().first().toULongLong(), 1ULL);

        dispatcher.drain();
        QCOMPARE(ran, QStringList({"second", "third"}));
    }

    void testMaxActionsPerTick()
    {
        MainThreadDispatcher::Settings s;
        s.maxActionsPerTick = 3;
        s.tickBudget = 1s;
        MainThreadDispatcher dispatcher(s);
        int ran = 0;
        for (int i = 0; i < 7; ++i)
            dispatcher.post([&]() { ++ran; });

        QCOMPARE(dispatcher.drain(), 3);
        QCOMPARE(dispatcher.drain(), 3);
        QCOMPARE(dispatcher.drain(), 1);
        QCOMPARE(ran, 7);
    }

    void testTickBudgetStopsEarly()
    {
        MainThreadDispatcher::Settings s;
        s.tickBudget = 1ms;
        MainThreadDispatcher dispatcher(s);
        for (int i = 0; i < 5; ++i)
            dispatcher.post([]() { QThread::msleep(3); });

        // the first action alone exhausts the budget
        QCOMPARE(dispatcher.drain(), 1);
        QCOMPARE(dispatcher.pendingCount(), 4);
    }

    void testThrowingActionDoesNotStopDrain()
    {
        MainThreadDispatcher dispatcher;
        bool after = false;
        dispatcher.post([]() { throw std::runtime_error("boom"); });
        dispatcher.post([&]() { after = true; });

        QCOMPARE(dispatcher.drain(), 2);
        QVERIFY(after);
        QCOMPARE(dispatcher.failedCount(), uint64_t(1));
    }

    void testNonStandardThrowIsCounted()
    {
        MainThreadDispatcher dispatcher;
        bool after = false;
        dispatcher.post([]() { throw 42; });
        dispatcher.post([]() { throw QString("not a std::exception"); });
        dispatcher.post([&]() { after = true; });

        QCOMPARE(dispatcher.drain(), 3);
        QVERIFY(after);
        QCOMPARE(dispatcher.failedCount(), uint64_t(2));
    }

    void testTimerDrivesDrain()
    {
        MainThreadDispatcher dispatcher;
        bool ran = false;
        dispatcher.post([&]() { ran = true; });
        dispatcher.start();
        QVERIFY(dispatcher.isRunning());
        QTRY_VERIFY_WITH_TIMEOUT(ran, 1000);
        dispatcher.stop();
        QVERIFY(!dispatcher.isRunning());
    }

    void testRunOrPostInlineOnDispatcherThread()
    {
        MainThreadDispatcher dispatcher;
        QVERIFY(dispatcher.isDispatcherThread());
        bool ran = false;
        dispatcher.runOrPost([&]() { ran = true; });
        QVERIFY(ran);
        QCOMPARE(dispatcher.pendingCount(), 0);
    }

    void testAwaitResultFromWorkerThread()
    {
        MainThreadDispatcher dispatcher;
        dispatcher.start();

        std::atomic<bool> done{false};
        std::atomic<int> result{0};
        std::thread worker([&]() {
            result = dispatcher.awaitResult<int>([&]() {
                // must run on the dispatcher thread
                return dispatcher.isDispatcherThread() ? 42 : -1;
            }, CancellationToken::none(), 2000ms);
            done = true;
        });

        QTRY_VERIFY_WITH_TIMEOUT(done.load(), 3000);
        worker.join();
        QCOMPARE(result.load(), 42);
    }

    void testAwaitResultInlineOnDispatcherThread()
    {
        MainThreadDispatcher dispatcher;
        const int v = dispatcher.awaitResult<int>([]() { return 7; }, CancellationToken::none(), 10ms);
        QCOMPARE(v, 7);
    }

    void testAwaitResultTimesOut()
    {
        MainThreadDispatcher dispatcher;  // never drained
        std::atomic<bool> timedOut{false};
        std::thread worker([&]() {
            try {
                dispatcher.awaitResult<void>([]() {}, CancellationToken::none(), 50ms);
            } catch (const herald::TimeoutError& e) {
                timedOut = e.kind() == herald::ErrorKind::Timeout;
            }
        });
        worker.join();
        QVERIFY(timedOut.load());
    }

    void testAwaitResultCancelled()
    {
        MainThreadDispatcher dispatcher;  // never drained
        CancellationSource source;
        std::atomic<bool> cancelled{false};
        std::thread worker([&]() {
            try {
                dispatcher.awaitResult<bool>([]() { return true; }, source.token(), 5000ms);
            } catch (const herald::OperationCancelledError&) {
                cancelled = true;
            }
        });

        QThread::msleep(20);
        source.cancel();
        worker.join();
        QVERIFY(cancelled.load());
    }

    void testAwaitResultPreCancelled()
    {
        MainThreadDispatcher dispatcher;
        CancellationSource source;
        source.cancel();
        bool thrown = false;
        try {
            dispatcher.awaitResult<int>([]() { return 1; }, source.token(), 10ms);
        } catch (const herald::OperationCancelledError&) {
            thrown = true;
        }
        QVERIFY(thrown);
        QCOMPARE(dispatcher.pendingCount(), 0);
    }

    void testAwaitResultRejectedWhenQueueFull()
    {
        MainThreadDispatcher dispatcher(smallQueue(1));
        dispatcher.post([]() {});

        std::atomic<bool> rejected{false};
        std::thread worker([&]() {
            try {
                dispatcher.awaitResult<int>([]() { return 1; }, CancellationToken::none(), 5000ms);
            } catch (const herald::QueueFullError&) {
                rejected = true;
            }
        });
        worker.join();
        QVERIFY(rejected.load());
        QCOMPARE(dispatcher.rejectedCount(), uint64_t(1));
    }

    void testAwaitResultPropagatesException()
    {
        MainThreadDispatcher dispatcher;
        dispatcher.start();

        std::atomic<bool> done{false};
        QString message;
        std::thread worker([&]() {
            try {
                dispatcher.awaitResult<int>([]() -> int { throw std::runtime_error("platform down"); },
                                            CancellationToken::none(), 2000ms);
            } catch (const std::runtime_error& e) {
                message = QString::fromStdString(e.what());
            }
            done = true;
        });

        QTRY_VERIFY_WITH_TIMEOUT(done.load(), 3000);
        worker.join();
        QCOMPARE(message, QString("platform down"));
    }
};

QTEST_MAIN(TestMainThreadDispatcher)
#include "test_main_thread_dispatcher.moc"
