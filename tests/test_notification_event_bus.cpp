#include <QTest>
#include <QThread>
#include "core/services/NotificationEventBus.hpp"
#include <stdexcept>
#include <thread>

using herald::NotificationEvent;
using herald::NotificationEventBus;
using herald::NotificationEventType;

class TestNotificationEventBus : public QObject {
    Q_OBJECT
private slots:
    void testSubscribeAndPublish()
    {
        NotificationEventBus bus;
        NotificationEvent received;
        int calls = 0;
        int subId = bus.subscribe([&](const NotificationEvent& e) {
            received = e;
            ++calls;
        });

        bus.publish(NotificationEventType::Received, "daily", "Title", "Body");
        // delivery is queued, nothing happens inline
        QCOMPARE(calls, 0);
        QCoreApplication::processEvents();

        QVERIFY(subId > 0);
        QCOMPARE(calls, 1);
        QCOMPARE(received.type, NotificationEventType::Received);
        QCOMPARE(received.identifier, QString("daily"));
        QCOMPARE(received.title, QString("Title"));
        QVERIFY(received.timestamp.isValid());
        QVERIFY(!received.error.isError());
    }

    void testErrorEventCarriesError()
    {
        NotificationEventBus bus;
        herald::NotificationError seen;
        bus.subscribe([&](const NotificationEvent& e) { seen = e.error; });

        bus.publish(NotificationEventType::Error, "x", {}, {},
                    herald::NotificationError{herald::ErrorKind::Validation, "schedule", "missing title"});
        QCoreApplication::processEvents();

        QVERIFY(seen.isError());
        QCOMPARE(seen.kind, herald::ErrorKind::Validation);
        QCOMPARE(seen.message, QString("missing title"));
    }

    void testUnsubscribe()
    {
        NotificationEventBus bus;
        int count = 0;
        int subId = bus.subscribe([&](const NotificationEvent&) { ++count; });

        bus.publish(NotificationEventType::Tapped, "a");
        QCoreApplication::processEvents();
        QCOMPARE(count, 1);

        bus.unsubscribe(subId);
        QCOMPARE(bus.subscriberCount(), 0);
        bus.publish(NotificationEventType::Tapped, "a");
        QCoreApplication::processEvents();
        QCOMPARE(count, 1);
    }

    void testThrowingSubscriberIsolated()
    {
        NotificationEventBus bus;
        int good = 0;
        bus.subscribe([](const NotificationEvent&) { throw std::runtime_error("bad subscriber"); });
        bus.subscribe([&](const NotificationEvent&) { ++good; });

        bus.publish(NotificationEventType::PermissionGranted);
        QCoreApplication::processEvents();

        QCOMPARE(good, 1);
        QCOMPARE(bus.failedDeliveries(), 1);
    }

    void testPublishFromWorkerDeliversOnOwnerThread()
    {
        NotificationEventBus bus;
        bool onOwner = false;
        int calls = 0;
        bus.subscribe([&](const NotificationEvent&) {
            onOwner = QThread::currentThread() == bus.thread();
            ++calls;
        });

        std::thread worker([&bus]() { bus.publish(NotificationEventType::Received, "w"); });
        worker.join();
        QTRY_COMPARE_WITH_TIMEOUT(calls, 1, 1000);
        QVERIFY(onOwner);
    }

    void testRecordsReturnToPool()
    {
        NotificationEventBus bus(4);
        bus.subscribe([](const NotificationEvent&) {});

        for (int i = 0; i < 3; ++i) {
            bus.publish(NotificationEventType::Received, QString::number(i));
            QCoreApplication::processEvents();
        }

        const auto counters = bus.pool().takeCounters();
        QCOMPARE(counters.misses, uint64_t(1));
        QCOMPARE(counters.hits, uint64_t(2));
        QCOMPARE(bus.pool().freeCount(), 1);
    }

    void testNoSubscribersSkipsWork()
    {
        NotificationEventBus bus;
        bus.publish(NotificationEventType::Received, "nobody");
        QCoreApplication::processEvents();
        const auto counters = bus.pool().takeCounters();
        QCOMPARE(counters.hits + counters.misses, uint64_t(0));
    }

    void testClear()
    {
        NotificationEventBus bus;
        bus.subscribe([](const NotificationEvent&) {});
        bus.subscribe([](const NotificationEvent&) {});
        QCOMPARE(bus.subscriberCount(), 2);
        bus.clear();
        QCOMPARE(bus.subscriberCount(), 0);
    }
};

QTEST_MAIN(TestNotificationEventBus)
#include "test_notification_event_bus.moc"
