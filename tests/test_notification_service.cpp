#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "FakePlatformAdapter.hpp"
#include "core/services/NotificationService.hpp"
#include <boost/log/core.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <atomic>
#include <memory>
#include <thread>

using namespace herald;

namespace {

NotificationDescriptor makeDescriptor(const QString& id, const QString& group = {},
                                      qint64 delay = 3600)
{
    NotificationDescriptor d;
    d.identifier = id;
    d.title = "Title " + id;
    d.body = "Body";
    d.groupKey = group;
    d.fireDelaySeconds = delay;
    return d;
}

/// One service over a FakePlatformAdapter with its store in a scratch dir.
class Harness {
public:
    explicit Harness(const QString& storeDir, int maxPending = 64)
        : adapter_(std::make_unique<FakePlatformAdapter>(maxPending))
        , fake(adapter_.get())
    {
        config.setValueByPath("persistence.path", storeDir + "/store.json");
        config.setValueByPath("persistence.legacy_path", storeDir + "/legacy.ini");
        config.setValueByPath("persistence.debounce_ms", 10);
    }

    NotificationService* create()
    {
        service = std::make_unique<NotificationService>(config, &dispatcher, std::move(adapter_));
        service->events()->subscribe([this](const NotificationEvent& e) { events << e; });
        return service.get();
    }

    bool start() { return create()->initialize(); }

    const NotificationEvent* lastEvent(NotificationEventType type) const
    {
        for (auto it = events.crbegin(); it != events.crend(); ++it) {
            if (it->type == type) return &*it;
        }
        return nullptr;
    }

    HeraldConfig config;
    MainThreadDispatcher dispatcher;

private:
    std::unique_ptr<FakePlatformAdapter> adapter_;

public:
    FakePlatformAdapter* fake;
    QList<NotificationEvent> events;
    std::unique_ptr<NotificationService> service;
};

} // namespace

class TestNotificationService : public QObject {
    Q_OBJECT
private slots:
    void init()
    {
        dir_ = std::make_unique<QTemporaryDir>();
        QVERIFY(dir_->isValid());
    }

    void cleanup() { dir_.reset(); }

    void testInitialize()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QVERIFY(h.service->isInitialized());
        QVERIFY(h.dispatcher.isRunning());
        QCOMPARE(h.fake->initializeCalls, 1);
        QCOMPARE(h.fake->permissionRequests, 1);

        // idempotent
        QVERIFY(h.service->initialize());
        QCOMPARE(h.fake->initializeCalls, 1);

        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::PermissionGranted) != nullptr, 1000);
        QCOMPARE(h.service->debugInfo().value("backend").toString(), QString("fake"));
    }

    void testInitializeFailsWhenBackendFails()
    {
        Harness h(dir_->path());
        h.fake->initializeResult = false;
        QVERIFY(!h.start());
        QVERIFY(!h.service->isInitialized());
        QVERIFY(!h.service->schedule(makeDescriptor("a")));
        QCOMPARE(h.fake->scheduleCalls, 0);
    }

    void testCommandsBeforeInitialize()
    {
        Harness h(dir_->path());
        h.create();
        QVERIFY(!h.service->schedule(makeDescriptor("a")));
        QVERIFY(!h.service->cancel("a"));
        QCOMPARE(h.fake->scheduleCalls, 0);
    }

    void testScheduleAndQuery()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        QVERIFY(h.service->schedule(makeDescriptor("daily", "rewards")));
        QCOMPARE(h.service->count(), 1);
        QVERIFY(h.service->isScheduled("daily"));
        QCOMPARE(h.service->countByGroup("rewards"), 1);
        QCOMPARE(h.service->membersOf("rewards"), QStringList({"daily"}));
        QCOMPARE(h.fake->scheduleCalls, 1);
        QCOMPARE(h.service->statusOf("daily"), QString("Scheduled"));
        QCOMPARE(h.service->statusOf("missing"), QString("Not Found"));
        QCOMPARE(h.service->metrics().totalScheduled, uint64_t(1));
        QVERIFY(h.service->store()->isDirty());
    }

    void testSendGeneratesIdentifier()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        const QString id = h.service->send("Hello", "World", 60);
        QVERIFY(!id.isEmpty());
        QVERIFY(h.service->isScheduled(id));

        const QString named = h.service->send("Hello", "World", 0, 1, 30, 0, "named");
        QCOMPARE(named, QString("named"));
        QCOMPARE(h.fake->pending().value("p2").fireDelaySeconds, qint64(5400));

        const QString weekly = h.service->sendRepeating("Streak", "Keep going", 10,
                                                        RepeatInterval::Weekly, "streak");
        QCOMPARE(weekly, QString("streak"));
        QVERIFY(h.fake->pending().value("p3").repeats);
    }

    void testValidationRejectsWithoutPlatformCall()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        NotificationDescriptor noTitle = makeDescriptor("bad");
        noTitle.title.clear();
        QVERIFY(!h.service->schedule(noTitle));

        NotificationDescriptor tooFar = makeDescriptor("far", {}, qint64(366) * 24 * 3600);
        QVERIFY(!h.service->schedule(tooFar));

        QCOMPARE(h.fake->scheduleCalls, 0);
        QCOMPARE(h.service->count(), 0);

        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::Error) != nullptr, 1000);
        QCoreApplication::processEvents();
        const NotificationEvent* error = h.lastEvent(NotificationEventType::Error);
        QCOMPARE(error->error.kind, ErrorKind::Validation);
        QCOMPARE(error->identifier, QString("far"));
        QCOMPARE(h.service->metrics().totalErrors, uint64_t(2));
    }

    void testEvictsOldestBeyondLimit()
    {
        Harness h(dir_->path());
        h.config.setValueByPath("limits.max_tracked", 2);
        QVERIFY(h.start());

        QVERIFY(h.service->schedule(makeDescriptor("x", "g")));
        QVERIFY(h.service->schedule(makeDescriptor("y", "g")));
        QVERIFY(h.service->schedule(makeDescriptor("z", "g")));

        QCOMPARE(h.service->count(), 2);
        QVERIFY(!h.service->isScheduled("x"));
        QVERIFY(h.service->isScheduled("y"));
        QVERIFY(h.service->isScheduled("z"));
        QCOMPARE(h.service->countByGroup("g"), 2);
        // eviction forgets tracking only
        QCOMPARE(h.fake->pending().size(), 3);
    }

    void testRescheduleReplacesPlatformRequest()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        QVERIFY(h.service->schedule(makeDescriptor("a", {}, 60)));
        QVERIFY(h.service->schedule(makeDescriptor("a", {}, 120)));

        QCOMPARE(h.service->count(), 1);
        QCOMPARE(h.fake->cancelCalls, 1);
        QCOMPARE(h.fake->pending().size(), 1);
        QCOMPARE(h.fake->pending().value("p2").fireDelaySeconds, qint64(120));
    }

    void testCancel()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        QVERIFY(h.service->schedule(makeDescriptor("a", "g")));
        QVERIFY(h.service->cancel("a"));
        QVERIFY(!h.service->isScheduled("a"));
        QCOMPARE(h.service->countByGroup("g"), 0);
        QCOMPARE(h.fake->pending().size(), 0);

        QVERIFY(!h.service->cancel("a"));
        QCOMPARE(h.service->metrics().totalCancelled, uint64_t(1));
    }

    void testResetMetrics()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        QVERIFY(h.service->schedule(makeDescriptor("a")));
        QVERIFY(h.service->schedule(makeDescriptor("b")));
        QVERIFY(h.service->cancel("a"));
        NotificationDescriptor noTitle = makeDescriptor("bad");
        noTitle.title.clear();
        QVERIFY(!h.service->schedule(noTitle));
        const PerformanceMetrics before = h.service->metrics();
        QCOMPARE(before.totalScheduled, uint64_t(2));
        QCOMPARE(before.totalCancelled, uint64_t(1));
        QCOMPARE(before.totalErrors, uint64_t(1));

        h.service->resetMetrics();
        const PerformanceMetrics after = h.service->metrics();
        QCOMPARE(after.totalScheduled, uint64_t(0));
        QCOMPARE(after.totalCancelled, uint64_t(0));
        QCOMPARE(after.totalErrors, uint64_t(0));
        QCOMPARE(after.poolHits + after.poolMisses, uint64_t(0));
        QCOMPARE(after.dispatcherDrops, uint64_t(0));
        QVERIFY(after.startTime >= before.startTime);

        // counting resumes from zero
        QVERIFY(h.service->schedule(makeDescriptor("c")));
        QCOMPARE(h.service->metrics().totalScheduled, uint64_t(1));
        QCOMPARE(h.service->count(), 2);
    }

    void testSetLogLevelReappliesFilter()
    {
        using boost::log::trivial::severity_level;
        Harness h(dir_->path());
        QVERIFY(h.start());
        boost::log::sources::severity_logger<severity_level> lg;

        QVERIFY(h.service->setLogLevel("warning"));
        QVERIFY(!lg.open_record(boost::log::keywords::severity = severity_level::info));
        QVERIFY(static_cast<bool>(lg.open_record(boost::log::keywords::severity = severity_level::error)));

        QVERIFY(h.service->setLogLevel(" DEBUG "));
        QVERIFY(static_cast<bool>(lg.open_record(boost::log::keywords::severity = severity_level::debug)));

        // an unknown name keeps the previous filter
        QVERIFY(!h.service->setLogLevel("loud"));
        QVERIFY(!lg.open_record(boost::log::keywords::severity = severity_level::trace));
        QVERIFY(static_cast<bool>(lg.open_record(boost::log::keywords::severity = severity_level::debug)));

        boost::log::core::get()->reset_filter();
    }

    void testCancelGroup()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        for (const QString& id : {QString("a"), QString("b"), QString("c")})
            QVERIFY(h.service->schedule(makeDescriptor(id, "g1")));
        QVERIFY(h.service->schedule(makeDescriptor("solo")));
        QCOMPARE(h.service->countByGroup("g1"), 3);

        QCOMPARE(h.service->cancelGroup("g1"), 3);
        QCOMPARE(h.service->countByGroup("g1"), 0);
        QVERIFY(h.service->membersOf("g1").isEmpty());
        QCOMPARE(h.service->count(), 1);
        QCOMPARE(h.fake->pending().size(), 1);

        QCOMPARE(h.service->cancelGroup("nobody"), 0);
    }

    void testCancelAll()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QVERIFY(h.service->schedule(makeDescriptor("a")));
        QVERIFY(h.service->schedule(makeDescriptor("b")));

        h.service->cancelAll();
        QCOMPARE(h.service->count(), 0);
        QCOMPARE(h.fake->pending().size(), 0);
        QCOMPARE(h.fake->cancelDisplayedCalls, 1);
    }

    void testCircuitBreakerStopsPlatformCalls()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        h.fake->failSchedule = true;

        for (int i = 0; i < 5; ++i)
            QVERIFY(!h.service->schedule(makeDescriptor(QString("f%1").arg(i))));
        QCOMPARE(h.fake->scheduleCalls, 5);
        QVERIFY(h.service->circuitBreaker()->isOpen());

        QVERIFY(!h.service->schedule(makeDescriptor("sixth")));
        QCOMPARE(h.fake->scheduleCalls, 5);

        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::Error) != nullptr
                                     && h.lastEvent(NotificationEventType::Error)->identifier == "sixth",
                                 1000);
        QCOMPARE(h.lastEvent(NotificationEventType::Error)->error.kind, ErrorKind::CircuitOpen);
        QVERIFY(h.service->debugInfo().value("circuitOpen").toBool());
    }

    void testFailedRescheduleDropsStaleEntry()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QVERIFY(h.service->schedule(makeDescriptor("a")));

        h.fake->failSchedule = true;
        QVERIFY(!h.service->schedule(makeDescriptor("a", {}, 60)));
        QVERIFY(!h.service->isScheduled("a"));
        QCOMPARE(h.fake->pending().size(), 0);
    }

    void testCapacityExceeded()
    {
        Harness h(dir_->path(), 2);
        QVERIFY(h.start());

        QVERIFY(h.service->schedule(makeDescriptor("a")));
        QVERIFY(h.service->schedule(makeDescriptor("b")));
        QVERIFY(!h.service->schedule(makeDescriptor("c")));
        QCOMPARE(h.fake->scheduleCalls, 2);

        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::Error) != nullptr, 1000);
        QCOMPARE(h.lastEvent(NotificationEventType::Error)->error.kind, ErrorKind::CapacityExceeded);

        // updating a tracked request does not need a free slot
        QVERIFY(h.service->schedule(makeDescriptor("a", {}, 10)));
        QCOMPARE(h.service->count(), 2);
    }

    void testBatchLimits()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        QList<NotificationDescriptor> batch;
        QStringList ids;
        for (int i = 0; i < 60; ++i) {
            batch << makeDescriptor(QString("n%1").arg(i));
            ids << QString("n%1").arg(i);
        }

        QCOMPARE(h.service->scheduleBatch(batch), 50);
        QCOMPARE(h.service->count(), 50);
        QVERIFY(!h.service->isScheduled("n55"));

        QCOMPARE(h.service->cancelBatch(ids), 50);
        QCOMPARE(h.service->count(), 0);
    }

    void testFiredOneShotIsPruned()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QSignalSpy received(h.service.get(), &NotificationService::notificationReceived);

        QVERIFY(h.service->schedule(makeDescriptor("chest")));
        QVERIFY(h.fake->fire("p1"));

        QCOMPARE(received.count(), 1);
        QCOMPARE(received.first().at(0).toString(), QString("chest"));
        QCOMPARE(received.first().at(1).toString(), QString("Title chest"));
        QVERIFY(!h.service->isScheduled("chest"));

        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::Received) != nullptr, 1000);
        QCOMPARE(h.lastEvent(NotificationEventType::Received)->identifier, QString("chest"));
    }

    void testTappedPublishesEvent()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        h.service->notificationTapped("chest");
        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::Tapped) != nullptr, 1000);
        QCOMPARE(h.lastEvent(NotificationEventType::Tapped)->identifier, QString("chest"));
    }

    void testForegroundCleansUp()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QVERIFY(h.service->schedule(makeDescriptor("a")));
        QVERIFY(h.service->schedule(makeDescriptor("b")));

        // the backend lost its requests behind our back
        h.fake->cancelAllScheduled();
        QCOMPARE(h.service->count(), 2);

        h.service->onApplicationForegrounded();
        QCOMPARE(h.service->count(), 0);
        QCOMPARE(h.fake->cancelDisplayedCalls, 1);
    }

    void testPermissionChangeAnnounced()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::PermissionGranted) != nullptr, 1000);
        QVERIFY(h.service->hasPermission());

        h.fake->setPermission(false);
        QVERIFY(!h.service->hasPermission());
        QTRY_VERIFY_WITH_TIMEOUT(h.lastEvent(NotificationEventType::PermissionDenied) != nullptr, 1000);

        // a revoked permission does not block scheduling
        QVERIFY(h.service->schedule(makeDescriptor("a")));
    }

    void testReturnNotificationLifecycle()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        h.service->onApplicationBackgrounded();
        QVERIFY(h.service->isScheduled("return_notification"));
        QCOMPARE(h.service->countByGroup("return_group"), 1);
        QVERIFY(QFile::exists(h.config.storePath()));
        QVERIFY(!h.service->store()->isDirty());

        h.service->onApplicationForegrounded();
        QVERIFY(!h.service->isScheduled("return_notification"));
        QVERIFY(!h.service->isScheduled("return_notification_urgent"));
        QVERIFY(h.service->hoursSinceLastForeground() < 0.01);
    }

    void testReturnNotificationDisabled()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        h.service->setReturnNotificationEnabled(false);
        QVERIFY(!h.service->returnNotificationConfig().enabled);
        h.service->onApplicationBackgrounded();
        QCOMPARE(h.service->count(), 0);
    }

    void testPersistsAcrossRestart()
    {
        {
            Harness h(dir_->path());
            QVERIFY(h.start());
            QVERIFY(h.service->schedule(makeDescriptor("a", "g")));
            QVERIFY(h.service->schedule(makeDescriptor("b")));

            ReturnNotificationConfig ret;
            ret.title = "Come back";
            ret.hoursBeforeNotification = 12;
            h.service->configureReturnNotification(ret);
            h.service->shutdown();
            QVERIFY(h.service->isShutDown());
        }

        Harness h(dir_->path());
        QVERIFY(h.start());
        QCOMPARE(h.service->count(), 2);
        QVERIFY(h.service->isScheduled("a"));
        QCOMPARE(h.service->countByGroup("g"), 1);
        QCOMPARE(h.service->returnNotificationConfig().title, QString("Come back"));
        QCOMPARE(h.service->returnNotificationConfig().hoursBeforeNotification, 12);

        // this backend instance never saw those requests
        QCOMPARE(h.service->statusOf("a"), QString("Not Found"));
        QCOMPARE(h.service->cleanupExpired(), 2);
        QCOMPARE(h.service->count(), 0);
    }

    void testCommandsAfterShutdown()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QVERIFY(h.service->schedule(makeDescriptor("a")));
        h.service->shutdown();

        QVERIFY(!h.service->schedule(makeDescriptor("b")));
        QVERIFY(!h.service->cancel("a"));
        QVERIFY(!h.service->initialize());
        QCOMPARE(h.fake->scheduleCalls, 1);
        // queries still answer
        QCOMPARE(h.service->count(), 1);
        QVERIFY(QFile::exists(h.config.storePath()));
    }

    void testBuilderThroughService()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        NotificationBuilder builder = h.service->createNotification();
        builder.withTitle("Chest").withBody("Ready to open").withGroup("loot").in(0, 1, 0, 0);
        QVERIFY(builder.schedule());
        QVERIFY(!builder.identifier().isEmpty());
        QCOMPARE(h.service->countByGroup("loot"), 1);
        QCOMPARE(h.fake->pending().value("p1").fireDelaySeconds, qint64(3600));
    }

    void testBackendSpecificCommandsRejected()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());
        QVERIFY(!h.service->setBadgeCount(3));
        QVERIFY(!h.service->setChannelConfig(ChannelConfig()));
    }

    void testOffThreadCommandsRefused()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        std::atomic<bool> accepted{true};
        std::thread worker([&]() { accepted = h.service->schedule(makeDescriptor("a")); });
        worker.join();
        QVERIFY(!accepted.load());
        QCOMPARE(h.fake->scheduleCalls, 0);
    }

    void testAsyncFromWorkerThread()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        std::atomic<bool> done{false};
        std::atomic<bool> scheduled{false};
        std::atomic<int> counted{-1};
        std::atomic<bool> cancelled{false};
        QString status;
        std::thread worker([&]() {
            scheduled = h.service->scheduleAsync(makeDescriptor("async"));
            counted = h.service->countAsync();
            status = h.service->statusOf("async");
            cancelled = h.service->cancelAsync("async");
            done = true;
        });

        QTRY_VERIFY_WITH_TIMEOUT(done.load(), 5000);
        worker.join();
        QVERIFY(scheduled.load());
        QCOMPARE(counted.load(), 1);
        QCOMPARE(status, QString("Scheduled"));
        QVERIFY(cancelled.load());
        QCOMPARE(h.service->count(), 0);
    }

    void testAsyncTimesOutWhenDispatcherIsBusy()
    {
        Harness h(dir_->path());
        h.config.setValueByPath("async.timeout_ms", 50);
        QVERIFY(h.start());

        std::atomic<bool> timedOut{false};
        // the main thread stays blocked in join(), so nothing drains
        std::thread worker([&]() {
            try {
                h.service->countAsync();
            } catch (const TimeoutError&) {
                timedOut = true;
            }
        });
        worker.join();
        QVERIFY(timedOut.load());
    }

    void testAsyncCancelledToken()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        CancellationSource source;
        source.cancel();
        std::atomic<bool> cancelled{false};
        std::thread worker([&]() {
            try {
                h.service->scheduleAsync(makeDescriptor("a"), source.token());
            } catch (const OperationCancelledError&) {
                cancelled = true;
            }
        });
        worker.join();
        QVERIFY(cancelled.load());
        QCOMPARE(h.fake->scheduleCalls, 0);
    }

    void testRequestPermissionAsync()
    {
        Harness h(dir_->path());
        QVERIFY(h.start());

        std::atomic<bool> done{false};
        std::atomic<bool> granted{false};
        std::thread worker([&]() {
            granted = h.service->requestPermissionAsync();
            done = true;
        });

        QTRY_VERIFY_WITH_TIMEOUT(done.load(), 5000);
        worker.join();
        QVERIFY(granted.load());
        QCOMPARE(h.fake->permissionRequests, 2);

        // on the dispatcher thread the cached state is returned without waiting
        QVERIFY(h.service->requestPermissionAsync());
    }

    void testRequestPermissionAsyncTimesOut()
    {
        Harness h(dir_->path());
        h.config.setValueByPath("async.permission_timeout_ms", 50);
        QVERIFY(h.start());
        h.fake->answerPermission = false;

        std::atomic<bool> done{false};
        std::atomic<bool> timedOut{false};
        std::thread worker([&]() {
            try {
                h.service->requestPermissionAsync();
            } catch (const TimeoutError&) {
                timedOut = true;
            }
            done = true;
        });

        QTRY_VERIFY_WITH_TIMEOUT(done.load(), 5000);
        worker.join();
        QVERIFY(timedOut.load());
    }

private:
    std::unique_ptr<QTemporaryDir> dir_;
};

QTEST_MAIN(TestNotificationService)
#include "test_notification_service.moc"
