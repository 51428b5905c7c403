#include <signal.h>
#include <QCoreApplication>
#include <QFile>
#include <memory>
#include <yaml-cpp/yaml.h>
#include "core/HeraldConfig.hpp"
#include "core/Logging.hpp"
#include "core/notify/MainThreadDispatcher.hpp"
#include "core/platform/DesktopNotificationSink.hpp"
#include "core/platform/PlatformAdapterFactory.hpp"
#include "core/services/NotificationService.hpp"

namespace {

herald::NotificationService* g_service = nullptr;

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("Herald");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Herald");

    herald::HeraldConfig config;
    const QString configPath = herald::HeraldConfig::defaultConfigPath();
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
            qInfo() << "Config: loaded" << configPath;
        } catch (const YAML::Exception& e) {
            qWarning() << "Config: failed to load" << configPath << "-" << e.what()
                       << "(using defaults)";
        }
    } else {
        qInfo() << "Config: no file at" << configPath << "(using defaults)";
    }

    if (!herald::applyLogLevel(config.logLevel()))
        herald::applyLogLevel("info");

    herald::MainThreadDispatcher dispatcher(config.dispatcherSettings());

    auto platform = herald::createPlatformAdapter(config);
    if (!platform) {
        qWarning() << "Platform: unknown backend" << config.platformBackend();
        return 1;
    }
    qInfo() << "Platform:" << platform->name() << "backend, limit" << platform->maxPending();

    herald::NotificationService service(config, &dispatcher, std::move(platform));
    if (!service.initialize()) {
        qWarning() << "NotificationService: initialization failed";
        return 1;
    }

    std::unique_ptr<herald::DesktopNotificationSink> sink;
    if (config.desktopEnabled()) {
        sink = std::make_unique<herald::DesktopNotificationSink>(config.desktopAppName());
        if (sink->isAvailable()) {
            QObject::connect(&service, &herald::NotificationService::notificationReceived,
                             sink.get(), &herald::DesktopNotificationSink::show);
            QObject::connect(sink.get(), &herald::DesktopNotificationSink::activated,
                             &service, &herald::NotificationService::notificationTapped);
            qInfo() << "Desktop: delivering through org.freedesktop.Notifications";
        } else {
            qWarning() << "Desktop: no session bus, fired notifications are only logged";
        }
    } else {
        qInfo() << "Desktop: disabled in config";
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &service,
                     [&service]() { service.shutdown(); });

    // SIGINT/SIGTERM -> leave the event loop so shutdown() flushes the store
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });

    // SIGUSR1 / SIGUSR2 -> application backgrounded / foregrounded
    g_service = &service;
    signal(SIGUSR1, [](int) {
        QMetaObject::invokeMethod(g_service, [](){ g_service->onApplicationBackgrounded(); },
                                  Qt::QueuedConnection);
    });
    signal(SIGUSR2, [](int) {
        QMetaObject::invokeMethod(g_service, [](){ g_service->onApplicationForegrounded(); },
                                  Qt::QueuedConnection);
    });

    qInfo() << "Herald running," << service.count() << "notification(s) tracked";

    int ret = app.exec();

    g_service = nullptr;
    return ret;
}
