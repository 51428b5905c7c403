#include "core/platform/DesktopNotificationSink.hpp"
#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QVariantMap>
#include <boost/log/trivial.hpp>

namespace herald {

namespace {
const char* const kService = "org.freedesktop.Notifications";
const char* const kPath = "/org/freedesktop/Notifications";
const char* const kInterface = "org.freedesktop.Notifications";
}

DesktopNotificationSink::DesktopNotificationSink(const QString& appName, QObject* parent)
    : QObject(parent)
    , appName_(appName)
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    available_ = bus.isConnected();
    if (!available_) {
        BOOST_LOG_TRIVIAL(warning) << "[DesktopNotificationSink] No session bus, desktop delivery disabled";
        return;
    }

    bus.connect(kService, kPath, kInterface, "ActionInvoked",
                this, SLOT(onActionInvoked(uint,QString)));
    bus.connect(kService, kPath, kInterface, "NotificationClosed",
                this, SLOT(onNotificationClosed(uint,uint)));
}

void DesktopNotificationSink::show(const QString& identifier, const QString& title,
                                   const QString& body, const QString& subtitle)
{
    if (!available_) return;

    QDBusInterface server(kService, kPath, kInterface, QDBusConnection::sessionBus());

    const QString text = subtitle.isEmpty() ? body : subtitle + QStringLiteral("\n") + body;
    const QStringList actions{QStringLiteral("default"), QStringLiteral("Open")};
    QVariantMap hints;
    hints["desktop-entry"] = appName_.toLower();

    QDBusPendingCall pending = server.asyncCall("Notify", appName_, 0u, QString(), title, text,
                                                actions, hints, -1);
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, identifier]() {
        watcher->deleteLater();
        QDBusPendingReply<uint> reply = *watcher;
        if (reply.isError()) {
            BOOST_LOG_TRIVIAL(warning) << "[DesktopNotificationSink] Notify failed for '"
                                       << identifier.toStdString() << "': "
                                       << reply.error().message().toStdString();
            return;
        }
        serverIds_.insert(reply.value(), identifier);
    });
}

void DesktopNotificationSink::onActionInvoked(uint serverId, const QString& actionKey)
{
    auto it = serverIds_.constFind(serverId);
    if (it == serverIds_.constEnd()) return;

    BOOST_LOG_TRIVIAL(debug) << "[DesktopNotificationSink] Action '" << actionKey.toStdString()
                             << "' on '" << it->toStdString() << "'";
    emit activated(*it);
}

void DesktopNotificationSink::onNotificationClosed(uint serverId, uint /*reason*/)
{
    serverIds_.remove(serverId);
}

} // namespace herald
