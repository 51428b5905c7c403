#pragma once

#include <QHash>
#include <QObject>
#include <QString>

namespace herald {

/// Shows fired notifications through org.freedesktop.Notifications on
/// the session bus. Emits activated() when the user clicks one.
class DesktopNotificationSink : public QObject {
    Q_OBJECT
public:
    explicit DesktopNotificationSink(const QString& appName, QObject* parent = nullptr);

    /// False when no session bus is reachable; show() is then a no-op.
    bool isAvailable() const { return available_; }

    int inFlight() const { return static_cast<int>(serverIds_.size()); }

public slots:
    void show(const QString& identifier, const QString& title,
              const QString& body, const QString& subtitle);

signals:
    void activated(const QString& identifier);

private slots:
    void onActionInvoked(uint serverId, const QString& actionKey);
    void onNotificationClosed(uint serverId, uint reason);

private:
    QString appName_;
    bool available_ = false;
    QHash<uint, QString> serverIds_;
};

} // namespace herald
