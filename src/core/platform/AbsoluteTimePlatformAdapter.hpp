#pragma once

#include "core/platform/IPlatformAdapter.hpp"
#include "core/platform/PendingNotificationTable.hpp"

namespace herald {

enum class ChannelImportance {
    Low,
    Default,
    High
};

QString channelImportanceName(ChannelImportance importance);
ChannelImportance channelImportanceFromName(const QString& name);

struct ChannelConfig {
    QString id = QStringLiteral("default_channel");
    QString name = QStringLiteral("Default Channel");
    QString description = QStringLiteral("Default notification channel");
    ChannelImportance importance = ChannelImportance::High;
    bool enableVibration = true;
    bool enableLights = true;
    bool showBadge = true;
    bool bypassDnd = false;

    bool operator==(const ChannelConfig& o) const
    {
        return id == o.id && name == o.name && description == o.description
            && importance == o.importance && enableVibration == o.enableVibration
            && enableLights == o.enableLights && showBadge == o.showBadge && bypassDnd == o.bypassDnd;
    }
    bool operator!=(const ChannelConfig& o) const { return !(*this == o); }
};

/// Absolute-fire-time backend (500 pending max). Daily and weekly repeats
/// use native 24h / 7d intervals; Custom schedules once. Notifications go
/// through a channel that must be registered (initialize()) before the
/// first schedule. Platform ids are backend-assigned integers.
class AbsoluteTimePlatformAdapter : public IPlatformAdapter {
    Q_OBJECT
public:
    static constexpr int kMaxPending = 500;

    explicit AbsoluteTimePlatformAdapter(const ChannelConfig& channel = ChannelConfig{},
                                         bool permissionGranted = true,
                                         QObject* parent = nullptr);

    PlatformKind kind() const override { return PlatformKind::AbsoluteTime; }
    QString name() const override { return QStringLiteral("absolute"); }
    int maxPending() const override { return kMaxPending; }
    int pendingCount() const override { return table_.count(); }

    /// Registers the channel. Idempotent.
    bool initialize() override;
    bool isChannelRegistered() const { return channelRegistered_; }

    PlatformResult schedule(const NotificationDescriptor& descriptor) override;
    bool cancel(const QString& identifier, const QString& platformId) override;
    void cancelAllScheduled() override;
    void cancelAllDisplayed() override;

    bool hasPermission() const override { return permissionGranted_; }
    void requestPermission(PermissionCallback callback) override;
    PlatformStatus queryStatus(const QString& platformId) const override;

    void setPermissionGranted(bool granted);

    /// Stored immediately; a registered channel keeps its settings until restart.
    void setChannelConfig(const ChannelConfig& config);
    const ChannelConfig& channelConfig() const { return channel_; }
    const ChannelConfig& registeredChannel() const { return registered_; }

    static qint64 repeatIntervalMs(RepeatInterval interval);

private:
    PendingNotificationTable table_;
    ChannelConfig channel_;
    ChannelConfig registered_;
    bool channelRegistered_ = false;
    bool permissionGranted_;
    int nextId_ = 1;
};

} // namespace herald
