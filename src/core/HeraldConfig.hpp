#pragma once

#include "core/notify/MainThreadDispatcher.hpp"
#include "core/notify/ReturnNotificationPolicy.hpp"
#include "core/platform/AbsoluteTimePlatformAdapter.hpp"
#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace herald {

/// YAML-backed configuration. The YAML tree is the only state; typed
/// accessors read it with built-in defaults as fallback.
class HeraldConfig {
public:
    HeraldConfig();

    /// Deep-merges the file over the defaults. Throws YAML::Exception on
    /// unreadable or malformed files; the previous state is kept then.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    /// Keys seen by the last load() that the schema does not know.
    QStringList unknownKeys() const { return unknownKeys_; }

    static QString defaultConfigPath();

    // Limits
    int maxTracked() const;
    int maxBatch() const;

    // Dispatcher
    MainThreadDispatcher::Settings dispatcherSettings() const;

    // Async
    int asyncTimeoutMs() const;
    int permissionTimeoutMs() const;

    // Persistence
    QString storePath() const;
    QString legacyPath() const;
    int saveDebounceMs() const;
    qint64 maxStoreBytes() const;
    int shutdownBudgetMs() const;
    int saveAttempts() const;
    int saveRetryDelayMs() const;

    // Circuit breaker
    int breakerThreshold() const;
    int breakerCooldownSeconds() const;
    int breakerPollIntervalMs() const;

    // Pools / metrics
    int descriptorPoolSize() const;
    int eventPoolSize() const;
    int metricsFlushIntervalMs() const;

    // Platform
    QString platformBackend() const;
    void setPlatformBackend(const QString& v);
    bool permissionGranted() const;
    bool autoIncrementBadge() const;

    ChannelConfig channelConfig() const;
    ReturnNotificationConfig returnNotificationConfig() const;

    // Desktop delivery
    bool desktopEnabled() const;
    QString desktopAppName() const;

    QString logLevel() const;

    // Generic dot-path access (e.g. "persistence.debounce_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;
    QStringList unknownKeys_;

    static YAML::Node defaultsNode();
};

} // namespace herald
