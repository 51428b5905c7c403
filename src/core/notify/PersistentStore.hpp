#pragma once

#include "core/notify/ReturnNotificationPolicy.hpp"
#include "core/notify/ScheduleIndex.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QObject>
#include <QTimer>
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>

namespace herald {

class CircuitBreaker;
class NotificationMetrics;

struct StoreSnapshot {
    static constexpr int kFormatVersion = 1;

    int version = kFormatVersion;
    QList<IndexEntry> entries;
    ReturnNotificationConfig returnConfig;
    QDateTime lastForeground;
};

/**
 * PersistentStore: durable snapshot of the schedule index, the return
 * notification config and the last-foreground time.
 *
 * File format is a compact JSON object carrying a CRC-32 computed over the
 * same document with "crc32" set to 0. Writes go to "<path>.tmp", are
 * fsync'd, then renamed over the main file. Corrupt, oversized or
 * unparsable files are deleted on load and the store starts empty.
 *
 * A legacy QSettings INI file is migrated once when no snapshot exists;
 * it is deleted after the next successful save.
 *
 * markDirty() is thread-safe. Everything else runs on the owning thread.
 */
class PersistentStore : public QObject {
    Q_OBJECT
public:
    struct Settings {
        QString path;
        QString legacyPath;
        int debounceMs = 500;
        qint64 maxFileBytes = 256 * 1024;
        int saveAttempts = 3;
        int retryDelayMs = 100;
    };

    enum class LoadSource {
        Empty,
        Snapshot,
        RecoveredTemp,
        Legacy
    };

    struct LoadResult {
        StoreSnapshot snapshot;
        LoadSource source = LoadSource::Empty;
    };

    using SnapshotProvider = std::function<StoreSnapshot()>;

    PersistentStore(const Settings& settings, CircuitBreaker* breaker = nullptr,
                    NotificationMetrics* metrics = nullptr, QObject* parent = nullptr);

    /// Never throws; recovery from corruption is silent apart from logging.
    LoadResult load();

    void setSnapshotProvider(SnapshotProvider provider) { provider_ = std::move(provider); }

    /// Sets the dirty flag and arms the debounce timer.
    void markDirty();
    bool isDirty() const { return dirty_.load(); }

    /// Saves when dirty. Skipped (stays dirty) while the breaker is open.
    bool flush();

    /// Shutdown path: ignores the breaker, retries within budget.
    bool flushSync(std::chrono::milliseconds budget);

    /// One write attempt of the given snapshot.
    bool save(const StoreSnapshot& snapshot);

    QString path() const { return settings_.path; }
    QString tempPath() const { return settings_.path + QStringLiteral(".tmp"); }
    bool legacyMigrationPending() const { return legacyPending_; }

    static QByteArray serialize(const StoreSnapshot& snapshot);
    static std::optional<StoreSnapshot> parse(const QByteArray& bytes);
    static quint32 checksum(const QByteArray& bytes);

signals:
    void saved();
    void saveFailed(const QString& reason);

private:
    std::optional<StoreSnapshot> readFile(const QString& filePath);
    std::optional<StoreSnapshot> readLegacy();
    bool writeAtomically(const QByteArray& bytes, QString* error);

    Settings settings_;
    CircuitBreaker* breaker_;
    NotificationMetrics* metrics_;
    SnapshotProvider provider_;
    QTimer debounce_;
    std::atomic<bool> dirty_{false};
    bool legacyPending_ = false;
};

} // namespace herald
