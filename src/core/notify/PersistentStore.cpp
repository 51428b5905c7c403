#include "core/notify/PersistentStore.hpp"
#include "core/notify/CircuitBreaker.hpp"
#include "core/notify/NotificationMetrics.hpp"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QThread>
#include <boost/crc.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cmath>
#include <unistd.h>

namespace herald {

namespace {

QJsonObject toJsonObject(const StoreSnapshot& snapshot, quint32 crc)
{
    QJsonArray notifications;
    for (const auto& e : snapshot.entries) {
        QJsonObject n;
        n["identifier"] = e.identifier;
        n["platform_id"] = e.platformId;
        if (!e.groupKey.isEmpty())
            n["group"] = e.groupKey;
        notifications.append(n);
    }

    QJsonObject root;
    root["version"] = snapshot.version;
    root["notifications"] = notifications;
    root["return_config"] = snapshot.returnConfig.toJson();
    root["last_foreground_unix"] = snapshot.lastForeground.isValid()
        ? static_cast<double>(snapshot.lastForeground.toSecsSinceEpoch()) : 0.0;
    root["crc32"] = static_cast<double>(crc);
    return root;
}

} // namespace

PersistentStore::PersistentStore(const Settings& settings, CircuitBreaker* breaker,
                                 NotificationMetrics* metrics, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , breaker_(breaker)
    , metrics_(metrics)
{
    debounce_.setSingleShot(true);
    debounce_.setInterval(settings_.debounceMs);
    connect(&debounce_, &QTimer::timeout, this, [this]() { flush(); });
}

quint32 PersistentStore::checksum(const QByteArray& bytes)
{
    boost::crc_32_type crc;
    crc.process_bytes(bytes.constData(), static_cast<std::size_t>(bytes.size()));
    return crc.checksum();
}

QByteArray PersistentStore::serialize(const StoreSnapshot& snapshot)
{
    const QByteArray unsignedBytes = QJsonDocument(toJsonObject(snapshot, 0)).toJson(QJsonDocument::Compact);
    const quint32 crc = checksum(unsignedBytes);
    return QJsonDocument(toJsonObject(snapshot, crc)).toJson(QJsonDocument::Compact);
}

std::optional<StoreSnapshot> PersistentStore::parse(const QByteArray& bytes)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Parse error: " << err.errorString().toStdString();
        return std::nullopt;
    }

    QJsonObject root = doc.object();
    const QJsonValue crcValue = root.value("crc32");
    if (!crcValue.isDouble()) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Missing checksum";
        return std::nullopt;
    }
    const double rawCrc = crcValue.toDouble();
    if (!(rawCrc >= 0.0 && rawCrc <= 4294967295.0) || rawCrc != std::floor(rawCrc)) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Checksum out of range: " << rawCrc;
        return std::nullopt;
    }
    const quint32 stored = static_cast<quint32>(rawCrc);

    root["crc32"] = 0.0;
    const quint32 computed = checksum(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (computed != stored) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Checksum mismatch (stored " << stored
                                   << ", computed " << computed << ")";
        return std::nullopt;
    }

    StoreSnapshot snapshot;
    snapshot.version = root.value("version").toInt(StoreSnapshot::kFormatVersion);
    if (snapshot.version != StoreSnapshot::kFormatVersion) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Unsupported format version " << snapshot.version;
        return std::nullopt;
    }

    for (const auto& v : root.value("notifications").toArray()) {
        const QJsonObject n = v.toObject();
        IndexEntry e{n.value("identifier").toString(), n.value("platform_id").toString(),
                     n.value("group").toString()};
        if (e.identifier.isEmpty()) continue;
        snapshot.entries.append(e);
    }

    snapshot.returnConfig = ReturnNotificationConfig::fromJson(root.value("return_config").toObject());

    const qint64 lastSecs = static_cast<qint64>(root.value("last_foreground_unix").toDouble(0));
    if (lastSecs > 0)
        snapshot.lastForeground = QDateTime::fromSecsSinceEpoch(lastSecs, Qt::UTC);

    return snapshot;
}

std::optional<StoreSnapshot> PersistentStore::readFile(const QString& filePath)
{
    const QFileInfo info(filePath);
    if (info.size() > settings_.maxFileBytes) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] " << filePath.toStdString() << " is "
                                   << info.size() << " bytes (limit " << settings_.maxFileBytes
                                   << "), discarding";
        QFile::remove(filePath);
        return std::nullopt;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Cannot open " << filePath.toStdString()
                                   << ": " << file.errorString().toStdString();
        return std::nullopt;
    }
    const QByteArray bytes = file.readAll();
    file.close();

    auto snapshot = parse(bytes);
    if (!snapshot) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Discarding corrupt store " << filePath.toStdString();
        QFile::remove(filePath);
    }
    return snapshot;
}

std::optional<StoreSnapshot> PersistentStore::readLegacy()
{
    if (settings_.legacyPath.isEmpty() || !QFile::exists(settings_.legacyPath))
        return std::nullopt;

    QSettings legacy(settings_.legacyPath, QSettings::IniFormat);
    if (legacy.status() != QSettings::NoError) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Legacy file unreadable: "
                                   << settings_.legacyPath.toStdString();
        return std::nullopt;
    }

    StoreSnapshot snapshot;

    const QStringList identifiers = legacy.value("ScheduledNotificationIds/identifiers").toStringList();
    const QStringList ids = legacy.value("ScheduledNotificationIds/ids").toStringList();
    const QStringList groups = legacy.value("ScheduledNotificationIds/groups").toStringList();
    for (int i = 0; i < identifiers.size(); ++i) {
        if (identifiers[i].isEmpty()) continue;
        snapshot.entries.append(IndexEntry{identifiers[i], ids.value(i), groups.value(i)});
    }

    const QVariant lastOpen = legacy.value("LastAppOpenTime");
    if (lastOpen.isValid()) {
        bool ok = false;
        const qint64 secs = lastOpen.toString().toLongLong(&ok);
        if (ok && secs > 0)
            snapshot.lastForeground = QDateTime::fromSecsSinceEpoch(secs, Qt::UTC);
        else
            snapshot.lastForeground = QDateTime::fromString(lastOpen.toString(), Qt::ISODate);
    }

    legacy.beginGroup("ReturnNotificationConfig");
    ReturnNotificationConfig& rc = snapshot.returnConfig;
    rc.enabled = legacy.value("enabled", rc.enabled).toBool();
    rc.title = legacy.value("title", rc.title).toString();
    rc.body = legacy.value("body", rc.body).toString();
    rc.hoursBeforeNotification = legacy.value("hours_before", rc.hoursBeforeNotification).toInt();
    rc.repeating = legacy.value("repeating", rc.repeating).toBool();
    rc.repeatInterval = repeatIntervalFromName(legacy.value("repeat_interval").toString(), rc.repeatInterval);
    rc.identifier = legacy.value("identifier", rc.identifier).toString();
    legacy.endGroup();

    return snapshot;
}

PersistentStore::LoadResult PersistentStore::load()
{
    LoadResult result;

    if (QFile::exists(settings_.path)) {
        if (auto snapshot = readFile(settings_.path)) {
            QFile::remove(tempPath());
            result.snapshot = *snapshot;
            result.source = LoadSource::Snapshot;
            BOOST_LOG_TRIVIAL(info) << "[PersistentStore] Loaded " << result.snapshot.entries.size()
                                    << " notification(s) from " << settings_.path.toStdString();
            return result;
        }
    }

    // Crash between removing the main file and the rename leaves only the temp file.
    if (QFile::exists(tempPath())) {
        if (auto snapshot = readFile(tempPath())) {
            if (QFile::rename(tempPath(), settings_.path)) {
                BOOST_LOG_TRIVIAL(info) << "[PersistentStore] Recovered store from " << tempPath().toStdString();
            } else {
                BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] Recovered store from temp file but could not promote it";
                markDirty();
            }
            result.snapshot = *snapshot;
            result.source = LoadSource::RecoveredTemp;
            return result;
        }
    }

    if (auto legacy = readLegacy()) {
        result.snapshot = *legacy;
        result.source = LoadSource::Legacy;
        legacyPending_ = true;
        BOOST_LOG_TRIVIAL(info) << "[PersistentStore] Migrating " << legacy->entries.size()
                                << " notification(s) from legacy file " << settings_.legacyPath.toStdString();
        markDirty();
        return result;
    }

    BOOST_LOG_TRIVIAL(info) << "[PersistentStore] No stored state, starting empty";
    return result;
}

void PersistentStore::markDirty()
{
    dirty_.store(true);

    if (QThread::currentThread() == thread()) {
        if (!debounce_.isActive())
            debounce_.start();
        return;
    }

    QMetaObject::invokeMethod(this, [this]() {
        if (!debounce_.isActive())
            debounce_.start();
    }, Qt::QueuedConnection);
}

bool PersistentStore::flush()
{
    if (!dirty_.load()) return true;

    if (breaker_ && breaker_->isOpen()) {
        BOOST_LOG_TRIVIAL(debug) << "[PersistentStore] Circuit open, flush deferred";
        return false;
    }
    if (!provider_) {
        BOOST_LOG_TRIVIAL(warning) << "[PersistentStore] No snapshot provider, nothing to save";
        return false;
    }

    dirty_.store(false);
    if (!save(provider_())) {
        dirty_.store(true);
        if (breaker_) breaker_->recordError();
        return false;
    }
    return true;
}

bool PersistentStore::flushSync(std::chrono::milliseconds budget)
{
    debounce_.stop();
    if (!dirty_.load()) return true;
    if (!provider_) return false;

    QElapsedTimer elapsed;
    elapsed.start();

    const StoreSnapshot snapshot = provider_();
    const int attempts = std::max(1, settings_.saveAttempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (save(snapshot)) {
            dirty_.store(false);
            return true;
        }
        if (attempt == attempts || elapsed.elapsed() + settings_.retryDelayMs > budget.count())
            break;
        QThread::msleep(static_cast<unsigned long>(settings_.retryDelayMs));
    }

    BOOST_LOG_TRIVIAL(error) << "[PersistentStore] Shutdown flush failed after "
                             << elapsed.elapsed() << " ms";
    return false;
}

bool PersistentStore::save(const StoreSnapshot& snapshot)
{
    const auto start = NotificationMetrics::Clock::now();

    QString error;
    if (!writeAtomically(serialize(snapshot), &error)) {
        BOOST_LOG_TRIVIAL(error) << "[PersistentStore] Save failed: " << error.toStdString();
        emit saveFailed(error);
        return false;
    }

    if (legacyPending_) {
        if (QFile::remove(settings_.legacyPath) || !QFile::exists(settings_.legacyPath)) {
            legacyPending_ = false;
            BOOST_LOG_TRIVIAL(info) << "[PersistentStore] Legacy file migrated and removed";
        }
    }

    if (metrics_)
        metrics_->recordSaveTime(NotificationMetrics::msElapsed(start, NotificationMetrics::Clock::now()));

    BOOST_LOG_TRIVIAL(debug) << "[PersistentStore] Saved " << snapshot.entries.size() << " notification(s)";
    emit saved();
    return true;
}

bool PersistentStore::writeAtomically(const QByteArray& bytes, QString* error)
{
    const QFileInfo info(settings_.path);
    if (!QDir().mkpath(info.absolutePath())) {
        *error = QStringLiteral("cannot create directory %1").arg(info.absolutePath());
        return false;
    }

    QFile tmp(tempPath());
    if (!tmp.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        *error = QStringLiteral("cannot open %1: %2").arg(tempPath(), tmp.errorString());
        return false;
    }
    if (tmp.write(bytes) != bytes.size() || !tmp.flush()) {
        *error = QStringLiteral("short write to %1: %2").arg(tempPath(), tmp.errorString());
        tmp.close();
        QFile::remove(tempPath());
        return false;
    }
    if (::fsync(tmp.handle()) != 0) {
        *error = QStringLiteral("fsync failed on %1").arg(tempPath());
        tmp.close();
        QFile::remove(tempPath());
        return false;
    }
    tmp.close();

    if (QFile::exists(settings_.path) && !QFile::remove(settings_.path)) {
        *error = QStringLiteral("cannot replace %1").arg(settings_.path);
        return false;
    }
    if (!QFile::rename(tempPath(), settings_.path)) {
        *error = QStringLiteral("cannot rename %1 to %2").arg(tempPath(), settings_.path);
        return false;
    }
    return true;
}

} // namespace herald
