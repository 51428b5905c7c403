#include "NotificationService.hpp"
#include "core/Logging.hpp"
#include "core/platform/AbsoluteTimePlatformAdapter.hpp"
#include "core/platform/CalendarPlatformAdapter.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <future>

namespace herald {

namespace {

PersistentStore::Settings storeSettingsFrom(const HeraldConfig& config)
{
    PersistentStore::Settings s;
    s.path = config.storePath();
    s.legacyPath = config.legacyPath();
    s.debounceMs = config.saveDebounceMs();
    s.maxFileBytes = config.maxStoreBytes();
    s.saveAttempts = config.saveAttempts();
    s.retryDelayMs = config.saveRetryDelayMs();
    return s;
}

} // namespace

NotificationService::NotificationService(const HeraldConfig& config,
                                         MainThreadDispatcher* dispatcher,
                                         std::unique_ptr<IPlatformAdapter> platform,
                                         QObject* parent)
    : QObject(parent)
    , config_(config)
    , dispatcher_(dispatcher)
    , platform_(std::move(platform))
    , index_(config.maxTracked(), &groups_)
    , breaker_(config.breakerThreshold(), std::chrono::seconds(config.breakerCooldownSeconds()))
    , descriptorPool_(config.descriptorPoolSize())
    , events_(config.eventPoolSize())
    , store_(storeSettingsFrom(config), &breaker_, &metrics_)
    , returnPolicy_(this)
{
    breakerTimer_.setInterval(config_.breakerPollIntervalMs());
    connect(&breakerTimer_, &QTimer::timeout, this, &NotificationService::pollBreaker);

    metricsTimer_.setInterval(config_.metricsFlushIntervalMs());
    connect(&metricsTimer_, &QTimer::timeout, this, &NotificationService::foldCounters);
}

NotificationService::~NotificationService()
{
    shutdown();
}

bool NotificationService::initialize()
{
    if (initialized_.load()) return true;
    if (shutDown_.load()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] initialize() after shutdown ignored";
        return false;
    }
    if (!dispatcher_ || !platform_) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationService] Missing dispatcher or platform adapter";
        return false;
    }

    if (!platform_->initialize()) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationService] Platform '" << platform_->name().toStdString()
                                 << "' failed to initialize";
        return false;
    }

    connect(platform_.get(), &IPlatformAdapter::notificationFired,
            this, &NotificationService::onPlatformFired);
    connect(platform_.get(), &IPlatformAdapter::permissionChanged, this,
            [this](bool granted) { applyPermission(granted, false); });
    connect(&store_, &PersistentStore::saveFailed, this, [this](const QString& reason) {
        metrics_.recordError();
        events_.publish(NotificationEventType::Error, QString(), QString(), QString(),
                        NotificationError{ErrorKind::Persistence, QStringLiteral("save"), reason});
    });

    store_.setSnapshotProvider([this]() { return currentSnapshot(); });

    const PersistentStore::LoadResult loaded = store_.load();
    if (loaded.source == PersistentStore::LoadSource::Empty) {
        returnPolicy_.configure(config_.returnNotificationConfig());
    } else {
        index_.restore(loaded.snapshot.entries);
        returnPolicy_.configure(loaded.snapshot.returnConfig);
        returnPolicy_.setLastForeground(loaded.snapshot.lastForeground);
    }

    lastPermission_.store(platform_->hasPermission());

    if (!dispatcher_->isRunning())
        dispatcher_->start();
    breakerTimer_.start();
    metricsTimer_.start();

    initialized_.store(true);

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Initialized with backend '"
                            << platform_->name().toStdString() << "', "
                            << index_.count() << " tracked notification(s)";

    requestPermission();
    return true;
}

void NotificationService::shutdown()
{
    if (!initialized_.load() || shutDown_.exchange(true)) return;

    breakerTimer_.stop();
    metricsTimer_.stop();
    foldCounters();

    const auto budget = std::chrono::milliseconds(config_.shutdownBudgetMs());
    if (!store_.flushSync(budget))
        BOOST_LOG_TRIVIAL(error) << "[NotificationService] Final snapshot was not written";

    const PerformanceMetrics m = metrics_.snapshot();
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Shut down: scheduled=" << m.totalScheduled
                            << " cancelled=" << m.totalCancelled << " errors=" << m.totalErrors;
}

bool NotificationService::commandAllowed(const char* operation) const
{
    if (shutDown_.load()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] " << operation << "() after shutdown";
        return false;
    }
    if (!initialized_.load()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] " << operation << "() before initialize()";
        return false;
    }
    if (!dispatcher_->isDispatcherThread()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] " << operation
                                   << "() called off the dispatcher thread, use the async variant";
        return false;
    }
    return true;
}

void NotificationService::reportError(ErrorKind kind, const QString& operation,
                                      const QString& identifier, const QString& message)
{
    metrics_.recordError();
    events_.publish(NotificationEventType::Error, identifier, QString(), QString(),
                    NotificationError{kind, operation, message});
}

// --- Commands ---

bool NotificationService::schedule(const NotificationDescriptor& descriptor)
{
    if (!commandAllowed("schedule")) return false;

    std::unique_ptr<NotificationDescriptor> working = descriptorPool_.acquire();
    working->copyFrom(descriptor);
    const bool ok = scheduleOne(*working);
    descriptorPool_.release(std::move(working));
    return ok;
}

bool NotificationService::scheduleOne(NotificationDescriptor& d)
{
    const QString op = QStringLiteral("schedule");

    if (d.identifier.isEmpty())
        d.identifier = generateIdentifier();

    const QString message = validationMessage(d);
    if (!message.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Rejected '" << d.identifier.toStdString()
                                   << "': " << message.toStdString();
        reportError(ErrorKind::Validation, op, d.identifier, message);
        return false;
    }

    if (breaker_.isOpen()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Circuit open, '"
                                   << d.identifier.toStdString() << "' not scheduled";
        reportError(ErrorKind::CircuitOpen, op, d.identifier,
                    QStringLiteral("circuit breaker open after repeated platform errors"));
        return false;
    }

    const std::optional<QString> previous = index_.platformIdOf(d.identifier);
    if (!previous && platform_->pendingCount() >= platform_->maxPending()) {
        const QString reason = QStringLiteral("platform limit of %1 pending notifications reached")
                                   .arg(platform_->maxPending());
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] '" << d.identifier.toStdString()
                                   << "' rejected: " << reason.toStdString();
        reportError(ErrorKind::CapacityExceeded, op, d.identifier, reason);
        return false;
    }

    if (previous)
        platform_->cancel(d.identifier, *previous);

    const PlatformResult result = platform_->schedule(d);
    if (!result.ok()) {
        breaker_.recordError();
        if (previous) {
            // The old platform entry is gone; stop tracking it.
            index_.remove(d.identifier);
            store_.markDirty();
        }
        BOOST_LOG_TRIVIAL(error) << "[NotificationService] Platform refused '"
                                 << d.identifier.toStdString() << "': "
                                 << result.error.toString().toStdString();
        reportError(result.error.kind, op, d.identifier, result.error.message);
        return false;
    }

    breaker_.recordSuccess();
    index_.insert(d.identifier, result.platformId, d.groupKey);
    metrics_.recordScheduled();
    store_.markDirty();

    BOOST_LOG_TRIVIAL(debug) << "[NotificationService] Scheduled '" << d.identifier.toStdString()
                             << "' in " << d.fireDelaySeconds << "s (platform id "
                             << result.platformId.toStdString() << ")";
    return true;
}

QString NotificationService::send(const QString& title, const QString& body, qint64 delaySeconds,
                                  const QString& identifier)
{
    NotificationBuilder builder = createNotification();
    builder.withTitle(title).withBody(body).withIdentifier(identifier).in(delaySeconds);
    return builder.schedule() ? builder.identifier() : QString();
}

QString NotificationService::send(const QString& title, const QString& body, int days, int hours,
                                  int minutes, int seconds, const QString& identifier)
{
    NotificationBuilder builder = createNotification();
    builder.withTitle(title).withBody(body).withIdentifier(identifier)
        .in(days, hours, minutes, seconds);
    return builder.schedule() ? builder.identifier() : QString();
}

QString NotificationService::sendAt(const QString& title, const QString& body, const QDateTime& when,
                                    const QString& identifier)
{
    NotificationBuilder builder = createNotification();
    builder.withTitle(title).withBody(body).withIdentifier(identifier).at(when);
    return builder.schedule() ? builder.identifier() : QString();
}

QString NotificationService::sendRepeating(const QString& title, const QString& body,
                                           qint64 delaySeconds, RepeatInterval interval,
                                           const QString& identifier)
{
    NotificationBuilder builder = createNotification();
    builder.withTitle(title).withBody(body).withIdentifier(identifier)
        .in(delaySeconds).repeating(interval);
    return builder.schedule() ? builder.identifier() : QString();
}

int NotificationService::scheduleBatch(const QList<NotificationDescriptor>& descriptors)
{
    if (!commandAllowed("scheduleBatch")) return 0;

    const int limit = std::min<int>(descriptors.size(), config_.maxBatch());
    if (descriptors.size() > limit) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Batch of " << descriptors.size()
                                   << " truncated to " << limit;
    }

    int scheduled = 0;
    for (int i = 0; i < limit; ++i) {
        if (schedule(descriptors.at(i)))
            ++scheduled;
    }
    return scheduled;
}

bool NotificationService::cancel(const QString& identifier)
{
    if (!commandAllowed("cancel")) return false;

    const std::optional<QString> platformId = index_.remove(identifier);
    if (!platformId) {
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] cancel: '" << identifier.toStdString()
                                 << "' is not tracked";
        return false;
    }

    if (!platform_->cancel(identifier, *platformId)) {
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] cancel: platform had no pending '"
                                 << identifier.toStdString() << "'";
    }

    metrics_.recordCancelled();
    store_.markDirty();
    return true;
}

int NotificationService::cancelBatch(const QStringList& identifiers)
{
    if (!commandAllowed("cancelBatch")) return 0;

    const int limit = std::min<int>(identifiers.size(), config_.maxBatch());
    if (identifiers.size() > limit) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Cancel batch of " << identifiers.size()
                                   << " truncated to " << limit;
    }

    int cancelled = 0;
    for (int i = 0; i < limit; ++i) {
        if (cancel(identifiers.at(i)))
            ++cancelled;
    }
    return cancelled;
}

int NotificationService::cancelGroup(const QString& groupKey)
{
    if (!commandAllowed("cancelGroup")) return 0;

    const int visited = groups_.cancelGroup(groupKey, [this](const QString& identifier) {
        dispatcher_->runOrPost([this, identifier]() { cancel(identifier); });
    });

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Cancelled group '" << groupKey.toStdString()
                            << "' (" << visited << " member(s))";
    return visited;
}

void NotificationService::cancelAllScheduled()
{
    if (!commandAllowed("cancelAllScheduled")) return;

    platform_->cancelAllScheduled();
    const int tracked = index_.count();
    index_.clear();
    metrics_.recordCancelled(static_cast<uint64_t>(tracked));
    store_.markDirty();

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Cancelled all scheduled (" << tracked << ")";
}

void NotificationService::cancelAllDisplayed()
{
    if (!commandAllowed("cancelAllDisplayed")) return;
    platform_->cancelAllDisplayed();
}

void NotificationService::cancelAll()
{
    cancelAllScheduled();
    cancelAllDisplayed();
}

void NotificationService::configureReturnNotification(const ReturnNotificationConfig& config)
{
    if (!commandAllowed("configureReturnNotification")) return;
    returnPolicy_.configure(config);
    store_.markDirty();
}

void NotificationService::setReturnNotificationEnabled(bool enabled)
{
    if (!commandAllowed("setReturnNotificationEnabled")) return;
    returnPolicy_.setEnabled(enabled);
    store_.markDirty();
}

bool NotificationService::setChannelConfig(const ChannelConfig& config)
{
    if (!commandAllowed("setChannelConfig")) return false;

    auto* absolute = dynamic_cast<AbsoluteTimePlatformAdapter*>(platform_.get());
    if (!absolute) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Channels are not supported by backend '"
                                   << platform_->name().toStdString() << "'";
        return false;
    }
    absolute->setChannelConfig(config);
    return true;
}

bool NotificationService::setBadgeCount(int count)
{
    if (!commandAllowed("setBadgeCount")) return false;

    auto* calendar = dynamic_cast<CalendarPlatformAdapter*>(platform_.get());
    if (!calendar) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Badges are not supported by backend '"
                                   << platform_->name().toStdString() << "'";
        return false;
    }
    calendar->setBadgeCount(count);
    return true;
}

void NotificationService::onApplicationBackgrounded()
{
    if (!commandAllowed("onApplicationBackgrounded")) return;

    returnPolicy_.onBackground();
    store_.markDirty();
    store_.flush();
}

void NotificationService::onApplicationForegrounded()
{
    if (!commandAllowed("onApplicationForegrounded")) return;

    if (returnPolicy_.onForeground())
        BOOST_LOG_TRIVIAL(info) << "[NotificationService] Urgent return notification scheduled";
    store_.markDirty();

    cancelAllDisplayed();
    refreshPermission();
    cleanupExpired();
}

int NotificationService::cleanupExpired()
{
    if (!commandAllowed("cleanupExpired")) return 0;

    int removed = 0;
    const QList<IndexEntry> entries = index_.snapshot();
    for (const IndexEntry& entry : entries) {
        if (platform_->queryStatus(entry.platformId) == PlatformStatus::Scheduled)
            continue;
        if (index_.remove(entry.identifier))
            ++removed;
    }

    if (removed > 0) {
        store_.markDirty();
        BOOST_LOG_TRIVIAL(info) << "[NotificationService] Pruned " << removed
                                << " delivered or unknown notification(s)";
    }
    return removed;
}

void NotificationService::requestPermission(PermissionCallback callback)
{
    if (!commandAllowed("requestPermission")) {
        if (callback) callback(hasPermission());
        return;
    }

    platform_->requestPermission([this, callback](bool granted) {
        applyPermission(granted, true);
        if (callback) callback(granted);
    });
}

void NotificationService::applyPermission(bool granted, bool announce)
{
    const bool previous = lastPermission_.exchange(granted);
    if (previous == granted && !announce) return;

    if (previous != granted) {
        BOOST_LOG_TRIVIAL(info) << "[NotificationService] Permission "
                                << (granted ? "granted" : "denied");
    }
    events_.publish(granted ? NotificationEventType::PermissionGranted
                            : NotificationEventType::PermissionDenied);
}

void NotificationService::refreshPermission()
{
    applyPermission(platform_->hasPermission(), false);
}

bool NotificationService::flushNow()
{
    if (!commandAllowed("flushNow")) return false;
    store_.markDirty();
    return store_.flush();
}

void NotificationService::notificationTapped(const QString& identifier)
{
    BOOST_LOG_TRIVIAL(debug) << "[NotificationService] Tapped '" << identifier.toStdString() << "'";
    events_.publish(NotificationEventType::Tapped, identifier);
}

void NotificationService::onPlatformFired(const QString& identifier, const QString& title,
                                          const QString& body, const QString& subtitle)
{
    events_.publish(NotificationEventType::Received, identifier, title, body);
    emit notificationReceived(identifier, title, body, subtitle);

    const std::optional<QString> platformId = index_.platformIdOf(identifier);
    if (platformId && platform_->queryStatus(*platformId) != PlatformStatus::Scheduled) {
        index_.remove(identifier);
        store_.markDirty();
    }
}

void NotificationService::pollBreaker()
{
    if (breaker_.poll()) {
        BOOST_LOG_TRIVIAL(info) << "[NotificationService] Circuit closed, resuming";
        if (store_.isDirty())
            store_.flush();
    }
}

void NotificationService::foldCounters()
{
    const auto descriptors = descriptorPool_.takeCounters();
    const auto records = events_.pool().takeCounters();
    metrics_.recordPoolCounters(descriptors.hits + records.hits, descriptors.misses + records.misses);
    const uint64_t drops = dispatcher_ ? dispatcher_->droppedCount() : 0;
    const uint64_t baseline = dropsAtReset_.load();
    metrics_.setDispatcherDrops(drops > baseline ? drops - baseline : 0);
    metrics_.fold();
}

// --- Queries ---

int NotificationService::count() const
{
    return index_.count();
}

int NotificationService::countByGroup(const QString& groupKey) const
{
    return groups_.countOf(groupKey);
}

QStringList NotificationService::membersOf(const QString& groupKey) const
{
    return groups_.membersOf(groupKey);
}

QStringList NotificationService::allIdentifiers() const
{
    return index_.identifiers();
}

bool NotificationService::isScheduled(const QString& identifier) const
{
    return index_.contains(identifier);
}

QString NotificationService::statusOf(const QString& identifier) const
{
    const std::optional<QString> platformId = index_.platformIdOf(identifier);
    if (!platformId)
        return QString::fromLatin1(platformStatusName(PlatformStatus::NotFound));

    const QString pid = *platformId;
    if (dispatcher_->isDispatcherThread())
        return QString::fromLatin1(platformStatusName(platform_->queryStatus(pid)));

    try {
        const PlatformStatus status = dispatcher_->awaitResult<PlatformStatus>(
            [this, pid]() { return platform_->queryStatus(pid); },
            CancellationToken::none(), asyncTimeout());
        return QString::fromLatin1(platformStatusName(status));
    } catch (const AsyncError& e) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] statusOf('" << identifier.toStdString()
                                   << "') failed: " << e.what();
        return QString::fromLatin1(platformStatusName(PlatformStatus::Unknown));
    }
}

PerformanceMetrics NotificationService::metrics()
{
    foldCounters();
    return metrics_.snapshot();
}

void NotificationService::resetMetrics()
{
    descriptorPool_.takeCounters();
    events_.pool().takeCounters();
    dropsAtReset_.store(dispatcher_ ? dispatcher_->droppedCount() : 0);
    metrics_.reset();
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Metrics reset";
}

QVariantMap NotificationService::debugInfo() const
{
    QVariantMap info;
    info.insert("backend", platform_ ? platform_->name() : QString());
    info.insert("initialized", initialized_.load());
    info.insert("shutDown", shutDown_.load());
    info.insert("tracked", index_.count());
    info.insert("maxTracked", index_.maxTracked());
    info.insert("identifiers", index_.identifiers());
    info.insert("groups", groups_.groupKeys());
    info.insert("permission", hasPermission());
    info.insert("circuitOpen", breaker_.isOpen());
    info.insert("consecutiveErrors", breaker_.consecutiveErrors());
    if (dispatcher_) {
        info.insert("dispatcherPending", dispatcher_->pendingCount());
        info.insert("dispatcherDropped", static_cast<qulonglong>(dispatcher_->droppedCount()));
        info.insert("dispatcherRejected", static_cast<qulonglong>(dispatcher_->rejectedCount()));
    }
    info.insert("storePath", store_.path());
    info.insert("storeDirty", store_.isDirty());
    info.insert("lastForeground", returnPolicy_.lastForeground().toString(Qt::ISODate));
    info.insert("returnNotification", returnPolicy_.config().toJson().toVariantMap());
    info.insert("metrics", metrics_.snapshot().toVariantMap());
    return info;
}

bool NotificationService::setLogLevel(const QString& level)
{
    if (!applyLogLevel(level)) return false;
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Log level set to " << level.toStdString();
    return true;
}

double NotificationService::hoursSinceLastForeground()
{
    return returnPolicy_.hoursSinceLastForeground();
}

// --- Async ---

std::chrono::milliseconds NotificationService::asyncTimeout() const
{
    return std::chrono::milliseconds(config_.asyncTimeoutMs());
}

bool NotificationService::scheduleAsync(const NotificationDescriptor& descriptor,
                                        const CancellationToken& token)
{
    return dispatcher_->awaitResult<bool>([this, descriptor]() { return schedule(descriptor); },
                                          token, asyncTimeout());
}

bool NotificationService::cancelAsync(const QString& identifier, const CancellationToken& token)
{
    return dispatcher_->awaitResult<bool>([this, identifier]() { return cancel(identifier); },
                                          token, asyncTimeout());
}

int NotificationService::countAsync(const CancellationToken& token)
{
    return dispatcher_->awaitResult<int>([this]() { return count(); }, token, asyncTimeout());
}

int NotificationService::scheduleBatchAsync(const QList<NotificationDescriptor>& descriptors,
                                            const CancellationToken& token)
{
    return dispatcher_->awaitResult<int>([this, descriptors]() { return scheduleBatch(descriptors); },
                                         token, asyncTimeout());
}

int NotificationService::cancelBatchAsync(const QStringList& identifiers,
                                          const CancellationToken& token)
{
    return dispatcher_->awaitResult<int>([this, identifiers]() { return cancelBatch(identifiers); },
                                         token, asyncTimeout());
}

bool NotificationService::flushAsync(const CancellationToken& token)
{
    return dispatcher_->awaitResult<bool>([this]() { return flushNow(); }, token, asyncTimeout());
}

bool NotificationService::requestPermissionAsync(const CancellationToken& token)
{
    if (dispatcher_->isDispatcherThread()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] requestPermissionAsync() on the "
                                      "dispatcher thread cannot wait, returning cached state";
        return hasPermission();
    }
    if (token.isCancelled())
        throw OperationCancelledError("permission request cancelled before dispatch");

    auto promise = std::make_shared<std::promise<bool>>();
    auto resolved = std::make_shared<std::atomic<bool>>(false);
    std::future<bool> future = promise->get_future();

    const bool posted = dispatcher_->post([this, promise, resolved]() {
        requestPermission([promise, resolved](bool granted) {
            if (!resolved->exchange(true))
                promise->set_value(granted);
        });
    });
    if (!posted)
        throw QueueFullError("dispatcher queue full");

    return MainThreadDispatcher::waitFor(future, token,
                                         std::chrono::milliseconds(config_.permissionTimeoutMs()));
}

StoreSnapshot NotificationService::currentSnapshot() const
{
    StoreSnapshot snapshot;
    snapshot.entries = index_.snapshot();
    snapshot.returnConfig = returnPolicy_.config();
    snapshot.lastForeground = returnPolicy_.lastForeground();
    return snapshot;
}

} // namespace herald
