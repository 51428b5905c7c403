#include "core/HeraldConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QDir>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace herald {

namespace {

QString qs(const YAML::Node& node, const char* fallback)
{
    return QString::fromStdString(node.as<std::string>(fallback));
}

QString expandHome(const QString& path)
{
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());
    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool ok = false;
    const int i = s.toInt(&ok);
    if (ok) return QVariant(i);

    const double d = s.toDouble(&ok);
    if (ok) return QVariant(d);

    return QVariant(s);
}

} // namespace

HeraldConfig::HeraldConfig()
    : root_(defaultsNode())
{
}

YAML::Node HeraldConfig::defaultsNode()
{
    YAML::Node root(YAML::NodeType::Map);

    root["limits"]["max_tracked"] = 100;
    root["limits"]["max_batch"] = 50;

    root["dispatcher"]["queue_capacity"] = 1024;
    root["dispatcher"]["max_actions_per_tick"] = 128;
    root["dispatcher"]["tick_budget_ms"] = 2;
    root["dispatcher"]["tick_interval_ms"] = 16;

    root["async"]["timeout_ms"] = 5000;
    root["async"]["permission_timeout_ms"] = 10000;

    root["persistence"]["path"] = "~/.herald/notification_store.json";
    root["persistence"]["legacy_path"] = "~/.herald/notifications.ini";
    root["persistence"]["debounce_ms"] = 500;
    root["persistence"]["max_file_bytes"] = 262144;
    root["persistence"]["shutdown_budget_ms"] = 1000;
    root["persistence"]["save_attempts"] = 3;
    root["persistence"]["retry_delay_ms"] = 100;

    root["circuit_breaker"]["threshold"] = 5;
    root["circuit_breaker"]["cooldown_s"] = 60;
    root["circuit_breaker"]["poll_interval_ms"] = 1000;

    root["pools"]["descriptors"] = 20;
    root["pools"]["events"] = 10;

    root["metrics"]["flush_interval_ms"] = 1000;

    root["platform"]["backend"] = "absolute";
    root["platform"]["permission_granted"] = true;
    root["platform"]["auto_increment_badge"] = true;

    const ChannelConfig channel;
    root["channel"]["id"] = channel.id.toStdString();
    root["channel"]["name"] = channel.name.toStdString();
    root["channel"]["description"] = channel.description.toStdString();
    root["channel"]["importance"] = channelImportanceName(channel.importance).toStdString();
    root["channel"]["vibration"] = channel.enableVibration;
    root["channel"]["lights"] = channel.enableLights;
    root["channel"]["show_badge"] = channel.showBadge;
    root["channel"]["bypass_dnd"] = channel.bypassDnd;

    const ReturnNotificationConfig ret;
    root["return_notification"]["enabled"] = ret.enabled;
    root["return_notification"]["title"] = ret.title.toStdString();
    root["return_notification"]["body"] = ret.body.toStdString();
    root["return_notification"]["hours_before"] = ret.hoursBeforeNotification;
    root["return_notification"]["repeating"] = ret.repeating;
    root["return_notification"]["repeat_interval"] = repeatIntervalName(ret.repeatInterval).toStdString();
    root["return_notification"]["identifier"] = ret.identifier.toStdString();

    root["desktop"]["enabled"] = true;
    root["desktop"]["app_name"] = "Herald";

    root["logging"]["level"] = "info";

    return root;
}

QString HeraldConfig::defaultConfigPath()
{
    return QDir::homePath() + "/.herald/config.yaml";
}

void HeraldConfig::load(const QString& filePath)
{
    const YAML::Node defaults = defaultsNode();
    const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());

    std::vector<std::string> unknown;
    collectUnknownKeys(defaults, loaded, std::string(), unknown);

    root_ = mergeYaml(defaults, loaded);
    unknownKeys_.clear();
    for (const auto& key : unknown) {
        unknownKeys_ << QString::fromStdString(key);
        BOOST_LOG_TRIVIAL(warning) << "[HeraldConfig] Unknown key '" << key << "' in "
                                   << filePath.toStdString();
    }
}

void HeraldConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

// --- Limits ---

int HeraldConfig::maxTracked() const
{
    return root_["limits"]["max_tracked"].as<int>(100);
}

int HeraldConfig::maxBatch() const
{
    return root_["limits"]["max_batch"].as<int>(50);
}

// --- Dispatcher ---

MainThreadDispatcher::Settings HeraldConfig::dispatcherSettings() const
{
    MainThreadDispatcher::Settings s;
    const YAML::Node d = root_["dispatcher"];
    s.capacity = d["queue_capacity"].as<int>(s.capacity);
    s.maxActionsPerTick = d["max_actions_per_tick"].as<int>(s.maxActionsPerTick);
    s.tickBudget = std::chrono::milliseconds(d["tick_budget_ms"].as<int>(2));
    s.tickInterval = std::chrono::milliseconds(d["tick_interval_ms"].as<int>(16));
    return s;
}

// --- Async ---

int HeraldConfig::asyncTimeoutMs() const
{
    return root_["async"]["timeout_ms"].as<int>(5000);
}

int HeraldConfig::permissionTimeoutMs() const
{
    return root_["async"]["permission_timeout_ms"].as<int>(10000);
}

// --- Persistence ---

QString HeraldConfig::storePath() const
{
    return expandHome(qs(root_["persistence"]["path"], "~/.herald/notification_store.json"));
}

QString HeraldConfig::legacyPath() const
{
    return expandHome(qs(root_["persistence"]["legacy_path"], "~/.herald/notifications.ini"));
}

int HeraldConfig::saveDebounceMs() const
{
    return root_["persistence"]["debounce_ms"].as<int>(500);
}

qint64 HeraldConfig::maxStoreBytes() const
{
    return root_["persistence"]["max_file_bytes"].as<qint64>(262144);
}

int HeraldConfig::shutdownBudgetMs() const
{
    return root_["persistence"]["shutdown_budget_ms"].as<int>(1000);
}

int HeraldConfig::saveAttempts() const
{
    return root_["persistence"]["save_attempts"].as<int>(3);
}

int HeraldConfig::saveRetryDelayMs() const
{
    return root_["persistence"]["retry_delay_ms"].as<int>(100);
}

// --- Circuit breaker ---

int HeraldConfig::breakerThreshold() const
{
    return root_["circuit_breaker"]["threshold"].as<int>(5);
}

int HeraldConfig::breakerCooldownSeconds() const
{
    return root_["circuit_breaker"]["cooldown_s"].as<int>(60);
}

int HeraldConfig::breakerPollIntervalMs() const
{
    return root_["circuit_breaker"]["poll_interval_ms"].as<int>(1000);
}

// --- Pools / metrics ---

int HeraldConfig::descriptorPoolSize() const
{
    return root_["pools"]["descriptors"].as<int>(20);
}

int HeraldConfig::eventPoolSize() const
{
    return root_["pools"]["events"].as<int>(10);
}

int HeraldConfig::metricsFlushIntervalMs() const
{
    return root_["metrics"]["flush_interval_ms"].as<int>(1000);
}

// --- Platform ---

QString HeraldConfig::platformBackend() const
{
    return qs(root_["platform"]["backend"], "absolute");
}

void HeraldConfig::setPlatformBackend(const QString& v)
{
    root_["platform"]["backend"] = v.toStdString();
}

bool HeraldConfig::permissionGranted() const
{
    return root_["platform"]["permission_granted"].as<bool>(true);
}

bool HeraldConfig::autoIncrementBadge() const
{
    return root_["platform"]["auto_increment_badge"].as<bool>(true);
}

ChannelConfig HeraldConfig::channelConfig() const
{
    ChannelConfig c;
    const YAML::Node n = root_["channel"];
    c.id = qs(n["id"], "default_channel");
    c.name = qs(n["name"], "Default Channel");
    c.description = qs(n["description"], "Default notification channel");
    c.importance = channelImportanceFromName(qs(n["importance"], "high"));
    c.enableVibration = n["vibration"].as<bool>(true);
    c.enableLights = n["lights"].as<bool>(true);
    c.showBadge = n["show_badge"].as<bool>(true);
    c.bypassDnd = n["bypass_dnd"].as<bool>(false);
    return c;
}

ReturnNotificationConfig HeraldConfig::returnNotificationConfig() const
{
    ReturnNotificationConfig c;
    const YAML::Node n = root_["return_notification"];
    c.enabled = n["enabled"].as<bool>(c.enabled);
    c.title = QString::fromStdString(n["title"].as<std::string>(c.title.toStdString()));
    c.body = QString::fromStdString(n["body"].as<std::string>(c.body.toStdString()));
    c.hoursBeforeNotification = n["hours_before"].as<int>(c.hoursBeforeNotification);
    c.repeating = n["repeating"].as<bool>(c.repeating);
    c.repeatInterval = repeatIntervalFromName(qs(n["repeat_interval"], "daily"), c.repeatInterval);
    c.identifier = QString::fromStdString(n["identifier"].as<std::string>(c.identifier.toStdString()));
    return c;
}

// --- Desktop ---

bool HeraldConfig::desktopEnabled() const
{
    return root_["desktop"]["enabled"].as<bool>(true);
}

QString HeraldConfig::desktopAppName() const
{
    return qs(root_["desktop"]["app_name"], "Herald");
}

QString HeraldConfig::logLevel() const
{
    return qs(root_["logging"]["level"], "info");
}

// --- Generic dot-path access ---

QVariant HeraldConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }
    return yamlScalarToVariant(node);
}

bool HeraldConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only leaves that exist in the default schema are writable.
    YAML::Node schema = defaultsNode();
    for (const auto& part : parts) {
        if (!schema.IsMap()) return false;
        schema.reset(schema[part.toStdString()]);
        if (!schema.IsDefined()) return false;
    }
    if (!schema.IsScalar()) return false;

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        node.reset(node[parts[i].toStdString()]);

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leaf] = value.toBool();
        break;
    case QMetaType::Int:
    case QMetaType::LongLong:
        node[leaf] = value.toLongLong();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leaf] = value.toDouble();
        break;
    default:
        node[leaf] = value.toString().toStdString();
        break;
    }
    return true;
}

} // namespace herald
