#include "sync/sync_config.hpp"
#include "core/log.hpp"
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>

namespace mindsync::sync {

namespace {

std::chrono::milliseconds read_duration(QSettings& settings, const char* key, const char* env,
                                        std::chrono::milliseconds fallback) {
    bool ok = false;
    auto value = settings.value(QString::fromLatin1(key)).toLongLong(&ok);
    auto result = ok && value > 0 ? std::chrono::milliseconds(value) : fallback;

    if (qEnvironmentVariableIsSet(env)) {
        auto overridden = qEnvironmentVariable(env).toLongLong(&ok);
        if (ok && overridden > 0) {
            result = std::chrono::milliseconds(overridden);
        } else {
            qCWarning(mindsyncSyncLog) << "Ignoring invalid" << env;
        }
    }
    return result;
}

bool parse_flag(const QString& text, bool fallback) {
    const auto lowered = text.trimmed().toLower();
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") return true;
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") return false;
    return fallback;
}

} // namespace

SyncConfig load_sync_config(QSettings& settings) {
    SyncConfig config;

    bool ok = false;
    auto batch = settings.value("sync/batchSize").toInt(&ok);
    if (ok && batch > 0) config.batch_size = batch;
    if (qEnvironmentVariableIsSet("MINDSYNC_BATCH_SIZE")) {
        batch = qEnvironmentVariable("MINDSYNC_BATCH_SIZE").toInt(&ok);
        if (ok && batch > 0) {
            config.batch_size = batch;
        } else {
            qCWarning(mindsyncSyncLog) << "Ignoring invalid MINDSYNC_BATCH_SIZE";
        }
    }

    config.sync_interval = read_duration(settings, "sync/intervalMs", "MINDSYNC_SYNC_INTERVAL_MS",
                                         config.sync_interval);
    config.backoff_base = read_duration(settings, "sync/backoffBaseMs", "MINDSYNC_BACKOFF_BASE_MS",
                                        config.backoff_base);
    config.backoff_cap = read_duration(settings, "sync/backoffCapMs", "MINDSYNC_BACKOFF_CAP_MS",
                                       config.backoff_cap);
    config.lock_lease = read_duration(settings, "sync/lockLeaseMs", "MINDSYNC_LOCK_LEASE_MS",
                                      config.lock_lease);

    config.evict_on_switch = parse_flag(settings.value("sync/evictOnSwitch").toString(),
                                        config.evict_on_switch);
    if (qEnvironmentVariableIsSet("MINDSYNC_EVICT_ON_SWITCH")) {
        config.evict_on_switch = parse_flag(qEnvironmentVariable("MINDSYNC_EVICT_ON_SWITCH"),
                                            config.evict_on_switch);
    }

    if (config.backoff_cap < config.backoff_base) {
        config.backoff_cap = config.backoff_base;
    }
    return config;
}

QString resolve_database_path(QSettings& settings) {
    auto path = qEnvironmentVariable("MINDSYNC_DB_PATH");
    if (path.isEmpty()) {
        path = settings.value("storage/databasePath").toString();
    }
    if (!path.isEmpty()) {
        QFileInfo info(path);
        QDir().mkpath(info.absolutePath());
        return info.absoluteFilePath();
    }

    const auto data_path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(data_path);
    return QDir(data_path).filePath(QStringLiteral("mindsync.db"));
}

QString resolve_remote_root(QSettings& settings) {
    auto path = qEnvironmentVariable("MINDSYNC_REMOTE_DIR");
    if (path.isEmpty()) {
        path = settings.value("remote/folder").toString();
    }
    if (!path.isEmpty()) {
        return QFileInfo(path).absoluteFilePath();
    }
    const auto data_path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(data_path).filePath(QStringLiteral("remote"));
}

void apply_debug_logging() {
    if (qEnvironmentVariableIsSet("MINDSYNC_DEBUG_SYNC")) {
        QLoggingCategory::setFilterRules(QStringLiteral("mindsync.*.debug=true"));
    }
}

} // namespace mindsync::sync
