#include "app/sync_service.hpp"
#include "core/log.hpp"
#include <QMetaObject>
#include <QThread>
#include <QTimer>
#include <algorithm>
#include <utility>

namespace mindsync::app {

namespace {

QVariantMap report_to_variant(const sync::VaultOpenReport& report) {
    return QVariantMap{
        {QStringLiteral("vaultId"), qs(report.vault_id)},
        {QStringLiteral("fullPull"), report.full_pull},
        {QStringLiteral("usedCachedState"), report.used_cached_state},
        {QStringLiteral("pulled"), report.pulled},
        {QStringLiteral("merged"), report.merged},
        {QStringLiteral("removed"), report.removed},
        {QStringLiteral("skipped"), report.skipped}
    };
}

QString status_string(SyncStatus status) {
    return QString::fromLatin1(sync_status_name(status).data());
}

} // namespace

SyncService::SyncService(storage::LocalStore& store,
                         remote::RemoteAdapter& remote,
                         sync::SyncConfig config,
                         QObject* parent)
    : QObject(parent)
    , store_(store)
    , config_(config)
    , resolver_(store, remote, *this)
    , locks_(store, remote)
    , worker_(store, remote, resolver_, *this, config)
    , switcher_(store, remote, resolver_, locks_, *this, config) {
    worker_.on_corruption = [this](const std::string& vault_id) {
        corrupt_vaults_.insert(vault_id);
    };
}

SyncService::~SyncService() {
    stop();
}

void SyncService::start() {
    if (thread_) return;

    auto rebuilt = store_.rebuild_queue();
    if (rebuilt.is_err()) {
        qCWarning(mindsyncSyncLog) << "Cannot rebuild the operation queue:" << qs(rebuilt.unwrap_err().message);
    } else if (rebuilt.unwrap() > 0) {
        qCInfo(mindsyncSyncLog) << "Re-queued" << rebuilt.unwrap() << "unsynced maps";
    }

    thread_ = std::make_unique<QThread>();
    thread_->setObjectName(QStringLiteral("mindsync-sync"));
    context_ = std::make_unique<QObject>();
    context_->moveToThread(thread_.get());
    thread_->start();

    interval_timer_ = std::make_unique<QTimer>();
    interval_timer_->setInterval(config_.sync_interval);
    connect(interval_timer_.get(), &QTimer::timeout, this, &SyncService::syncNow);
    interval_timer_->start();

    qCInfo(mindsyncSyncLog) << "Sync service started, interval" << config_.sync_interval.count() << "ms";
    schedule_sync();
}

void SyncService::stop() {
    if (interval_timer_) interval_timer_->stop();
    worker_.request_stop();
    switcher_.cancel();

    if (thread_) {
        thread_->quit();
        thread_->wait();
        qCInfo(mindsyncSyncLog) << "Sync service stopped";
    }
    context_.reset();
    thread_.reset();
    interval_timer_.reset();
    worker_.clear_stop();
    sync_scheduled_.store(false);
}

QObject* SyncService::sync_context() {
    return context_ ? context_.get() : this;
}

void SyncService::run_on_sync_thread(std::function<void()> task) {
    if (thread_ && thread_->isRunning()) {
        QMetaObject::invokeMethod(context_.get(), std::move(task), Qt::QueuedConnection);
        return;
    }
    task();
}

// ----------------------------------------------------------------------------
// Vaults
// ----------------------------------------------------------------------------

Result<Vault, Error> SyncService::createVault(const QString& name, const QString& remoteLocation) {
    return store_.create_vault(name.toStdString(), remoteLocation.toStdString());
}

Result<std::vector<Vault>, Error> SyncService::listVaults() {
    return store_.list_vaults();
}

void SyncService::openVault(const QString& vaultId) {
    run_on_sync_thread([this, vault_id = vaultId.toStdString(), ticket = switcher_.ticket()]() {
        run_open(vault_id, false, ticket);
    });
}

void SyncService::switchVault(const QString& vaultId) {
    switcher_.cancel();
    run_on_sync_thread([this, vault_id = vaultId.toStdString(), ticket = switcher_.ticket()]() {
        run_open(vault_id, true, ticket);
    });
}

void SyncService::cancelOpen() {
    switcher_.cancel();
}

bool SyncService::isLocked(const QString& vaultId) {
    auto status = locks_.is_locked(vaultId.toStdString());
    if (status.is_err()) {
        qCWarning(mindsyncVaultLog) << "Cannot read the lock of vault" << vaultId << ":"
                                    << qs(status.unwrap_err().message);
        return false;
    }
    return status.unwrap().locked;
}

QString SyncService::currentVault() const {
    const auto current = switcher_.current_vault();
    return current ? qs(*current) : QString{};
}

// ----------------------------------------------------------------------------
// Maps
// ----------------------------------------------------------------------------

Result<Map, Error> SyncService::createMap(const QString& vaultId, const QString& title) {
    auto result = store_.create_map(vaultId.toStdString(), title.toStdString());
    if (result.is_ok()) edited(result.unwrap().id);
    return result;
}

Result<Map, Error> SyncService::updateNode(const QString& mapId, const Node& node) {
    auto result = store_.update_node(mapId.toStdString(), node);
    if (result.is_ok()) edited(result.unwrap().id);
    return result;
}

Result<void, Error> SyncService::deleteMap(const QString& mapId) {
    auto result = store_.delete_map(mapId.toStdString());
    if (result.is_ok()) {
        emit pendingChangesChanged();
        if (thread_) schedule_sync();
    }
    return result;
}

Result<std::vector<MapSummary>, Error> SyncService::listMaps(const QString& vaultId) {
    return store_.list_maps(vaultId.toStdString());
}

Result<std::optional<Map>, Error> SyncService::getMap(const QString& mapId) {
    const auto map_id = mapId.toStdString();
    auto result = store_.get_map(map_id);
    if (result.is_err() && result.unwrap_err().is(ErrorKind::Corruption)) {
        auto state = store_.sync_state(map_id);
        if (state.is_ok() && state.unwrap()) {
            qCWarning(mindsyncStoreLog) << "Map" << mapId << "is corrupt; re-pulling its vault";
            schedule_repull(state.unwrap()->vault_id);
        } else {
            qCWarning(mindsyncStoreLog) << "Map" << mapId << "is corrupt and its vault is unknown";
        }
    }
    return result;
}

Result<std::vector<SearchResult>, Error> SyncService::search(const QString& vaultId, const QString& query) {
    return store_.search(vaultId.toStdString(), query.toStdString());
}

void SyncService::edited(const std::string& map_id) {
    emit syncStatusChanged(qs(map_id), status_string(SyncStatus::Pending));
    emit pendingChangesChanged();
    if (thread_) schedule_sync();
}

// ----------------------------------------------------------------------------
// Sync control
// ----------------------------------------------------------------------------

void SyncService::syncNow() {
    schedule_sync();
}

void SyncService::setNetworkOnline(bool online) {
    if (online_.exchange(online) == online) return;
    emit onlineChanged();

    if (!online) {
        qCInfo(mindsyncSyncLog) << "Network offline; edits stay queued";
        worker_.request_stop();
        return;
    }

    qCInfo(mindsyncSyncLog) << "Network back online; retrying queued operations";
    store_.reset_backoff().inspect_err([](const Error& e) {
        qCWarning(mindsyncSyncLog) << "Cannot reset retry schedule:" << qs(e.message);
    });
    syncNow();
}

SyncStatusSummary SyncService::status() const {
    SyncStatusSummary summary{
        .online = online_.load(),
        .syncing = syncing_.load(),
        .last_sync_time = std::nullopt,
        .pending_changes = 0
    };
    if (const auto ms = last_sync_ms_.load(); ms > 0) {
        summary.last_sync_time = Timestamp(ms);
    }
    auto pending = store_.pending_count();
    if (pending.is_ok()) {
        summary.pending_changes = pending.unwrap();
    } else {
        qCWarning(mindsyncStoreLog) << "Cannot count pending operations:" << qs(pending.unwrap_err().message);
    }
    return summary;
}

SyncReport SyncService::lastReport() const {
    std::lock_guard lock(report_mutex_);
    return last_report_;
}

void SyncService::schedule_sync() {
    if (sync_scheduled_.exchange(true)) return;
    run_on_sync_thread([this]() { run_sync(); });
}

void SyncService::schedule_repull(const std::string& vault_id) {
    run_on_sync_thread([this, vault_id, ticket = switcher_.ticket()]() { run_repull(vault_id, ticket); });
}

// ----------------------------------------------------------------------------
// Sync thread
// ----------------------------------------------------------------------------

void SyncService::run_sync() {
    sync_scheduled_.store(false);
    if (!online_.load()) {
        qCDebug(mindsyncSyncLog) << "Offline; sync cycle skipped";
        return;
    }

    worker_.clear_stop();
    set_syncing(true);
    auto report = worker_.run_cycle();
    if (const auto last = worker_.last_sync_time()) {
        last_sync_ms_.store(last->millis());
    }
    set_syncing(false);

    {
        std::lock_guard lock(report_mutex_);
        last_report_ = report;
    }
    emit syncCompleted(report.synced, report.failed, report.conflicts);
    emit pendingChangesChanged();

    const auto corrupt = std::exchange(corrupt_vaults_, {});
    for (const auto& vault_id : corrupt) {
        run_repull(vault_id);
    }
    schedule_retry();
}

void SyncService::schedule_retry() {
    if (!thread_ || !online_.load()) return;

    auto next = store_.next_attempt_time();
    if (next.is_err()) {
        qCWarning(mindsyncSyncLog) << "Cannot read the retry schedule:" << qs(next.unwrap_err().message);
        return;
    }
    if (!next.unwrap()) return;

    const auto delay = std::chrono::milliseconds(
        std::max<int64_t>(next.unwrap()->millis() - store_.clock().now().millis(), config_.backoff_base.count()));
    if (delay >= config_.sync_interval) return;

    qCDebug(mindsyncSyncLog) << "Next retry in" << delay.count() << "ms";
    QTimer::singleShot(delay, sync_context(), [this]() { schedule_sync(); });
}

void SyncService::run_open(const std::string& vault_id, bool switching, sync::VaultSwitcher::Ticket ticket) {
    auto result = switching ? switcher_.switch_vault(vault_id, ticket) : switcher_.open_vault(vault_id, ticket);
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        if (error.is(ErrorKind::Corruption)) {
            qCWarning(mindsyncVaultLog) << "Vault" << qs(vault_id) << "is corrupt locally:" << qs(error.message);
            run_repull(vault_id, ticket);
            return;
        }
        emit vaultOpenFailed(qs(vault_id), qs(error.message));
        return;
    }

    emit vaultOpened(report_to_variant(result.unwrap()));
    emit pendingChangesChanged();
    if (thread_) schedule_sync();
}

void SyncService::run_repull(const std::string& vault_id, std::optional<sync::VaultSwitcher::Ticket> ticket) {
    auto result = switcher_.repull_vault(vault_id, ticket);
    if (result.is_err()) {
        emit vaultOpenFailed(qs(vault_id), qs(result.unwrap_err().message));
        return;
    }
    emit vaultOpened(report_to_variant(result.unwrap()));
}

void SyncService::set_syncing(bool syncing) {
    if (syncing_.exchange(syncing) != syncing) {
        emit syncingChanged();
    }
}

// ----------------------------------------------------------------------------
// EventSink
// ----------------------------------------------------------------------------

void SyncService::sync_status_changed(const std::string& map_id, SyncStatus status) {
    emit syncStatusChanged(qs(map_id), status_string(status));
}

void SyncService::conflict_resolved(const sync::ConflictEvent& event) {
    emit conflictResolved(qs(event.map_id),
                          QString::fromLatin1(winner_name(event.winner).data()),
                          event.backup_ref ? qs(*event.backup_ref) : QString{});
}

void SyncService::vault_state_changed(const std::string& vault_id, sync::VaultState state) {
    emit vaultStateChanged(qs(vault_id), QString::fromLatin1(sync::vault_state_name(state).data()));
}

} // namespace mindsync::app
