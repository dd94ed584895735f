#pragma once

#include "sync/conflict_resolver.hpp"
#include "sync/events.hpp"
#include "sync/lock_manager.hpp"
#include "sync/sync_config.hpp"
#include "sync/sync_worker.hpp"
#include "sync/vault_switcher.hpp"
#include "remote/remote_adapter.hpp"
#include "storage/local_store.hpp"
#include "core/result.hpp"
#include <QObject>
#include <QString>
#include <QVariantMap>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

class QThread;
class QTimer;

namespace mindsync::app {

/**
 * SyncStatusSummary - Snapshot returned by SyncService::status().
 */
struct SyncStatusSummary {
    bool online{true};
    bool syncing{false};
    std::optional<Timestamp> last_sync_time;
    int pending_changes{0};
};

/**
 * SyncService - The caller-facing API of the engine.
 *
 * Reads and edits go straight to the LocalStore on the caller's thread and
 * return without touching the network. Every edit schedules a sync cycle;
 * sync cycles, vault opens and switches run on a dedicated QThread, and
 * their outcome is reported through the signals below.
 *
 * Until start() is called nothing runs in the background: edits only
 * queue, and syncNow(), openVault() and switchVault() run inline on the
 * calling thread. The CLI and the tests rely on that.
 */
class SyncService : public QObject, public sync::EventSink {
    Q_OBJECT

    Q_PROPERTY(bool online READ isOnline NOTIFY onlineChanged)
    Q_PROPERTY(bool syncing READ isSyncing NOTIFY syncingChanged)

public:
    SyncService(storage::LocalStore& store,
                remote::RemoteAdapter& remote,
                sync::SyncConfig config,
                QObject* parent = nullptr);
    ~SyncService() override;

    /**
     * Re-queue unsynced maps left by a previous run, start the sync thread
     * and the periodic timer, and schedule a first sync.
     */
    void start();

    /**
     * Stop the timer and the sync thread. Work in progress is cut short
     * between maps.
     */
    void stop();

    // Vaults
    [[nodiscard]] Result<Vault, Error> createVault(const QString& name, const QString& remoteLocation = {});
    [[nodiscard]] Result<std::vector<Vault>, Error> listVaults();
    Q_INVOKABLE void openVault(const QString& vaultId);
    Q_INVOKABLE void switchVault(const QString& vaultId);
    // Aborts opens queued or running at the time of the call.
    Q_INVOKABLE void cancelOpen();
    [[nodiscard]] QString currentVault() const;
    // Whether any device holds the vault lock. False when it cannot be read.
    Q_INVOKABLE bool isLocked(const QString& vaultId);

    // Maps
    [[nodiscard]] Result<Map, Error> createMap(const QString& vaultId, const QString& title);
    [[nodiscard]] Result<Map, Error> updateNode(const QString& mapId, const Node& node);
    [[nodiscard]] Result<void, Error> deleteMap(const QString& mapId);
    [[nodiscard]] Result<std::vector<MapSummary>, Error> listMaps(const QString& vaultId);
    [[nodiscard]] Result<std::optional<Map>, Error> getMap(const QString& mapId);
    [[nodiscard]] Result<std::vector<SearchResult>, Error> search(const QString& vaultId, const QString& query);

    // Sync control
    Q_INVOKABLE void syncNow();
    Q_INVOKABLE void setNetworkOnline(bool online);

    [[nodiscard]] SyncStatusSummary status() const;
    [[nodiscard]] bool isOnline() const { return online_.load(); }
    [[nodiscard]] bool isSyncing() const { return syncing_.load(); }
    [[nodiscard]] SyncReport lastReport() const;

    // EventSink (sync thread)
    void sync_status_changed(const std::string& map_id, SyncStatus status) override;
    void conflict_resolved(const sync::ConflictEvent& event) override;
    void vault_state_changed(const std::string& vault_id, sync::VaultState state) override;

signals:
    void syncStatusChanged(const QString& mapId, const QString& status);
    void conflictResolved(const QString& mapId, const QString& winner, const QString& backupRef);
    void vaultStateChanged(const QString& vaultId, const QString& state);
    void vaultOpened(const QVariantMap& report);
    void vaultOpenFailed(const QString& vaultId, const QString& message);
    void syncCompleted(int synced, int failed, int conflicts);
    void onlineChanged();
    void syncingChanged();
    void pendingChangesChanged();

private:
    storage::LocalStore& store_;
    sync::SyncConfig config_;

    sync::ConflictResolver resolver_;
    sync::LockManager locks_;
    sync::SyncWorker worker_;
    sync::VaultSwitcher switcher_;

    std::unique_ptr<QThread> thread_;
    std::unique_ptr<QObject> context_;
    std::unique_ptr<QTimer> interval_timer_;

    std::atomic<bool> online_{true};
    std::atomic<bool> syncing_{false};
    std::atomic<bool> sync_scheduled_{false};
    std::atomic<int64_t> last_sync_ms_{0};

    // Sync thread only.
    std::set<std::string> corrupt_vaults_;

    mutable std::mutex report_mutex_;
    SyncReport last_report_;

    [[nodiscard]] QObject* sync_context();
    void run_on_sync_thread(std::function<void()> task);
    void schedule_sync();
    void schedule_repull(const std::string& vault_id);

    void run_sync();
    void run_open(const std::string& vault_id, bool switching, sync::VaultSwitcher::Ticket ticket);
    void run_repull(const std::string& vault_id,
                    std::optional<sync::VaultSwitcher::Ticket> ticket = std::nullopt);
    void schedule_retry();

    void edited(const std::string& map_id);
    void set_syncing(bool syncing);
};

} // namespace mindsync::app
