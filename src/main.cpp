#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include "app/logging.hpp"
#include "app/sync_service.hpp"
#include "cli/format.hpp"
#include "core/log.hpp"
#include "remote/folder_remote.hpp"
#include "storage/local_store.hpp"
#include "sync/sync_config.hpp"

namespace {

using namespace mindsync;

struct CommandContext {
    app::SyncService& service;
    storage::LocalStore& store;
    QStringList args;
    cli::FormatOptions format;
    QString nodeId;
    QString parentId;
};

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

int fail(const Error& error) {
    return fail(QString::fromStdString(error.message));
}

int usage(const QString& synopsis) {
    return fail(QStringLiteral("usage: mindsync ") + synopsis);
}

int cmd_vaults(CommandContext& ctx) {
    auto vaults = ctx.service.listVaults();
    if (vaults.is_err()) return fail(vaults.unwrap_err());
    QTextStream(stdout) << cli::format_vaults(vaults.unwrap(), ctx.format);
    return 0;
}

int cmd_create_vault(CommandContext& ctx) {
    if (ctx.args.isEmpty()) return usage(QStringLiteral("create-vault <name> [remote-location]"));
    auto vault = ctx.service.createVault(ctx.args.value(0), ctx.args.value(1));
    if (vault.is_err()) return fail(vault.unwrap_err());
    QTextStream(stdout) << qs(vault.unwrap().id) << QLatin1Char('\n');
    return 0;
}

int cmd_open(CommandContext& ctx) {
    if (ctx.args.isEmpty()) return usage(QStringLiteral("open <vault-id>"));

    int rc = 1;
    QObject::connect(&ctx.service, &app::SyncService::vaultOpened, [&](const QVariantMap& report) {
        QTextStream(stdout) << QStringLiteral("%1: %2 pulled, %3 resolved, %4 removed, %5 unchanged%6\n")
                                   .arg(report.value(QStringLiteral("vaultId")).toString())
                                   .arg(report.value(QStringLiteral("pulled")).toInt())
                                   .arg(report.value(QStringLiteral("merged")).toInt())
                                   .arg(report.value(QStringLiteral("removed")).toInt())
                                   .arg(report.value(QStringLiteral("skipped")).toInt())
                                   .arg(report.value(QStringLiteral("usedCachedState")).toBool()
                                            ? QStringLiteral(" (cached state)")
                                            : QString{});
        rc = 0;
    });
    QObject::connect(&ctx.service, &app::SyncService::vaultOpenFailed,
                     [&](const QString&, const QString& message) { rc = fail(message); });
    ctx.service.openVault(ctx.args.value(0));
    return rc;
}

int cmd_maps(CommandContext& ctx) {
    if (ctx.args.isEmpty()) return usage(QStringLiteral("maps <vault-id>"));
    auto maps = ctx.service.listMaps(ctx.args.value(0));
    if (maps.is_err()) return fail(maps.unwrap_err());
    QTextStream(stdout) << cli::format_map_list(maps.unwrap(), ctx.format);
    return 0;
}

int cmd_new_map(CommandContext& ctx) {
    if (ctx.args.size() < 2) return usage(QStringLiteral("new-map <vault-id> <title>"));
    auto map = ctx.service.createMap(ctx.args.value(0), ctx.args.value(1));
    if (map.is_err()) return fail(map.unwrap_err());
    QTextStream(stdout) << qs(map.unwrap().id) << QLatin1Char('\n');
    return 0;
}

int cmd_set_node(CommandContext& ctx) {
    if (ctx.args.size() < 2) {
        return usage(QStringLiteral("set-node <map-id> <title> [content] [--node <id>] [--parent <id>]"));
    }

    auto current = ctx.service.getMap(ctx.args.value(0));
    if (current.is_err()) return fail(current.unwrap_err());
    if (!current.unwrap()) return fail(QStringLiteral("Map not found: ") + ctx.args.value(0));
    const auto& map = *current.unwrap();

    std::optional<std::string> parent;
    if (!ctx.parentId.isEmpty()) parent = ctx.parentId.toStdString();

    Node node;
    const auto* existing = ctx.nodeId.isEmpty() ? nullptr : find_node(map, ctx.nodeId.toStdString());
    if (existing) {
        node = *existing;
        if (parent) node.parent_id = parent;
    } else {
        node = create_node(ctx.nodeId.isEmpty() ? new_id() : ctx.nodeId.toStdString(), {}, parent,
                           static_cast<int>(child_nodes(map, parent).size()));
    }
    node.title = ctx.args.value(1).toStdString();
    if (ctx.args.size() > 2) node.content = ctx.args.value(2).toStdString();

    auto updated = ctx.service.updateNode(ctx.args.value(0), node);
    if (updated.is_err()) return fail(updated.unwrap_err());
    QTextStream(stdout) << qs(node.id) << QLatin1Char('\n');
    return 0;
}

int cmd_show(CommandContext& ctx) {
    if (ctx.args.isEmpty()) return usage(QStringLiteral("show <map-id>"));
    auto map = ctx.service.getMap(ctx.args.value(0));
    if (map.is_err()) return fail(map.unwrap_err());
    if (!map.unwrap()) return fail(QStringLiteral("Map not found: ") + ctx.args.value(0));
    QTextStream(stdout) << cli::format_map(*map.unwrap(), ctx.format);
    return 0;
}

int cmd_search(CommandContext& ctx) {
    if (ctx.args.size() < 2) return usage(QStringLiteral("search <vault-id> <query>"));
    auto results = ctx.service.search(ctx.args.value(0), ctx.args.mid(1).join(QLatin1Char(' ')));
    if (results.is_err()) return fail(results.unwrap_err());
    QTextStream(stdout) << cli::format_search_results(results.unwrap(), ctx.format);
    return 0;
}

int cmd_sync(CommandContext& ctx) {
    ctx.service.syncNow();
    const auto report = ctx.service.lastReport();
    QTextStream out(stdout);
    out << QStringLiteral("%1 synced, %2 failed, %3 conflicts\n")
               .arg(report.synced).arg(report.failed).arg(report.conflicts);
    for (const auto& error : report.errors) {
        out << QStringLiteral("  ") << qs(error) << QLatin1Char('\n');
    }
    return report.success() ? 0 : 2;
}

int cmd_status(CommandContext& ctx) {
    const auto status = ctx.service.status();
    QTextStream(stdout) << QStringLiteral("online: %1\nsyncing: %2\nlast sync: %3\npending changes: %4\n")
                               .arg(status.online ? QStringLiteral("yes") : QStringLiteral("no"),
                                    status.syncing ? QStringLiteral("yes") : QStringLiteral("no"),
                                    status.last_sync_time ? qs(status.last_sync_time->to_iso_string())
                                                          : QStringLiteral("never"))
                               .arg(status.pending_changes);
    return 0;
}

int cmd_conflicts(CommandContext& ctx) {
    auto entries = ctx.store.resolution_log(ctx.args.value(0).toStdString());
    if (entries.is_err()) return fail(entries.unwrap_err());
    QTextStream(stdout) << cli::format_resolutions(entries.unwrap(), ctx.format);
    return 0;
}

int cmd_restore(CommandContext& ctx) {
    if (ctx.args.isEmpty()) return usage(QStringLiteral("restore <backup-ref>"));
    auto restored = ctx.store.restore_backup(ctx.args.value(0).toStdString());
    if (restored.is_err()) return fail(restored.unwrap_err());
    QTextStream(stdout) << QStringLiteral("Restored %1 as a new edit of %2\n")
                               .arg(ctx.args.value(0), qs(restored.unwrap().id));
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("mindsync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("mindsync");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local-first mind map vaults"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets MINDSYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption remoteOption(
        QStringList{QStringLiteral("remote")},
        QStringLiteral("Folder backend root (sets MINDSYNC_REMOTE_DIR for this run)."),
        QStringLiteral("dir"));
    parser.addOption(remoteOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include IDs in output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (vaults, maps, show, search, conflicts)."));
    parser.addOption(jsonOption);

    const QCommandLineOption nodeOption(
        QStringList{QStringLiteral("node")},
        QStringLiteral("Node ID for 'set-node' (a new node is created when absent)."),
        QStringLiteral("nodeId"));
    parser.addOption(nodeOption);

    const QCommandLineOption parentOption(
        QStringList{QStringLiteral("parent")},
        QStringLiteral("Parent node ID for 'set-node'."),
        QStringLiteral("nodeId"));
    parser.addOption(parentOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets MINDSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Echo log messages to stderr."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("vaults | create-vault | open | maps | new-map | set-node | show | search | "
                       "sync | status | conflicts | restore"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("MINDSYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(remoteOption)) {
        qputenv("MINDSYNC_REMOTE_DIR", parser.value(remoteOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("MINDSYNC_DEBUG_SYNC", "1");
    }

    mindsync::app::install_file_logging(parser.isSet(verboseOption));
    mindsync::sync::apply_debug_logging();
    qCInfo(mindsyncSyncLog) << "Logging to" << mindsync::app::default_log_file_path();

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }

    QSettings settings;
    const auto config = mindsync::sync::load_sync_config(settings);
    const mindsync::SystemClock clock;

    auto store = mindsync::storage::LocalStore::open(
        mindsync::sync::resolve_database_path(settings).toStdString(), clock);
    if (store.is_err()) {
        return fail(QStringLiteral("Failed to open database: ") + qs(store.unwrap_err().message));
    }

    auto requeued = store.unwrap()->rebuild_queue();
    if (requeued.is_err()) {
        qCWarning(mindsyncStoreLog) << "Cannot rebuild the operation queue:" << qs(requeued.unwrap_err().message);
    }

    auto remote = mindsync::remote::FolderRemote::open(mindsync::sync::resolve_remote_root(settings), clock);
    if (remote.is_err()) {
        return fail(QStringLiteral("Failed to open backend: ") + qs(remote.unwrap_err().message));
    }

    mindsync::app::SyncService service(*store.unwrap(), *remote.unwrap(), config);

    CommandContext ctx{
        .service = service,
        .store = *store.unwrap(),
        .args = positional.mid(1),
        .format = mindsync::cli::FormatOptions{
            .includeIds = parser.isSet(includeIdsOption),
            .json = parser.isSet(jsonOption)
        },
        .nodeId = parser.value(nodeOption),
        .parentId = parser.value(parentOption)
    };

    const auto command = positional.first();
    if (command == QStringLiteral("vaults")) return cmd_vaults(ctx);
    if (command == QStringLiteral("create-vault")) return cmd_create_vault(ctx);
    if (command == QStringLiteral("open")) return cmd_open(ctx);
    if (command == QStringLiteral("maps")) return cmd_maps(ctx);
    if (command == QStringLiteral("new-map")) return cmd_new_map(ctx);
    if (command == QStringLiteral("set-node")) return cmd_set_node(ctx);
    if (command == QStringLiteral("show")) return cmd_show(ctx);
    if (command == QStringLiteral("search")) return cmd_search(ctx);
    if (command == QStringLiteral("sync")) return cmd_sync(ctx);
    if (command == QStringLiteral("status")) return cmd_status(ctx);
    if (command == QStringLiteral("conflicts")) return cmd_conflicts(ctx);
    if (command == QStringLiteral("restore")) return cmd_restore(ctx);

    return fail(QStringLiteral("Unknown command: ") + command);
}
