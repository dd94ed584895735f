#include "cli/format.hpp"
#include "storage/map_codec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace mindsync::cli {

namespace {

[[nodiscard]] QString q(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString render_id_suffix(const std::string& id, bool includeIds) {
    return includeIds ? (QStringLiteral(" (") + q(id) + QStringLiteral(")")) : QString{};
}

[[nodiscard]] QString join_lines(const QStringList& lines) {
    if (lines.isEmpty()) return {};
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

[[nodiscard]] QString to_json_text(const QJsonValue& value) {
    const auto doc = value.isArray() ? QJsonDocument(value.toArray()) : QJsonDocument(value.toObject());
    return QString::fromUtf8(doc.toJson(QJsonDocument::Indented));
}

[[nodiscard]] QJsonValue optional_time(const std::optional<Timestamp>& ts) {
    return ts ? QJsonValue(q(ts->to_iso_string())) : QJsonValue(QJsonValue::Null);
}

} // namespace

QString format_vaults(const std::vector<Vault>& vaults, const FormatOptions& options) {
    if (options.json) {
        QJsonArray out;
        for (const auto& vault : vaults) {
            out.append(QJsonObject{
                {QStringLiteral("vaultId"), q(vault.id)},
                {QStringLiteral("name"), q(vault.name)},
                {QStringLiteral("maps"), vault.map_count},
                {QStringLiteral("cached"), vault.is_cached()},
                {QStringLiteral("lastOpened"), optional_time(vault.last_opened)},
                {QStringLiteral("lastFullSync"), optional_time(vault.last_full_sync)}
            });
        }
        return to_json_text(out);
    }

    QStringList lines;
    for (const auto& vault : vaults) {
        lines.append(QStringLiteral("%1%2  %3 maps%4")
                         .arg(q(vault.name), render_id_suffix(vault.id, options.includeIds))
                         .arg(vault.map_count)
                         .arg(vault.is_cached() ? QString{} : QStringLiteral(" (not cached)")));
    }
    return join_lines(lines);
}

QString format_map_list(const std::vector<MapSummary>& maps, const FormatOptions& options) {
    if (options.json) {
        QJsonArray out;
        for (const auto& map : maps) {
            out.append(QJsonObject{
                {QStringLiteral("mapId"), q(map.id)},
                {QStringLiteral("title"), q(map.title)},
                {QStringLiteral("nodes"), map.node_count},
                {QStringLiteral("modified"), q(map.local_modified_at.to_iso_string())},
                {QStringLiteral("unsynced"), map.last_synced_at < map.local_modified_at}
            });
        }
        return to_json_text(out);
    }

    QStringList lines;
    for (const auto& map : maps) {
        const bool unsynced = map.last_synced_at < map.local_modified_at;
        lines.append(QStringLiteral("%1 %2%3  %4 nodes")
                         .arg(unsynced ? QStringLiteral("*") : QStringLiteral("-"),
                              q(map.title),
                              render_id_suffix(map.id, options.includeIds))
                         .arg(map.node_count));
    }
    return join_lines(lines);
}

QString format_map(const Map& map, const FormatOptions& options) {
    if (options.json) {
        return to_json_text(storage::map_to_json(map));
    }

    QStringList lines;
    lines.append(q(map.title) + render_id_suffix(map.id, options.includeIds));
    for (const auto& [node, depth] : flatten_tree(map)) {
        const auto indent = QString((depth + 1) * 2, QLatin1Char(' '));
        lines.append(indent + QStringLiteral("- ") + q(node.title) + render_id_suffix(node.id, options.includeIds));
        if (!node.content.empty()) {
            for (const auto& line : q(node.content).split(QLatin1Char('\n'))) {
                lines.append(indent + QStringLiteral("  ") + line);
            }
        }
    }

    auto title_of = [&](const std::string& node_id) {
        const auto* node = find_node(map, node_id);
        return node ? q(node->title) : q(node_id);
    };
    for (const auto& edge : map.edges) {
        if (edge.kind == EdgeKind::Hierarchy) continue;
        auto line = QStringLiteral("  ~ %1 -> %2").arg(title_of(edge.source), title_of(edge.target));
        if (!edge.label.empty()) line += QStringLiteral(" [") + q(edge.label) + QStringLiteral("]");
        lines.append(line);
    }
    return join_lines(lines);
}

QString format_search_results(const std::vector<SearchResult>& results, const FormatOptions& options) {
    if (options.json) {
        QJsonArray out;
        for (const auto& result : results) {
            out.append(QJsonObject{
                {QStringLiteral("mapId"), q(result.map_id)},
                {QStringLiteral("mapTitle"), q(result.map_title)},
                {QStringLiteral("nodeId"), result.node_id ? QJsonValue(q(*result.node_id)) : QJsonValue()},
                {QStringLiteral("nodeTitle"), q(result.node_title)},
                {QStringLiteral("snippet"), q(result.snippet)}
            });
        }
        return to_json_text(out);
    }

    QStringList lines;
    for (const auto& result : results) {
        auto line = q(result.map_title);
        if (result.node_id) line += QStringLiteral(" / ") + q(result.node_title);
        line += render_id_suffix(result.node_id.value_or(result.map_id), options.includeIds);
        if (!result.snippet.empty()) line += QStringLiteral(": ") + q(result.snippet);
        lines.append(line);
    }
    return join_lines(lines);
}

QString format_resolutions(const std::vector<ResolutionEntry>& entries, const FormatOptions& options) {
    if (options.json) {
        QJsonArray out;
        for (const auto& entry : entries) {
            out.append(QJsonObject{
                {QStringLiteral("mapId"), q(entry.map_id)},
                {QStringLiteral("vaultId"), q(entry.vault_id)},
                {QStringLiteral("winner"), q(std::string(winner_name(entry.winner)))},
                {QStringLiteral("backupRef"), entry.backup_ref ? QJsonValue(q(*entry.backup_ref)) : QJsonValue()},
                {QStringLiteral("resolvedAt"), q(entry.resolved_at.to_iso_string())}
            });
        }
        return to_json_text(out);
    }

    QStringList lines;
    for (const auto& entry : entries) {
        auto line = QStringLiteral("%1 %2 won on %3")
                        .arg(q(entry.resolved_at.to_iso_string()),
                             q(std::string(winner_name(entry.winner))),
                             q(entry.map_id));
        if (entry.backup_ref) line += QStringLiteral(", backup ") + q(*entry.backup_ref);
        lines.append(line);
    }
    return join_lines(lines);
}

} // namespace mindsync::cli
