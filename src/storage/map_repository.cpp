#include "storage/map_repository.hpp"

namespace mindsync::storage {

namespace {

constexpr const char* STATE_COLUMNS = R"SQL(
    SELECT id, vault_id, local_modified_at, last_synced_at, remote_revision,
           sync_status, sync_error
    FROM maps
)SQL";

} // namespace

MapSyncState MapRepository::row_to_state(Statement& stmt) {
    return MapSyncState{
        .map_id = stmt.column_text(0),
        .vault_id = stmt.column_text(1),
        .local_modified_at = stmt.column_timestamp(2),
        .last_synced_at = stmt.column_timestamp(3),
        .remote_revision = stmt.column_text(4),
        .status = sync_status_from_name(stmt.column_text(5)),
        .sync_error = stmt.column_optional_text(6)
    };
}

Result<void, Error> MapRepository::run(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<void>(step_result);
    }
    return Result<void, Error>::ok();
}

Result<std::vector<Node>, Error> MapRepository::load_nodes(const std::string& map_id) {
    std::vector<Node> nodes;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, parent_id, title, content, sort_order, modified_at
        FROM nodes WHERE map_id = ? ORDER BY sort_order, id;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::vector<Node>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<Node>>(step_result);
        }
        if (!step_result.unwrap()) break;

        nodes.push_back(Node{
            .id = stmt.column_text(0),
            .parent_id = stmt.column_optional_text(1),
            .title = stmt.column_text(2),
            .content = stmt.column_text(3),
            .order = stmt.column_int(4),
            .modified_at = stmt.column_timestamp(5)
        });
    }
    return Result<std::vector<Node>, Error>::ok(std::move(nodes));
}

Result<std::vector<Edge>, Error> MapRepository::load_edges(const std::string& map_id) {
    std::vector<Edge> edges;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, source, target, kind, label FROM edges WHERE map_id = ? ORDER BY id;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::vector<Edge>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<Edge>>(step_result);
        }
        if (!step_result.unwrap()) break;

        edges.push_back(Edge{
            .id = stmt.column_text(0),
            .source = stmt.column_text(1),
            .target = stmt.column_text(2),
            .kind = edge_kind_from_name(stmt.column_text(3)),
            .label = stmt.column_text(4)
        });
    }
    return Result<std::vector<Edge>, Error>::ok(std::move(edges));
}

Result<std::optional<Map>, Error> MapRepository::get(const std::string& map_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, vault_id, title, local_modified_at, last_synced_at, remote_revision
        FROM maps WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::optional<Map>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<std::optional<Map>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Map>, Error>::ok(std::nullopt);
    }

    Map map;
    map.id = stmt.column_text(0);
    map.vault_id = stmt.column_text(1);
    map.title = stmt.column_text(2);
    map.local_modified_at = stmt.column_timestamp(3);
    map.last_synced_at = stmt.column_timestamp(4);
    map.remote_revision = stmt.column_text(5);

    auto nodes_result = load_nodes(map_id);
    if (nodes_result.is_err()) {
        return propagate<std::optional<Map>>(nodes_result);
    }
    map.nodes = std::move(nodes_result).unwrap();

    auto edges_result = load_edges(map_id);
    if (edges_result.is_err()) {
        return propagate<std::optional<Map>>(edges_result);
    }
    map.edges = std::move(edges_result).unwrap();

    auto valid = validate_tree(map);
    if (valid.is_err()) {
        return propagate<std::optional<Map>>(valid);
    }
    return Result<std::optional<Map>, Error>::ok(std::move(map));
}

Result<std::vector<MapSummary>, Error> MapRepository::list_by_vault(const std::string& vault_id) {
    std::vector<MapSummary> maps;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT m.id, m.vault_id, m.title,
               (SELECT COUNT(*) FROM nodes n WHERE n.map_id = m.id),
               m.local_modified_at, m.last_synced_at, m.remote_revision
        FROM maps m WHERE m.vault_id = ?
        ORDER BY m.title, m.id;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::vector<MapSummary>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault_id);
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<MapSummary>>(step_result);
        }
        if (!step_result.unwrap()) break;

        maps.push_back(MapSummary{
            .id = stmt.column_text(0),
            .vault_id = stmt.column_text(1),
            .title = stmt.column_text(2),
            .node_count = stmt.column_int(3),
            .local_modified_at = stmt.column_timestamp(4),
            .last_synced_at = stmt.column_timestamp(5),
            .remote_revision = stmt.column_text(6)
        });
    }
    return Result<std::vector<MapSummary>, Error>::ok(std::move(maps));
}

Result<std::optional<MapSyncState>, Error> MapRepository::sync_state(const std::string& map_id) {
    auto stmt_result = db_.prepare(std::string(STATE_COLUMNS) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return propagate<std::optional<MapSyncState>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return propagate<std::optional<MapSyncState>>(step_result);
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<MapSyncState>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<MapSyncState>, Error>::ok(row_to_state(stmt));
}

Result<std::vector<MapSyncState>, Error> MapRepository::sync_states(const std::string& vault_id) {
    std::vector<MapSyncState> states;

    auto stmt_result = db_.prepare(std::string(STATE_COLUMNS) + " WHERE vault_id = ? ORDER BY id;");
    if (stmt_result.is_err()) {
        return propagate<std::vector<MapSyncState>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault_id);
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<MapSyncState>>(step_result);
        }
        if (!step_result.unwrap()) break;
        states.push_back(row_to_state(stmt));
    }
    return Result<std::vector<MapSyncState>, Error>::ok(std::move(states));
}

Result<void, Error> MapRepository::save(const Map& map, SyncStatus status) {
    auto map_stmt_result = db_.prepare(R"SQL(
        INSERT INTO maps (id, vault_id, title, local_modified_at, last_synced_at,
                          remote_revision, sync_status, sync_error)
        VALUES (?, ?, ?, ?, ?, ?, ?, NULL)
        ON CONFLICT(id) DO UPDATE SET
            vault_id = excluded.vault_id,
            title = excluded.title,
            local_modified_at = excluded.local_modified_at,
            last_synced_at = excluded.last_synced_at,
            remote_revision = excluded.remote_revision,
            sync_status = excluded.sync_status,
            sync_error = NULL;
    )SQL");
    if (map_stmt_result.is_err()) {
        return propagate<void>(map_stmt_result);
    }

    auto map_stmt = std::move(map_stmt_result).unwrap();
    map_stmt.bind_text(1, map.id);
    map_stmt.bind_text(2, map.vault_id);
    map_stmt.bind_text(3, map.title);
    map_stmt.bind_timestamp(4, map.local_modified_at);
    map_stmt.bind_timestamp(5, map.last_synced_at);
    map_stmt.bind_text(6, map.remote_revision);
    map_stmt.bind_text(7, sync_status_name(status));
    auto map_result = run(map_stmt);
    if (map_result.is_err()) return map_result;

    for (const char* sql : {"DELETE FROM nodes WHERE map_id = ?;", "DELETE FROM edges WHERE map_id = ?;"}) {
        auto clear_result = db_.prepare(sql);
        if (clear_result.is_err()) {
            return propagate<void>(clear_result);
        }
        auto clear_stmt = std::move(clear_result).unwrap();
        clear_stmt.bind_text(1, map.id);
        auto cleared = run(clear_stmt);
        if (cleared.is_err()) return cleared;
    }

    auto node_stmt_result = db_.prepare(R"SQL(
        INSERT INTO nodes (map_id, id, parent_id, title, content, sort_order, modified_at)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (node_stmt_result.is_err()) {
        return propagate<void>(node_stmt_result);
    }
    auto node_stmt = std::move(node_stmt_result).unwrap();
    for (const auto& node : map.nodes) {
        node_stmt.bind_text(1, map.id);
        node_stmt.bind_text(2, node.id);
        node_stmt.bind_optional_text(3, node.parent_id);
        node_stmt.bind_text(4, node.title);
        node_stmt.bind_text(5, node.content);
        node_stmt.bind_int(6, node.order);
        node_stmt.bind_timestamp(7, node.modified_at);
        auto inserted = run(node_stmt);
        if (inserted.is_err()) return inserted;
        auto reset = node_stmt.reset();
        if (reset.is_err()) return reset;
    }

    auto edge_stmt_result = db_.prepare(R"SQL(
        INSERT INTO edges (map_id, id, source, target, kind, label)
        VALUES (?, ?, ?, ?, ?, ?);
    )SQL");
    if (edge_stmt_result.is_err()) {
        return propagate<void>(edge_stmt_result);
    }
    auto edge_stmt = std::move(edge_stmt_result).unwrap();
    for (const auto& edge : map.edges) {
        edge_stmt.bind_text(1, map.id);
        edge_stmt.bind_text(2, edge.id);
        edge_stmt.bind_text(3, edge.source);
        edge_stmt.bind_text(4, edge.target);
        edge_stmt.bind_text(5, edge_kind_name(edge.kind));
        edge_stmt.bind_text(6, edge.label);
        auto inserted = run(edge_stmt);
        if (inserted.is_err()) return inserted;
        auto reset = edge_stmt.reset();
        if (reset.is_err()) return reset;
    }

    return Result<void, Error>::ok();
}

Result<void, Error> MapRepository::remove(const std::string& map_id) {
    auto stmt_result = db_.prepare("DELETE FROM maps WHERE id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, map_id);
    return run(stmt);
}

Result<void, Error> MapRepository::set_synced(
    const std::string& map_id,
    Timestamp last_synced_at,
    const std::string& remote_revision,
    SyncStatus status
) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE maps SET last_synced_at = ?, remote_revision = ?, sync_status = ?, sync_error = NULL
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, last_synced_at);
    stmt.bind_text(2, remote_revision);
    stmt.bind_text(3, sync_status_name(status));
    stmt.bind_text(4, map_id);
    return run(stmt);
}

Result<void, Error> MapRepository::set_status(
    const std::string& map_id,
    SyncStatus status,
    const std::optional<std::string>& error
) {
    auto stmt_result = db_.prepare("UPDATE maps SET sync_status = ?, sync_error = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, sync_status_name(status));
    stmt.bind_optional_text(2, error);
    stmt.bind_text(3, map_id);
    return run(stmt);
}

Result<std::vector<std::string>, Error> MapRepository::dirty_without_operation() {
    std::vector<std::string> ids;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT m.id FROM maps m
        WHERE m.local_modified_at > m.last_synced_at
          AND NOT EXISTS (SELECT 1 FROM sync_queue q WHERE q.map_id = m.id)
        ORDER BY m.local_modified_at;
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<std::vector<std::string>>(stmt_result);
    }

    auto stmt = std::move(stmt_result).unwrap();
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<std::string>>(step_result);
        }
        if (!step_result.unwrap()) break;
        ids.push_back(stmt.column_text(0));
    }
    return Result<std::vector<std::string>, Error>::ok(std::move(ids));
}

Result<int, Error> MapRepository::remove_clean_by_vault(const std::string& vault_id) {
    auto stmt_result = db_.prepare(R"SQL(
        DELETE FROM maps
        WHERE vault_id = ?
          AND local_modified_at <= last_synced_at
          AND NOT EXISTS (SELECT 1 FROM sync_queue q WHERE q.map_id = maps.id);
    )SQL");
    if (stmt_result.is_err()) {
        return propagate<int>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault_id);
    auto removed = run(stmt);
    if (removed.is_err()) {
        return propagate<int>(removed);
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<void, Error> MapRepository::remove_by_vault(const std::string& vault_id) {
    auto stmt_result = db_.prepare("DELETE FROM maps WHERE vault_id = ?;");
    if (stmt_result.is_err()) {
        return propagate<void>(stmt_result);
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, vault_id);
    return run(stmt);
}

Result<std::vector<SearchResult>, Error> MapRepository::search(
    const std::string& vault_id,
    const std::string& query
) {
    std::vector<SearchResult> results;
    if (query.empty()) {
        return Result<std::vector<SearchResult>, Error>::ok(std::move(results));
    }
    const auto pattern = like_pattern(query);

    auto map_stmt_result = db_.prepare(R"SQL(
        SELECT id, title FROM maps
        WHERE vault_id = ? AND title LIKE ? ESCAPE '\'
        ORDER BY title, id;
    )SQL");
    if (map_stmt_result.is_err()) {
        return propagate<std::vector<SearchResult>>(map_stmt_result);
    }
    auto map_stmt = std::move(map_stmt_result).unwrap();
    map_stmt.bind_text(1, vault_id);
    map_stmt.bind_text(2, pattern);
    while (true) {
        auto step_result = map_stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<SearchResult>>(step_result);
        }
        if (!step_result.unwrap()) break;

        auto title = map_stmt.column_text(1);
        results.push_back(SearchResult{
            .map_id = map_stmt.column_text(0),
            .map_title = title,
            .node_id = std::nullopt,
            .node_title = {},
            .snippet = create_snippet(title, query)
        });
    }

    auto node_stmt_result = db_.prepare(R"SQL(
        SELECT m.id, m.title, n.id, n.title, n.content
        FROM nodes n JOIN maps m ON m.id = n.map_id
        WHERE m.vault_id = ?
          AND (n.title LIKE ?2 ESCAPE '\' OR n.content LIKE ?2 ESCAPE '\')
        ORDER BY m.title, m.id, n.sort_order, n.id;
    )SQL");
    if (node_stmt_result.is_err()) {
        return propagate<std::vector<SearchResult>>(node_stmt_result);
    }
    auto node_stmt = std::move(node_stmt_result).unwrap();
    node_stmt.bind_text(1, vault_id);
    node_stmt.bind_text(2, pattern);
    while (true) {
        auto step_result = node_stmt.step();
        if (step_result.is_err()) {
            return propagate<std::vector<SearchResult>>(step_result);
        }
        if (!step_result.unwrap()) break;

        auto node_title = node_stmt.column_text(3);
        auto content = node_stmt.column_text(4);
        results.push_back(SearchResult{
            .map_id = node_stmt.column_text(0),
            .map_title = node_stmt.column_text(1),
            .node_id = node_stmt.column_text(2),
            .node_title = node_title,
            .snippet = create_snippet(contains_ci(node_title, query) ? node_title : content, query)
        });
    }

    return Result<std::vector<SearchResult>, Error>::ok(std::move(results));
}

} // namespace mindsync::storage
