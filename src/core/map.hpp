#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mindsync {

/**
 * Vault - A named collection of maps stored under one remote folder.
 *
 * last_full_sync unset means the vault has never been cached locally.
 */
struct Vault {
    std::string id;
    std::string name;
    std::string remote_location;
    std::optional<Timestamp> last_opened;
    std::optional<Timestamp> last_full_sync;
    Timestamp remote_timestamp;
    int map_count{0};

    [[nodiscard]] bool is_cached() const { return last_full_sync.has_value(); }

    bool operator==(const Vault&) const = default;
};

/**
 * Node - One item in a map's tree. The id is stable across moves and renames.
 */
struct Node {
    std::string id;
    std::optional<std::string> parent_id;
    std::string title;
    std::string content;
    int order{0};
    Timestamp modified_at;

    bool operator==(const Node&) const = default;
};

enum class EdgeKind {
    Hierarchy,
    Reference
};

struct Edge {
    std::string id;
    std::string source;
    std::string target;
    EdgeKind kind{EdgeKind::Hierarchy};
    std::string label;

    bool operator==(const Edge&) const = default;
};

/**
 * Map - A single hierarchical document, the unit of synchronization.
 *
 * local_modified_at/last_synced_at/remote_revision are sync bookkeeping and
 * never travel inside a remote payload except local_modified_at, which the
 * backend reports back as the file's modification time.
 */
struct Map {
    std::string id;
    std::string vault_id;
    std::string title;
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    Timestamp local_modified_at;
    Timestamp last_synced_at;
    std::string remote_revision;

    [[nodiscard]] bool is_dirty() const { return last_synced_at < local_modified_at; }

    bool operator==(const Map&) const = default;
};

/**
 * MapSummary - What list_maps returns; no node payload.
 */
struct MapSummary {
    std::string id;
    std::string vault_id;
    std::string title;
    int node_count{0};
    Timestamp local_modified_at;
    Timestamp last_synced_at;
    std::string remote_revision;

    bool operator==(const MapSummary&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Map create_map(std::string id, std::string vault_id,
                                    std::string title, Timestamp now) {
    Map map;
    map.id = std::move(id);
    map.vault_id = std::move(vault_id);
    map.title = std::move(title);
    map.local_modified_at = now;
    return map;
}

[[nodiscard]] inline Node create_node(std::string id, std::string title,
                                      std::optional<std::string> parent_id = std::nullopt,
                                      int order = 0) {
    return Node{
        .id = std::move(id),
        .parent_id = std::move(parent_id),
        .title = std::move(title),
        .content = {},
        .order = order,
        .modified_at = Timestamp{}
    };
}

[[nodiscard]] inline const Node* find_node(const Map& map, const std::string& node_id) {
    auto it = std::find_if(map.nodes.begin(), map.nodes.end(),
        [&](const Node& n) { return n.id == node_id; });
    return it == map.nodes.end() ? nullptr : &*it;
}

/**
 * Insert or replace a node by id.
 */
[[nodiscard]] inline Map with_node(Map map, Node node) {
    auto it = std::find_if(map.nodes.begin(), map.nodes.end(),
        [&](const Node& n) { return n.id == node.id; });
    if (it == map.nodes.end()) {
        map.nodes.push_back(std::move(node));
    } else {
        *it = std::move(node);
    }
    return map;
}

/**
 * Ids of node_id and all its descendants.
 */
[[nodiscard]] inline std::unordered_set<std::string> subtree_ids(
    const Map& map,
    const std::string& node_id
) {
    std::unordered_set<std::string> ids{node_id};
    bool grew = true;
    while (grew) {
        grew = false;
        for (const auto& node : map.nodes) {
            if (node.parent_id && ids.contains(*node.parent_id) && !ids.contains(node.id)) {
                ids.insert(node.id);
                grew = true;
            }
        }
    }
    return ids;
}

/**
 * Remove a node with its subtree and every edge touching a removed node.
 */
[[nodiscard]] inline Map without_subtree(Map map, const std::string& node_id) {
    auto doomed = subtree_ids(map, node_id);
    std::erase_if(map.nodes, [&](const Node& n) { return doomed.contains(n.id); });
    std::erase_if(map.edges, [&](const Edge& e) {
        return doomed.contains(e.source) || doomed.contains(e.target);
    });
    return map;
}

/**
 * Check the structural invariants of a map:
 * - node ids are unique,
 * - every parent_id resolves to a node of the same map,
 * - the parent chain is acyclic,
 * - every edge endpoint resolves.
 *
 * Returns a Corruption error naming the first violation.
 */
[[nodiscard]] inline Result<void, Error> validate_tree(const Map& map) {
    std::unordered_map<std::string, const Node*> by_id;
    by_id.reserve(map.nodes.size());
    for (const auto& node : map.nodes) {
        if (node.id.empty()) {
            return Result<void, Error>::err(Error{ErrorKind::Corruption,
                "Map " + map.id + " has a node without id"});
        }
        if (!by_id.emplace(node.id, &node).second) {
            return Result<void, Error>::err(Error{ErrorKind::Corruption,
                "Map " + map.id + " has duplicate node " + node.id});
        }
    }

    for (const auto& node : map.nodes) {
        size_t steps = 0;
        const Node* cur = &node;
        while (cur->parent_id) {
            auto it = by_id.find(*cur->parent_id);
            if (it == by_id.end()) {
                return Result<void, Error>::err(Error{ErrorKind::Corruption,
                    "Node " + cur->id + " references missing parent " + *cur->parent_id});
            }
            cur = it->second;
            if (++steps > map.nodes.size()) {
                return Result<void, Error>::err(Error{ErrorKind::Corruption,
                    "Parent chain of node " + node.id + " is cyclic"});
            }
        }
    }

    for (const auto& edge : map.edges) {
        if (!by_id.contains(edge.source) || !by_id.contains(edge.target)) {
            return Result<void, Error>::err(Error{ErrorKind::Corruption,
                "Edge " + edge.id + " references a missing node"});
        }
    }

    return Result<void, Error>::ok();
}

/**
 * Compare document content only (title, nodes, edges), ignoring sync
 * bookkeeping and node order in the vector.
 */
[[nodiscard]] inline bool same_content(const Map& a, const Map& b) {
    if (a.id != b.id || a.title != b.title) return false;
    if (a.nodes.size() != b.nodes.size() || a.edges.size() != b.edges.size()) return false;

    auto by_id = [](auto items) {
        std::sort(items.begin(), items.end(),
            [](const auto& x, const auto& y) { return x.id < y.id; });
        return items;
    };
    return by_id(a.nodes) == by_id(b.nodes) && by_id(a.edges) == by_id(b.edges);
}

/**
 * Children of parent_id sorted by order.
 */
[[nodiscard]] inline std::vector<Node> child_nodes(
    const Map& map,
    const std::optional<std::string>& parent_id
) {
    std::vector<Node> children;
    for (const auto& node : map.nodes) {
        if (node.parent_id == parent_id) children.push_back(node);
    }
    std::sort(children.begin(), children.end(),
        [](const Node& a, const Node& b) {
            return a.order != b.order ? a.order < b.order : a.id < b.id;
        });
    return children;
}

/**
 * Depth-first listing with depths, roots first.
 */
[[nodiscard]] inline std::vector<std::pair<Node, int>> flatten_tree(const Map& map) {
    std::vector<std::pair<Node, int>> result;
    std::function<void(const std::optional<std::string>&, int)> visit =
        [&](const std::optional<std::string>& parent_id, int depth) {
            for (const auto& child : child_nodes(map, parent_id)) {
                result.emplace_back(child, depth);
                visit(child.id, depth + 1);
            }
        };
    visit(std::nullopt, 0);
    return result;
}

[[nodiscard]] inline std::string_view edge_kind_name(EdgeKind kind) {
    return kind == EdgeKind::Reference ? "reference" : "hierarchy";
}

[[nodiscard]] inline EdgeKind edge_kind_from_name(std::string_view name) {
    return name == "reference" ? EdgeKind::Reference : EdgeKind::Hierarchy;
}

} // namespace mindsync
