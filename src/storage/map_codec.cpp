#include "storage/map_codec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace mindsync::storage {

namespace {

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

std::string s(const QJsonValue& v) {
    return v.toString().toStdString();
}

Result<Map, Error> corrupt(const std::string& why) {
    return Result<Map, Error>::err(Error{ErrorKind::Corruption, "Invalid map payload: " + why});
}

} // namespace

QJsonObject map_to_json(const Map& map) {
    QJsonArray nodes;
    for (const auto& node : map.nodes) {
        QJsonObject n;
        n.insert("id", q(node.id));
        n.insert("parentId", node.parent_id ? QJsonValue(q(*node.parent_id)) : QJsonValue());
        n.insert("title", q(node.title));
        n.insert("content", q(node.content));
        n.insert("order", node.order);
        n.insert("modified", QJsonValue(static_cast<qint64>(node.modified_at.millis())));
        nodes.append(n);
    }

    QJsonArray edges;
    for (const auto& edge : map.edges) {
        QJsonObject e;
        e.insert("id", q(edge.id));
        e.insert("source", q(edge.source));
        e.insert("target", q(edge.target));
        e.insert("kind", q(std::string(edge_kind_name(edge.kind))));
        e.insert("label", q(edge.label));
        edges.append(e);
    }

    QJsonObject obj;
    obj.insert("format", MAP_FORMAT_VERSION);
    obj.insert("id", q(map.id));
    obj.insert("vaultId", q(map.vault_id));
    obj.insert("title", q(map.title));
    obj.insert("modified", QJsonValue(static_cast<qint64>(map.local_modified_at.millis())));
    obj.insert("nodes", nodes);
    obj.insert("edges", edges);
    return obj;
}

Result<Map, Error> map_from_json(const QJsonObject& obj) {
    if (obj.value("format").toInt(0) > MAP_FORMAT_VERSION) {
        return Result<Map, Error>::err(Error{ErrorKind::InvalidArgument,
            "Map payload format " + std::to_string(obj.value("format").toInt()) + " is newer than supported"});
    }
    if (!obj.value("id").isString() || obj.value("id").toString().isEmpty()) {
        return corrupt("missing id");
    }
    if (!obj.value("nodes").isArray() || !obj.value("edges").isArray()) {
        return corrupt("nodes/edges must be arrays");
    }

    Map map;
    map.id = s(obj.value("id"));
    map.vault_id = s(obj.value("vaultId"));
    map.title = s(obj.value("title"));
    map.local_modified_at = Timestamp(obj.value("modified").toInteger());

    for (const auto& value : obj.value("nodes").toArray()) {
        if (!value.isObject()) return corrupt("node is not an object");
        const auto n = value.toObject();
        Node node;
        node.id = s(n.value("id"));
        if (n.value("parentId").isString()) {
            node.parent_id = s(n.value("parentId"));
        }
        node.title = s(n.value("title"));
        node.content = s(n.value("content"));
        node.order = n.value("order").toInt();
        node.modified_at = Timestamp(n.value("modified").toInteger());
        map.nodes.push_back(std::move(node));
    }

    for (const auto& value : obj.value("edges").toArray()) {
        if (!value.isObject()) return corrupt("edge is not an object");
        const auto e = value.toObject();
        map.edges.push_back(Edge{
            .id = s(e.value("id")),
            .source = s(e.value("source")),
            .target = s(e.value("target")),
            .kind = edge_kind_from_name(e.value("kind").toString().toStdString()),
            .label = s(e.value("label"))
        });
    }

    auto valid = validate_tree(map);
    if (valid.is_err()) {
        return Result<Map, Error>::err(valid.unwrap_err());
    }
    return Result<Map, Error>::ok(std::move(map));
}

QByteArray encode_map_bytes(const Map& map) {
    return QJsonDocument(map_to_json(map)).toJson(QJsonDocument::Compact);
}

Result<Map, Error> decode_map_bytes(const QByteArray& bytes) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError) {
        return corrupt(err.errorString().toStdString());
    }
    if (!doc.isObject()) {
        return corrupt("top level is not an object");
    }
    return map_from_json(doc.object());
}

std::string encode_map(const Map& map) {
    return encode_map_bytes(map).toStdString();
}

Result<Map, Error> decode_map(std::string_view json) {
    return decode_map_bytes(QByteArray(json.data(), static_cast<qsizetype>(json.size())));
}

} // namespace mindsync::storage
