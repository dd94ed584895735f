#pragma once

#include "core/map.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <string>
#include <string_view>

namespace mindsync::storage {

/**
 * JSON form of a map: the remote file body, the queued payload snapshot
 * and the backup body all use it.
 *
 * {"format":1,"id":..,"vaultId":..,"title":..,"modified":<ms>,
 *  "nodes":[{"id","parentId","title","content","order","modified"}],
 *  "edges":[{"id","source","target","kind","label"}]}
 *
 * last_synced_at and remote_revision are per-device bookkeeping and are
 * not encoded.
 */
inline constexpr int MAP_FORMAT_VERSION = 1;

[[nodiscard]] QJsonObject map_to_json(const Map& map);
[[nodiscard]] Result<Map, Error> map_from_json(const QJsonObject& obj);

[[nodiscard]] QByteArray encode_map_bytes(const Map& map);
[[nodiscard]] Result<Map, Error> decode_map_bytes(const QByteArray& bytes);

[[nodiscard]] std::string encode_map(const Map& map);
[[nodiscard]] Result<Map, Error> decode_map(std::string_view json);

} // namespace mindsync::storage
