#include "remote/memory_remote.hpp"
#include "storage/map_codec.hpp"
#include "core/log.hpp"
#include <algorithm>

namespace mindsync::remote {

Result<void, Error> MemoryRemote::check_online() const {
    if (!online_.load()) {
        return Result<void, Error>::err(Error{ErrorKind::Network, "Remote is offline"});
    }
    return Result<void, Error>::ok();
}

void MemoryRemote::touch(VaultFolder& folder) {
    folder.changed_at = std::max(clock_.now(), folder.changed_at + std::chrono::milliseconds(1));
}

Result<std::vector<RemoteFileInfo>, Error> MemoryRemote::list_files(const std::string& vault_id) {
    auto online = check_online();
    if (online.is_err()) {
        return propagate<std::vector<RemoteFileInfo>>(online);
    }

    std::lock_guard lock(mutex_);
    std::vector<RemoteFileInfo> files;
    if (auto it = vaults_.find(vault_id); it != vaults_.end()) {
        for (const auto& [file_id, file] : it->second.files) {
            files.push_back(RemoteFileInfo{
                .file_id = file_id,
                .modified_time = file.modified_time,
                .revision = file.revision
            });
        }
    }
    return Result<std::vector<RemoteFileInfo>, Error>::ok(std::move(files));
}

Result<RemoteFile, Error> MemoryRemote::read_file(const std::string& vault_id, const std::string& file_id) {
    auto online = check_online();
    if (online.is_err()) {
        return propagate<RemoteFile>(online);
    }

    std::lock_guard lock(mutex_);
    ++reads_;
    auto vault = vaults_.find(vault_id);
    if (vault == vaults_.end() || !vault->second.files.contains(file_id)) {
        return Result<RemoteFile, Error>::err(Error{ErrorKind::NotFound,
            "Remote file not found: " + vault_id + "/" + file_id});
    }

    const auto& stored = vault->second.files.at(file_id);
    auto map = storage::decode_map(stored.payload);
    if (map.is_err()) {
        return propagate<RemoteFile>(map);
    }
    return Result<RemoteFile, Error>::ok(RemoteFile{
        .map = std::move(map).unwrap(),
        .revision = stored.revision,
        .modified_time = stored.modified_time
    });
}

Result<WriteResult, Error> MemoryRemote::write_file(
    const std::string& vault_id,
    const std::string& file_id,
    const Map& payload,
    const std::optional<std::string>& expected_revision
) {
    auto online = check_online();
    if (online.is_err()) {
        return propagate<WriteResult>(online);
    }

    std::lock_guard lock(mutex_);
    auto& folder = vaults_[vault_id];
    auto existing = folder.files.find(file_id);
    const std::string current = existing == folder.files.end() ? std::string{} : existing->second.revision;

    if (expected_revision && *expected_revision != current) {
        qCDebug(mindsyncRemoteLog) << "Precondition failed for" << qs(file_id)
                                   << "expected" << qs(*expected_revision) << "have" << qs(current);
        return Result<WriteResult, Error>::err(Error{ErrorKind::Conflict,
            "Revision mismatch for " + vault_id + "/" + file_id});
    }

    StoredFile file{
        .payload = storage::encode_map(payload),
        .revision = "g" + std::to_string(++generation_),
        .modified_time = payload.local_modified_at
    };
    WriteResult result{.revision = file.revision, .modified_time = file.modified_time};
    folder.files.insert_or_assign(file_id, std::move(file));
    touch(folder);
    ++writes_;

    if (dropped_responses_.load() > 0) {
        --dropped_responses_;
        return Result<WriteResult, Error>::err(Error{ErrorKind::Network,
            "Connection reset before response for " + file_id});
    }
    return Result<WriteResult, Error>::ok(std::move(result));
}

Result<void, Error> MemoryRemote::delete_file(const std::string& vault_id, const std::string& file_id) {
    auto online = check_online();
    if (online.is_err()) return online;

    std::lock_guard lock(mutex_);
    auto vault = vaults_.find(vault_id);
    if (vault == vaults_.end() || vault->second.files.erase(file_id) == 0) {
        return Result<void, Error>::err(Error{ErrorKind::NotFound,
            "Remote file not found: " + vault_id + "/" + file_id});
    }
    touch(vault->second);
    return Result<void, Error>::ok();
}

Result<Timestamp, Error> MemoryRemote::get_vault_timestamp(const std::string& vault_id) {
    auto online = check_online();
    if (online.is_err()) {
        return propagate<Timestamp>(online);
    }

    std::lock_guard lock(mutex_);
    auto vault = vaults_.find(vault_id);
    return Result<Timestamp, Error>::ok(vault == vaults_.end() ? Timestamp{} : vault->second.changed_at);
}

Result<std::optional<Lock>, Error> MemoryRemote::read_lock(const std::string& vault_id) {
    auto online = check_online();
    if (online.is_err()) {
        return propagate<std::optional<Lock>>(online);
    }

    std::lock_guard lock(mutex_);
    auto it = locks_.find(vault_id);
    if (it == locks_.end()) {
        return Result<std::optional<Lock>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Lock>, Error>::ok(it->second);
}

Result<std::optional<Lock>, Error> MemoryRemote::try_lock(const Lock& candidate) {
    auto online = check_online();
    if (online.is_err()) {
        return propagate<std::optional<Lock>>(online);
    }

    std::lock_guard lock(mutex_);
    auto it = locks_.find(candidate.vault_id);
    if (it != locks_.end() && !it->second.expired_at(candidate.acquired_at)) {
        return Result<std::optional<Lock>, Error>::ok(it->second);
    }
    locks_.insert_or_assign(candidate.vault_id, candidate);
    return Result<std::optional<Lock>, Error>::ok(std::nullopt);
}

Result<bool, Error> MemoryRemote::release_lock(const Lock& lock_record) {
    auto online = check_online();
    if (online.is_err()) {
        return propagate<bool>(online);
    }

    std::lock_guard lock(mutex_);
    auto it = locks_.find(lock_record.vault_id);
    if (it == locks_.end() || it->second.lock_id != lock_record.lock_id) {
        return Result<bool, Error>::ok(false);
    }
    locks_.erase(it);
    return Result<bool, Error>::ok(true);
}

size_t MemoryRemote::file_count(const std::string& vault_id) const {
    std::lock_guard lock(mutex_);
    auto vault = vaults_.find(vault_id);
    return vault == vaults_.end() ? 0 : vault->second.files.size();
}

} // namespace mindsync::remote
