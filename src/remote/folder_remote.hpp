#pragma once

#include "remote/remote_adapter.hpp"
#include "core/types.hpp"
#include <QByteArray>
#include <QString>
#include <memory>

class QLockFile;

namespace mindsync::remote {

/**
 * FolderRemote - A backend rooted in a directory, typically a mounted or
 * cloud-synchronized folder shared between devices.
 *
 * Layout:
 *   <root>/<vault_id>/<map_id>.json   one map per file
 *   <root>/<vault_id>/.vault.json     {"changedAt": <ms>}
 *   <root>/<vault_id>/.lock           vault lock marker (lease)
 *   <root>/<vault_id>/.vault.lck      QLockFile held around each
 *                                     precondition check and write
 *
 * Revisions are BLAKE2b digests of the file bytes. A missing root
 * directory is reported as ErrorKind::Network (the share is unreachable).
 */
class FolderRemote final : public RemoteAdapter {
public:
    [[nodiscard]] static Result<std::unique_ptr<FolderRemote>, Error> open(
        const QString& root, const Clock& clock);

    FolderRemote(QString root, const Clock& clock);

    Result<std::vector<RemoteFileInfo>, Error> list_files(const std::string& vault_id) override;
    Result<RemoteFile, Error> read_file(const std::string& vault_id, const std::string& file_id) override;
    Result<WriteResult, Error> write_file(
        const std::string& vault_id,
        const std::string& file_id,
        const Map& payload,
        const std::optional<std::string>& expected_revision) override;
    Result<void, Error> delete_file(const std::string& vault_id, const std::string& file_id) override;
    Result<Timestamp, Error> get_vault_timestamp(const std::string& vault_id) override;
    Result<std::optional<Lock>, Error> read_lock(const std::string& vault_id) override;
    Result<std::optional<Lock>, Error> try_lock(const Lock& candidate) override;
    Result<bool, Error> release_lock(const Lock& lock) override;

    [[nodiscard]] const QString& root() const { return root_; }

private:
    QString root_;
    const Clock& clock_;

    [[nodiscard]] Result<void, Error> check_reachable() const;
    [[nodiscard]] Result<void, Error> check_vault(const std::string& vault_id) const;
    [[nodiscard]] Result<std::unique_ptr<QLockFile>, Error> guard_vault(const std::string& vault_id) const;
    [[nodiscard]] Result<std::optional<Lock>, Error> load_lock(const std::string& vault_id) const;
    [[nodiscard]] QString vault_dir(const std::string& vault_id) const;
    [[nodiscard]] QString file_path(const std::string& vault_id, const std::string& file_id) const;
    [[nodiscard]] Result<std::optional<QByteArray>, Error> read_bytes(const QString& path) const;
    [[nodiscard]] Result<void, Error> write_bytes(const QString& path, const QByteArray& bytes) const;
    [[nodiscard]] Result<void, Error> touch_vault(const std::string& vault_id);
};

} // namespace mindsync::remote
