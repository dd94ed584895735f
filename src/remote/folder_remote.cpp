#include "remote/folder_remote.hpp"
#include "storage/map_codec.hpp"
#include "crypto/content_hash.hpp"
#include "core/log.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLockFile>
#include <QSaveFile>
#include <algorithm>

namespace mindsync::remote {

namespace {

constexpr int LOCK_WAIT_MS = 5000;
const QString VAULT_META = QStringLiteral(".vault.json");
const QString LOCK_NAME = QStringLiteral(".lock");
const QString GUARD_NAME = QStringLiteral(".vault.lck");
const QString MAP_SUFFIX = QStringLiteral(".json");

std::string revision_of(const QByteArray& bytes) {
    return crypto::content_revision(std::string_view(bytes.constData(), static_cast<size_t>(bytes.size())));
}

Error io_error(const QString& what, const QString& path, const QString& reason) {
    return Error{ErrorKind::Network,
        (what + " " + path + ": " + reason).toStdString()};
}

bool valid_id(const std::string& id) {
    return !id.empty() && id.front() != '.' &&
           id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

QByteArray encode_lock(const Lock& lock) {
    QJsonObject obj;
    obj.insert("lockId", qs(lock.lock_id));
    obj.insert("deviceId", qs(lock.device_id));
    obj.insert("operation", qs(lock.operation));
    obj.insert("acquiredAt", QJsonValue(static_cast<qint64>(lock.acquired_at.millis())));
    obj.insert("expiresAt", QJsonValue(static_cast<qint64>(lock.expires_at.millis())));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

std::optional<Lock> decode_lock(const std::string& vault_id, const QByteArray& bytes) {
    const auto doc = QJsonDocument::fromJson(bytes);
    if (!doc.isObject()) return std::nullopt;
    const auto obj = doc.object();
    if (!obj.value("lockId").isString() || !obj.value("expiresAt").isDouble()) return std::nullopt;
    return Lock{
        .lock_id = obj.value("lockId").toString().toStdString(),
        .vault_id = vault_id,
        .acquired_at = Timestamp(obj.value("acquiredAt").toInteger()),
        .expires_at = Timestamp(obj.value("expiresAt").toInteger()),
        .operation = obj.value("operation").toString().toStdString(),
        .device_id = obj.value("deviceId").toString().toStdString()
    };
}

} // namespace

Result<std::unique_ptr<FolderRemote>, Error> FolderRemote::open(const QString& root, const Clock& clock) {
    auto sodium = crypto::init();
    if (sodium.is_err()) {
        return propagate<std::unique_ptr<FolderRemote>>(sodium);
    }
    if (!QDir().mkpath(root)) {
        return Result<std::unique_ptr<FolderRemote>, Error>::err(Error{ErrorKind::Network,
            "Cannot create remote folder " + root.toStdString()});
    }
    qCInfo(mindsyncRemoteLog) << "Using folder remote at" << root;
    return Result<std::unique_ptr<FolderRemote>, Error>::ok(std::make_unique<FolderRemote>(root, clock));
}

FolderRemote::FolderRemote(QString root, const Clock& clock)
    : root_(std::move(root))
    , clock_(clock) {}

Result<void, Error> FolderRemote::check_reachable() const {
    if (!QFileInfo(root_).isDir()) {
        return Result<void, Error>::err(Error{ErrorKind::Network,
            "Remote folder unavailable: " + root_.toStdString()});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> FolderRemote::check_vault(const std::string& vault_id) const {
    auto reachable = check_reachable();
    if (reachable.is_err()) return reachable;
    if (!valid_id(vault_id)) {
        return Result<void, Error>::err(Error{ErrorKind::InvalidArgument, "Invalid vault id: " + vault_id});
    }
    return Result<void, Error>::ok();
}

Result<std::unique_ptr<QLockFile>, Error> FolderRemote::guard_vault(const std::string& vault_id) const {
    if (!QDir().mkpath(vault_dir(vault_id))) {
        return Result<std::unique_ptr<QLockFile>, Error>::err(
            io_error("Cannot create", vault_dir(vault_id), "mkpath failed"));
    }
    auto guard = std::make_unique<QLockFile>(QDir(vault_dir(vault_id)).filePath(GUARD_NAME));
    if (!guard->tryLock(LOCK_WAIT_MS)) {
        return Result<std::unique_ptr<QLockFile>, Error>::err(Error{ErrorKind::Network,
            "Timed out waiting for the lock of vault " + vault_id});
    }
    return Result<std::unique_ptr<QLockFile>, Error>::ok(std::move(guard));
}

QString FolderRemote::vault_dir(const std::string& vault_id) const {
    return QDir(root_).filePath(qs(vault_id));
}

QString FolderRemote::file_path(const std::string& vault_id, const std::string& file_id) const {
    return QDir(vault_dir(vault_id)).filePath(qs(file_id) + MAP_SUFFIX);
}

Result<std::optional<QByteArray>, Error> FolderRemote::read_bytes(const QString& path) const {
    QFile file(path);
    if (!file.exists()) {
        return Result<std::optional<QByteArray>, Error>::ok(std::nullopt);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<std::optional<QByteArray>, Error>::err(io_error("Cannot read", path, file.errorString()));
    }
    return Result<std::optional<QByteArray>, Error>::ok(file.readAll());
}

Result<void, Error> FolderRemote::write_bytes(const QString& path, const QByteArray& bytes) const {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<void, Error>::err(io_error("Cannot write", path, file.errorString()));
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return Result<void, Error>::err(io_error("Short write to", path, file.errorString()));
    }
    if (!file.commit()) {
        return Result<void, Error>::err(io_error("Cannot commit", path, file.errorString()));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> FolderRemote::touch_vault(const std::string& vault_id) {
    const auto path = QDir(vault_dir(vault_id)).filePath(VAULT_META);

    auto previous = get_vault_timestamp(vault_id);
    if (previous.is_err()) return propagate<void>(previous);

    auto changed_at = std::max(clock_.now(), previous.unwrap() + std::chrono::milliseconds(1));
    QJsonObject meta;
    meta.insert("changedAt", QJsonValue(static_cast<qint64>(changed_at.millis())));
    return write_bytes(path, QJsonDocument(meta).toJson(QJsonDocument::Compact));
}

Result<std::vector<RemoteFileInfo>, Error> FolderRemote::list_files(const std::string& vault_id) {
    auto checked = check_vault(vault_id);
    if (checked.is_err()) {
        return propagate<std::vector<RemoteFileInfo>>(checked);
    }

    std::vector<RemoteFileInfo> files;
    QDir dir(vault_dir(vault_id));
    if (!dir.exists()) {
        return Result<std::vector<RemoteFileInfo>, Error>::ok(std::move(files));
    }

    const auto entries = dir.entryInfoList({QStringLiteral("*") + MAP_SUFFIX}, QDir::Files, QDir::Name);
    for (const auto& entry : entries) {
        if (entry.fileName().startsWith('.')) continue;

        auto bytes = read_bytes(entry.filePath());
        if (bytes.is_err()) {
            return propagate<std::vector<RemoteFileInfo>>(bytes);
        }
        if (!bytes.unwrap()) continue;  // removed since the directory scan

        const auto& content = *bytes.unwrap();
        auto map = storage::decode_map_bytes(content);
        Timestamp modified = map.is_ok()
            ? map.unwrap().local_modified_at
            : Timestamp(entry.lastModified().toMSecsSinceEpoch());
        if (map.is_err()) {
            qCWarning(mindsyncRemoteLog) << "Undecodable remote file" << entry.filePath()
                                         << qs(map.unwrap_err().message);
        }

        files.push_back(RemoteFileInfo{
            .file_id = entry.completeBaseName().toStdString(),
            .modified_time = modified,
            .revision = revision_of(content)
        });
    }
    return Result<std::vector<RemoteFileInfo>, Error>::ok(std::move(files));
}

Result<RemoteFile, Error> FolderRemote::read_file(const std::string& vault_id, const std::string& file_id) {
    auto checked = check_vault(vault_id);
    if (checked.is_err()) {
        return propagate<RemoteFile>(checked);
    }
    if (!valid_id(file_id)) {
        return Result<RemoteFile, Error>::err(Error{ErrorKind::InvalidArgument, "Invalid file id: " + file_id});
    }

    auto bytes = read_bytes(file_path(vault_id, file_id));
    if (bytes.is_err()) {
        return propagate<RemoteFile>(bytes);
    }
    if (!bytes.unwrap()) {
        return Result<RemoteFile, Error>::err(Error{ErrorKind::NotFound,
            "Remote file not found: " + vault_id + "/" + file_id});
    }

    const auto& content = *bytes.unwrap();
    auto map = storage::decode_map_bytes(content);
    if (map.is_err()) {
        return propagate<RemoteFile>(map);
    }
    auto modified = map.unwrap().local_modified_at;
    return Result<RemoteFile, Error>::ok(RemoteFile{
        .map = std::move(map).unwrap(),
        .revision = revision_of(content),
        .modified_time = modified
    });
}

Result<WriteResult, Error> FolderRemote::write_file(
    const std::string& vault_id,
    const std::string& file_id,
    const Map& payload,
    const std::optional<std::string>& expected_revision
) {
    auto checked = check_vault(vault_id);
    if (checked.is_err()) {
        return propagate<WriteResult>(checked);
    }
    if (!valid_id(file_id)) {
        return Result<WriteResult, Error>::err(Error{ErrorKind::InvalidArgument, "Invalid file id: " + file_id});
    }

    auto guard = guard_vault(vault_id);
    if (guard.is_err()) {
        return propagate<WriteResult>(guard);
    }

    const auto path = file_path(vault_id, file_id);
    if (expected_revision) {
        auto current = read_bytes(path);
        if (current.is_err()) {
            return propagate<WriteResult>(current);
        }
        const std::string current_revision = current.unwrap() ? revision_of(*current.unwrap()) : std::string{};
        if (current_revision != *expected_revision) {
            return Result<WriteResult, Error>::err(Error{ErrorKind::Conflict,
                "Revision mismatch for " + vault_id + "/" + file_id});
        }
    }

    const auto bytes = storage::encode_map_bytes(payload);
    auto written = write_bytes(path, bytes);
    if (written.is_err()) {
        return propagate<WriteResult>(written);
    }
    auto touched = touch_vault(vault_id);
    if (touched.is_err()) {
        return propagate<WriteResult>(touched);
    }

    qCDebug(mindsyncRemoteLog) << "Wrote" << path;
    return Result<WriteResult, Error>::ok(WriteResult{
        .revision = revision_of(bytes),
        .modified_time = payload.local_modified_at
    });
}

Result<void, Error> FolderRemote::delete_file(const std::string& vault_id, const std::string& file_id) {
    auto checked = check_vault(vault_id);
    if (checked.is_err()) return checked;
    if (!valid_id(file_id)) {
        return Result<void, Error>::err(Error{ErrorKind::InvalidArgument, "Invalid file id: " + file_id});
    }

    const auto path = file_path(vault_id, file_id);
    if (!QFile::exists(path)) {
        return Result<void, Error>::err(Error{ErrorKind::NotFound,
            "Remote file not found: " + vault_id + "/" + file_id});
    }

    auto guard = guard_vault(vault_id);
    if (guard.is_err()) return propagate<void>(guard);

    QFile file(path);
    if (!file.remove()) {
        return Result<void, Error>::err(io_error("Cannot delete", path, file.errorString()));
    }
    return touch_vault(vault_id);
}

Result<Timestamp, Error> FolderRemote::get_vault_timestamp(const std::string& vault_id) {
    auto checked = check_vault(vault_id);
    if (checked.is_err()) {
        return propagate<Timestamp>(checked);
    }

    auto bytes = read_bytes(QDir(vault_dir(vault_id)).filePath(VAULT_META));
    if (bytes.is_err()) {
        return propagate<Timestamp>(bytes);
    }
    if (!bytes.unwrap()) {
        return Result<Timestamp, Error>::ok(Timestamp{});
    }

    const auto doc = QJsonDocument::fromJson(*bytes.unwrap());
    if (!doc.isObject()) {
        return Result<Timestamp, Error>::err(Error{ErrorKind::Corruption,
            "Unreadable " + VAULT_META.toStdString() + " in vault " + vault_id});
    }
    return Result<Timestamp, Error>::ok(Timestamp(doc.object().value("changedAt").toInteger()));
}

Result<std::optional<Lock>, Error> FolderRemote::load_lock(const std::string& vault_id) const {
    const auto path = QDir(vault_dir(vault_id)).filePath(LOCK_NAME);
    auto bytes = read_bytes(path);
    if (bytes.is_err()) {
        return propagate<std::optional<Lock>>(bytes);
    }
    if (!bytes.unwrap()) {
        return Result<std::optional<Lock>, Error>::ok(std::nullopt);
    }
    auto lock = decode_lock(vault_id, *bytes.unwrap());
    if (!lock) {
        // Unreadable markers count as absent.
        qCWarning(mindsyncRemoteLog) << "Ignoring unreadable lock marker" << path;
    }
    return Result<std::optional<Lock>, Error>::ok(std::move(lock));
}

Result<std::optional<Lock>, Error> FolderRemote::read_lock(const std::string& vault_id) {
    auto checked = check_vault(vault_id);
    if (checked.is_err()) {
        return propagate<std::optional<Lock>>(checked);
    }
    return load_lock(vault_id);
}

Result<std::optional<Lock>, Error> FolderRemote::try_lock(const Lock& candidate) {
    using R = Result<std::optional<Lock>, Error>;
    auto checked = check_vault(candidate.vault_id);
    if (checked.is_err()) return propagate<std::optional<Lock>>(checked);

    auto guard = guard_vault(candidate.vault_id);
    if (guard.is_err()) return propagate<std::optional<Lock>>(guard);

    auto current = load_lock(candidate.vault_id);
    if (current.is_err()) return current;
    if (const auto& holder = current.unwrap(); holder && !holder->expired_at(candidate.acquired_at)) {
        return R::ok(*holder);
    }

    auto written = write_bytes(QDir(vault_dir(candidate.vault_id)).filePath(LOCK_NAME), encode_lock(candidate));
    if (written.is_err()) return propagate<std::optional<Lock>>(written);
    return R::ok(std::nullopt);
}

Result<bool, Error> FolderRemote::release_lock(const Lock& lock) {
    auto checked = check_vault(lock.vault_id);
    if (checked.is_err()) return propagate<bool>(checked);

    auto guard = guard_vault(lock.vault_id);
    if (guard.is_err()) return propagate<bool>(guard);

    auto current = load_lock(lock.vault_id);
    if (current.is_err()) return propagate<bool>(current);
    if (!current.unwrap() || current.unwrap()->lock_id != lock.lock_id) {
        return Result<bool, Error>::ok(false);
    }

    const auto path = QDir(vault_dir(lock.vault_id)).filePath(LOCK_NAME);
    QFile file(path);
    if (!file.remove()) {
        return Result<bool, Error>::err(io_error("Cannot remove", path, file.errorString()));
    }
    return Result<bool, Error>::ok(true);
}

} // namespace mindsync::remote
