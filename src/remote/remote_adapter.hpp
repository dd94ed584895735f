#pragma once

#include "core/map.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mindsync::remote {

/**
 * RemoteFileInfo - Listing entry for one map file.
 *
 * modified_time is the modification time carried by the stored payload,
 * not the backend's own write time.
 */
struct RemoteFileInfo {
    std::string file_id;
    Timestamp modified_time;
    std::string revision;

    bool operator==(const RemoteFileInfo&) const = default;
};

/**
 * RemoteFile - A map file as read from the backend.
 */
struct RemoteFile {
    Map map;
    std::string revision;
    Timestamp modified_time;
};

struct WriteResult {
    std::string revision;
    Timestamp modified_time;
};

/**
 * RemoteAdapter - Abstract interface over a remote object store holding
 * one file per map and one folder per vault.
 *
 * Failures are reported as:
 * - ErrorKind::Network   backend unreachable; retry later
 * - ErrorKind::Conflict  an expected_revision precondition failed
 * - ErrorKind::NotFound  the file does not exist
 * - ErrorKind::Corruption the stored payload cannot be decoded
 *
 * Implementations must be safe to call from the sync thread while the
 * caller's thread only touches the local store.
 */
class RemoteAdapter {
public:
    virtual ~RemoteAdapter() = default;

    virtual Result<std::vector<RemoteFileInfo>, Error> list_files(const std::string& vault_id) = 0;

    virtual Result<RemoteFile, Error> read_file(const std::string& vault_id,
                                                const std::string& file_id) = 0;

    /**
     * Store `payload` as the file's content. When expected_revision is set
     * the write only happens if the current revision equals it; an empty
     * expected revision means the file must not exist yet.
     */
    virtual Result<WriteResult, Error> write_file(
        const std::string& vault_id,
        const std::string& file_id,
        const Map& payload,
        const std::optional<std::string>& expected_revision) = 0;

    virtual Result<void, Error> delete_file(const std::string& vault_id,
                                            const std::string& file_id) = 0;

    /**
     * Time of the most recent change anywhere in the vault (Timestamp{}
     * for a vault the backend has never seen).
     */
    virtual Result<Timestamp, Error> get_vault_timestamp(const std::string& vault_id) = 0;

    // Vault lock marker, shared by every device using the backend. It is
    // not a map file: it never shows up in list_files and does not move
    // the vault timestamp.

    virtual Result<std::optional<Lock>, Error> read_lock(const std::string& vault_id) = 0;

    /**
     * Store `candidate` as the vault's lock in one atomic step, unless a
     * lock that has not expired at candidate.acquired_at is present.
     * Returns that holder when refusing, std::nullopt when stored.
     */
    virtual Result<std::optional<Lock>, Error> try_lock(const Lock& candidate) = 0;

    /**
     * Remove the marker if it still carries lock.lock_id. Returns whether
     * it did.
     */
    virtual Result<bool, Error> release_lock(const Lock& lock) = 0;
};

} // namespace mindsync::remote
