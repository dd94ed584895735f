#pragma once

#include "remote/remote_adapter.hpp"
#include "core/types.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace mindsync::remote {

/**
 * MemoryRemote - In-process backend shared by any number of devices.
 *
 * Revisions are generation numbers ("g<N>"), so rewriting identical
 * content still produces a new revision, like an object store would.
 * The vault timestamp comes from the clock given at construction, which
 * plays the role of the server clock.
 *
 * Fault injection:
 * - set_online(false) makes every call fail with ErrorKind::Network.
 * - drop_write_responses(n) applies the next n writes but reports them
 *   as Network failures (response lost in transit).
 */
class MemoryRemote final : public RemoteAdapter {
public:
    explicit MemoryRemote(const Clock& clock) : clock_(clock) {}

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

    void set_online(bool online) { online_.store(online); }
    [[nodiscard]] bool is_online() const { return online_.load(); }

    void drop_write_responses(int count) { dropped_responses_.store(count); }

    [[nodiscard]] int write_count() const { return writes_.load(); }
    [[nodiscard]] int read_count() const { return reads_.load(); }
    [[nodiscard]] size_t file_count(const std::string& vault_id) const;

private:
    struct StoredFile {
        std::string payload;
        std::string revision;
        Timestamp modified_time;
    };

    struct VaultFolder {
        std::map<std::string, StoredFile> files;
        Timestamp changed_at;
    };

    const Clock& clock_;
    mutable std::mutex mutex_;
    std::map<std::string, VaultFolder> vaults_;
    std::map<std::string, Lock> locks_;
    uint64_t generation_{0};

    std::atomic<bool> online_{true};
    std::atomic<int> dropped_responses_{0};
    std::atomic<int> writes_{0};
    std::atomic<int> reads_{0};

    [[nodiscard]] Result<void, Error> check_online() const;
    void touch(VaultFolder& folder);
};

} // namespace mindsync::remote
