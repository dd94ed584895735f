#pragma once

#include "remote/remote_adapter.hpp"
#include <functional>
#include <set>
#include <string>

namespace mindsync::testing {

/**
 * ScriptedRemote - Forwards to another backend, failing selected calls.
 */
class ScriptedRemote final : public remote::RemoteAdapter {
public:
    explicit ScriptedRemote(remote::RemoteAdapter& inner) : inner_(inner) {}

    // Writes to these file ids fail with ErrorKind::Network.
    std::set<std::string> failing_writes;

    // Called after every successful read_file with the number of reads so far.
    std::function<void(int)> after_read;

    Result<std::vector<remote::RemoteFileInfo>, Error> list_files(const std::string& vault_id) override {
        return inner_.list_files(vault_id);
    }

    Result<remote::RemoteFile, Error> read_file(const std::string& vault_id,
                                                const std::string& file_id) override {
        auto result = inner_.read_file(vault_id, file_id);
        if (result.is_ok()) {
            ++reads_;
            if (after_read) after_read(reads_);
        }
        return result;
    }

    Result<remote::WriteResult, Error> write_file(
        const std::string& vault_id,
        const std::string& file_id,
        const Map& payload,
        const std::optional<std::string>& expected_revision) override {
        if (failing_writes.contains(file_id)) {
            return Result<remote::WriteResult, Error>::err(Error{ErrorKind::Network,
                "Scripted write failure for " + file_id});
        }
        return inner_.write_file(vault_id, file_id, payload, expected_revision);
    }

    Result<void, Error> delete_file(const std::string& vault_id, const std::string& file_id) override {
        return inner_.delete_file(vault_id, file_id);
    }

    Result<Timestamp, Error> get_vault_timestamp(const std::string& vault_id) override {
        return inner_.get_vault_timestamp(vault_id);
    }

    Result<std::optional<Lock>, Error> read_lock(const std::string& vault_id) override {
        return inner_.read_lock(vault_id);
    }

    Result<std::optional<Lock>, Error> try_lock(const Lock& candidate) override {
        return inner_.try_lock(candidate);
    }

    Result<bool, Error> release_lock(const Lock& lock) override {
        return inner_.release_lock(lock);
    }

private:
    remote::RemoteAdapter& inner_;
    int reads_{0};
};

} // namespace mindsync::testing
