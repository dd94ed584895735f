#pragma once

#include "core/sync_types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mindsync::sync {

enum class VaultState {
    Closed,
    Loading,
    Ready
};

[[nodiscard]] constexpr std::string_view vault_state_name(VaultState state) {
    switch (state) {
        case VaultState::Closed: return "closed";
        case VaultState::Loading: return "loading";
        case VaultState::Ready: return "ready";
    }
    return "closed";
}

/**
 * ConflictEvent - Published after the resolver has decided a conflict.
 */
struct ConflictEvent {
    std::string map_id;
    std::string vault_id;
    Winner winner{Winner::Remote};
    std::optional<std::string> backup_ref;
};

/**
 * EventSink - Receives engine notifications on the sync thread.
 *
 * The Qt service forwards them as signals; tests record them.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void sync_status_changed(const std::string& map_id, SyncStatus status) = 0;
    virtual void conflict_resolved(const ConflictEvent& event) = 0;
    virtual void vault_state_changed(const std::string& vault_id, VaultState state) = 0;
};

} // namespace mindsync::sync
