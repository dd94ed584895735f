#pragma once

#include <QLoggingCategory>
#include <string>
#include <QString>

// Logging categories for the engine. Debug output is off by default; set
// MINDSYNC_DEBUG_SYNC (see sync::apply_debug_logging) to enable it.
Q_DECLARE_LOGGING_CATEGORY(mindsyncStoreLog)
Q_DECLARE_LOGGING_CATEGORY(mindsyncSyncLog)
Q_DECLARE_LOGGING_CATEGORY(mindsyncRemoteLog)
Q_DECLARE_LOGGING_CATEGORY(mindsyncVaultLog)

namespace mindsync {

[[nodiscard]] inline QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace mindsync
