#include "core/log.hpp"

Q_LOGGING_CATEGORY(mindsyncStoreLog, "mindsync.store", QtInfoMsg)
Q_LOGGING_CATEGORY(mindsyncSyncLog, "mindsync.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(mindsyncRemoteLog, "mindsync.remote", QtInfoMsg)
Q_LOGGING_CATEGORY(mindsyncVaultLog, "mindsync.vault", QtInfoMsg)
