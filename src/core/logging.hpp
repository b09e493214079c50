#pragma once

#include <QLoggingCategory>
#include <QString>

namespace atelier {

Q_DECLARE_LOGGING_CATEGORY(atelierSyncLog)
Q_DECLARE_LOGGING_CATEGORY(atelierMergeLog)
Q_DECLARE_LOGGING_CATEGORY(atelierStoreLog)
Q_DECLARE_LOGGING_CATEGORY(atelierRemoteLog)

// Verbose per-write tracing, enabled by ATELIER_DEBUG_SYNC.
bool sync_debug_enabled();

// Installs a Qt message handler that appends every message to the log file.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
// ATELIER_LOG_PATH overrides it.
QString default_log_file_path();

} // namespace atelier
