#pragma once

#include <QString>

namespace mindsync::app {

// Installs a Qt message handler that appends every message to the log file
// as "<utc time> <level> <thread> <category> <message>". Warnings and worse
// always go to stderr as well; with `echo` every line does.
//
// The file is rotated to "<name>.1" once it grows past
// MINDSYNC_LOG_MAX_BYTES (default 4 MiB).
void install_file_logging(bool echo = false);

// Log file in use: MINDSYNC_LOG_PATH, else logs/mindsync.log under the
// application data directory. Empty if neither is available.
QString default_log_file_path();

} // namespace mindsync::app
