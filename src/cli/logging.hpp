#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(uuidsortCliLog)

namespace uuidsort::cli {

// Installs a Qt message handler that stamps time/level/category on every
// line. Writes to `log_file_path` when it is non-empty and can be opened,
// otherwise to stderr.
void install_logging(const QString& log_file_path);

// UUIDSORT_LOG_FILE, or empty.
[[nodiscard]] QString configured_log_file_path();

// True when UUIDSORT_DEBUG is set to anything but "0".
[[nodiscard]] bool debug_requested();

// Turns on the debug level of every uuidsort.* category.
void enable_debug_logging();

} // namespace uuidsort::cli
