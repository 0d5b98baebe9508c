#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(airshareServerLog)
Q_DECLARE_LOGGING_CATEGORY(airshareDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(airshareClientLog)
Q_DECLARE_LOGGING_CATEGORY(airshareContentLog)

namespace airshare {

// Installs a Qt message handler that stamps time/level/category on every line
// and writes it to stderr, plus `log_file` when non-empty. Debug output of the
// airshare categories stays off unless `debug` is set.
void install_logging(const QString& log_file, bool debug);

// Path the handler appends to (empty when logging only to stderr).
QString current_log_file_path();

} // namespace airshare
