#include "core/config.hpp"

#include <QtGlobal>

#include <limits>
#include <string>

namespace airshare {

Settings settings_from_environment() {
    Settings settings;
    settings.discovery_backend =
        qEnvironmentVariable("AIRSHARE_DISCOVERY_BACKEND").trimmed().toLower();
    settings.log_file = qEnvironmentVariable("AIRSHARE_LOG_FILE").trimmed();
    settings.debug = qEnvironmentVariableIsSet("AIRSHARE_DEBUG");

    const auto timeout = qEnvironmentVariable("AIRSHARE_LOOKUP_TIMEOUT_MS").trimmed();
    if (!timeout.isEmpty()) {
        auto parsed = parse_timeout_ms(timeout);
        if (parsed.is_ok()) {
            settings.lookup_timeout = parsed.unwrap();
        } else {
            qWarning("Ignoring AIRSHARE_LOOKUP_TIMEOUT_MS: %s",
                     parsed.unwrap_err().message.c_str());
        }
    }
    return settings;
}

Result<std::chrono::milliseconds> parse_timeout_ms(const QString& text) {
    bool ok = false;
    const qlonglong value = text.trimmed().toLongLong(&ok);
    // QTimer intervals are ints.
    if (!ok || value <= 0 || value > std::numeric_limits<int>::max()) {
        return Result<std::chrono::milliseconds>::err(Error{
            "timeout must be between 1 and " + std::to_string(std::numeric_limits<int>::max()) +
                " milliseconds, got '" +
                text.toStdString() + "'",
            ErrorCode::InvalidInput});
    }
    return Result<std::chrono::milliseconds>::ok(std::chrono::milliseconds{value});
}

Result<uint16_t> parse_port(const QString& text) {
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value <= 0 || value > 65535) {
        return Result<uint16_t>::err(Error{
            "port must be in 1..65535, got '" + text.toStdString() + "'",
            ErrorCode::InvalidInput});
    }
    return Result<uint16_t>::ok(static_cast<uint16_t>(value));
}

} // namespace airshare
