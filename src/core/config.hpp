#pragma once

#include "core/result.hpp"

#include <QString>

#include <chrono>
#include <cstdint>

namespace airshare {

/**
 * Settings - Process-wide knobs read from the environment.
 *
 *   AIRSHARE_DISCOVERY_BACKEND  "avahi" | "udp" (empty picks the platform default)
 *   AIRSHARE_LOOKUP_TIMEOUT_MS  bounded discovery query time
 *   AIRSHARE_LOG_FILE           append log lines to this file as well
 *   AIRSHARE_DEBUG              enable debug logging categories
 */
struct Settings {
    static constexpr std::chrono::milliseconds DEFAULT_LOOKUP_TIMEOUT{3000};

    QString discovery_backend;
    std::chrono::milliseconds lookup_timeout = DEFAULT_LOOKUP_TIMEOUT;
    QString log_file;
    bool debug = false;
};

[[nodiscard]] Settings settings_from_environment();

/**
 * Parse a positive millisecond count; used for AIRSHARE_LOOKUP_TIMEOUT_MS
 * and the CLI's --timeout.
 */
[[nodiscard]] Result<std::chrono::milliseconds> parse_timeout_ms(const QString& text);

/**
 * Parse a TCP port in 1..65535.
 */
[[nodiscard]] Result<uint16_t> parse_port(const QString& text);

} // namespace airshare
