#pragma once

#include <QHostAddress>
#include <QString>
#include <QUrl>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace airshare {

/**
 * Role - The behavioral mode a running server commits to at startup.
 *
 * The role selects which routes exist and what `/airshare` answers.
 */
enum class Role {
    TextSender,
    FileSender,
    UploadReceiver,
};

/**
 * Literal body returned by `GET /airshare` for a role. Part of the wire
 * contract; other implementations compare it byte for byte.
 */
[[nodiscard]] std::string_view role_identifier(Role role) noexcept;

/**
 * Inverse of role_identifier(); nullopt for anything that is not an exact match.
 */
[[nodiscard]] std::optional<Role> role_from_identifier(std::string_view text) noexcept;

/**
 * ServiceRecord - One advertised instance on the local network.
 */
struct ServiceRecord {
    QString name;
    QHostAddress address;
    uint16_t port = 0;

    bool operator==(const ServiceRecord& other) const {
        return name == other.name && address == other.address && port == other.port;
    }
};

struct TextPayload {
    QString body;
};

struct FilePayload {
    QString path;
    QString display_name;
    quint64 size_bytes = 0;
    QString mime_type;
};

using SharePayload = std::variant<TextPayload, FilePayload>;

/**
 * TransferRequest - A resolved client-side target, built per operation.
 */
struct TransferRequest {
    QString name;
    QHostAddress address;
    uint16_t port = 0;
    Role expected_role = Role::UploadReceiver;

    /**
     * http://<address>:<port> with the given path.
     */
    [[nodiscard]] QUrl url(const QString& path) const;
};

} // namespace airshare
