#include "core/types.hpp"

namespace airshare {

namespace {

constexpr std::string_view kTextSender = "Text Sender";
constexpr std::string_view kFileSender = "File Sender";
constexpr std::string_view kUploadReceiver = "Upload Receiver";

} // namespace

std::string_view role_identifier(Role role) noexcept {
    switch (role) {
        case Role::TextSender: return kTextSender;
        case Role::FileSender: return kFileSender;
        case Role::UploadReceiver: return kUploadReceiver;
    }
    return {};
}

std::optional<Role> role_from_identifier(std::string_view text) noexcept {
    if (text == kTextSender) return Role::TextSender;
    if (text == kFileSender) return Role::FileSender;
    if (text == kUploadReceiver) return Role::UploadReceiver;
    return std::nullopt;
}

QUrl TransferRequest::url(const QString& path) const {
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(address.toString());
    url.setPort(port);
    url.setPath(path);
    return url;
}

} // namespace airshare
