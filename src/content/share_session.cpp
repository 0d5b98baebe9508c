#include "content/share_session.hpp"

#include <QFileInfo>
#include <QLocale>
#include <QMimeDatabase>

namespace airshare::content {

ShareSession::ShareSession(SharePayload payload, std::shared_ptr<const PreparedArtifact> artifact)
    : payload_(std::move(payload))
    , artifact_(std::move(artifact))
{
}

ShareSession ShareSession::from_text(QString body) {
    return ShareSession(TextPayload{std::move(body)});
}

Result<ShareSession> ShareSession::from_file(const QString& path, const QString& display_name) {
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return Result<ShareSession>::err(Error{"not a regular file: " + path.toStdString(),
                                               ErrorCode::InvalidInput});
    }

    const auto real_path = info.canonicalFilePath();
    FilePayload file;
    file.path = real_path;
    file.display_name = display_name.isEmpty() ? QFileInfo(real_path).fileName() : display_name;
    file.size_bytes = static_cast<quint64>(info.size());
    file.mime_type = sniff_mime_type(real_path);
    return Result<ShareSession>::ok(ShareSession(std::move(file)));
}

Result<ShareSession> ShareSession::from_artifact(std::shared_ptr<const PreparedArtifact> artifact) {
    if (!artifact) {
        return Result<ShareSession>::err(Error{"no artifact", ErrorCode::InvalidInput});
    }
    auto session = from_file(artifact->path(), artifact->display_name());
    if (session.is_err()) {
        return session;
    }
    return Result<ShareSession>::ok(
        ShareSession(std::move(session).unwrap().payload_, std::move(artifact)));
}

Role ShareSession::sender_role() const {
    return std::holds_alternative<TextPayload>(payload_) ? Role::TextSender : Role::FileSender;
}

QString sniff_mime_type(const QString& path) {
    const QMimeDatabase db;
    return db.mimeTypeForFile(path, QMimeDatabase::MatchContent).name();
}

QString human_readable_size(quint64 bytes) {
    return QLocale::c().formattedDataSize(static_cast<qint64>(bytes), 1, QLocale::DataSizeSIFormat);
}

} // namespace airshare::content
