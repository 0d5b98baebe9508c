#pragma once

#include "content/packager.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QString>

#include <memory>

namespace airshare::content {

/**
 * ShareSession - The content one server instance exposes.
 *
 * Immutable once built. For files, size and MIME type are taken from the
 * resolved artifact at construction time and never re-read. A session built
 * from a PreparedArtifact keeps that artifact (and any temporary archive) alive.
 */
class ShareSession {
public:
    [[nodiscard]] static ShareSession from_text(QString body);

    [[nodiscard]] static Result<ShareSession> from_file(const QString& path, const QString& display_name);

    [[nodiscard]] static Result<ShareSession> from_artifact(std::shared_ptr<const PreparedArtifact> artifact);

    [[nodiscard]] const SharePayload& payload() const { return payload_; }

    [[nodiscard]] const TextPayload* text() const { return std::get_if<TextPayload>(&payload_); }
    [[nodiscard]] const FilePayload* file() const { return std::get_if<FilePayload>(&payload_); }

    /**
     * TextSender for text, FileSender for files.
     */
    [[nodiscard]] Role sender_role() const;

private:
    explicit ShareSession(SharePayload payload, std::shared_ptr<const PreparedArtifact> artifact = {});

    SharePayload payload_;
    std::shared_ptr<const PreparedArtifact> artifact_;
};

/**
 * MIME type sniffed from the file's contents (falls back to the extension).
 */
[[nodiscard]] QString sniff_mime_type(const QString& path);

/**
 * Decimal-unit size for display, e.g. "1.5 MB".
 */
[[nodiscard]] QString human_readable_size(quint64 bytes);

} // namespace airshare::content
