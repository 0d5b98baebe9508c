#pragma once

#include "core/result.hpp"

#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

class QTemporaryDir;

namespace airshare::content {

/**
 * PreparedArtifact - The single file that will be transferred.
 *
 * Either a caller's file used in place, or an archive synthesized into a
 * private temporary directory. The temporary directory (and the archive in it)
 * is removed when the artifact is destroyed, so whoever holds the artifact owns
 * the archive's lifetime; keep it alive until the transfer has finished.
 */
class PreparedArtifact {
public:
    PreparedArtifact(QString path, QString display_name);
    PreparedArtifact(std::unique_ptr<QTemporaryDir> owner, QString path, QString display_name);
    ~PreparedArtifact();

    PreparedArtifact(PreparedArtifact&&) noexcept;
    PreparedArtifact& operator=(PreparedArtifact&&) noexcept;
    PreparedArtifact(const PreparedArtifact&) = delete;
    PreparedArtifact& operator=(const PreparedArtifact&) = delete;

    [[nodiscard]] const QString& path() const { return path_; }
    [[nodiscard]] const QString& display_name() const { return display_name_; }

    /**
     * True when the artifact is a temporary archive owned by this object.
     */
    [[nodiscard]] bool is_archive() const { return owner_ != nullptr; }

private:
    std::unique_ptr<QTemporaryDir> owner_;
    QString path_;
    QString display_name_;
};

/**
 * ArchiveInput - One file to be stored in an archive, and its member name.
 */
struct ArchiveInput {
    QString entry_name;
    QString source_path;
};

/**
 * Check that `paths` is non-empty and that every entry names something on disk.
 * Fails with ErrorCode::InvalidInput.
 */
[[nodiscard]] Result<void> validate_inputs(const QStringList& paths);

/**
 * True when `prepare` would build an archive for these inputs.
 */
[[nodiscard]] bool needs_archive(const QStringList& paths, bool force_compress);

/**
 * Expand inputs into archive members. A file becomes a member named by its
 * base name; a directory contributes every file below it, named
 * `<dir name>/<relative path>` with '/' separators. Members of a directory are
 * sorted; inputs keep the caller's order.
 */
[[nodiscard]] Result<std::vector<ArchiveInput>> collect_archive_inputs(const QStringList& paths);

/**
 * Name given to a synthesized archive: `<name>.zip` for a single input,
 * `airshare.zip` for several.
 */
[[nodiscard]] QString archive_display_name(const QStringList& paths);

/**
 * Normalize one or more files/directories into a single transferable artifact.
 *
 * Archives when `force_compress` is set, when more than one path is given, or
 * when the single path is a directory. Otherwise the file itself is the
 * artifact and its base name the display name.
 */
[[nodiscard]] Result<PreparedArtifact> prepare(const QStringList& paths, bool force_compress);

} // namespace airshare::content
