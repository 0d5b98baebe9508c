#include "content/packager.hpp"

#include "content/zip_archive.hpp"
#include "core/logging.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QTemporaryDir>

#include <algorithm>

namespace airshare::content {
namespace {

constexpr const char* kMultiArchiveName = "airshare.zip";

Error invalid(const std::string& message) {
    return Error{message, ErrorCode::InvalidInput};
}

QString input_base_name(const QString& path) {
    const QFileInfo info(path);
    const auto canonical = info.canonicalFilePath();
    return QFileInfo(canonical.isEmpty() ? info.absoluteFilePath() : canonical).fileName();
}

} // namespace

PreparedArtifact::PreparedArtifact(QString path, QString display_name)
    : path_(std::move(path))
    , display_name_(std::move(display_name))
{
}

PreparedArtifact::PreparedArtifact(std::unique_ptr<QTemporaryDir> owner, QString path,
                                   QString display_name)
    : owner_(std::move(owner))
    , path_(std::move(path))
    , display_name_(std::move(display_name))
{
}

PreparedArtifact::~PreparedArtifact() = default;
PreparedArtifact::PreparedArtifact(PreparedArtifact&&) noexcept = default;
PreparedArtifact& PreparedArtifact::operator=(PreparedArtifact&&) noexcept = default;

Result<void> validate_inputs(const QStringList& paths) {
    if (paths.isEmpty()) {
        return Result<void>::err(invalid("at least one file or directory is required"));
    }
    for (const auto& path : paths) {
        if (path.trimmed().isEmpty()) {
            return Result<void>::err(invalid("empty path in input list"));
        }
        if (!QFileInfo::exists(path)) {
            return Result<void>::err(invalid("no such file or directory: " + path.toStdString()));
        }
    }
    return Result<void>::ok();
}

bool needs_archive(const QStringList& paths, bool force_compress) {
    return force_compress || paths.size() > 1 || (paths.size() == 1 && QFileInfo(paths.first()).isDir());
}

Result<std::vector<ArchiveInput>> collect_archive_inputs(const QStringList& paths) {
    using R = Result<std::vector<ArchiveInput>>;

    std::vector<ArchiveInput> inputs;
    QSet<QString> seen;

    auto add = [&](QString entry, QString source) -> Result<void> {
        if (seen.contains(entry)) {
            return Result<void>::err(invalid("two inputs map to the same archive member: " +
                                             entry.toStdString()));
        }
        seen.insert(entry);
        inputs.push_back(ArchiveInput{std::move(entry), std::move(source)});
        return Result<void>::ok();
    };

    for (const auto& path : paths) {
        const QFileInfo info(path);
        const auto base = input_base_name(path);

        if (!info.isDir()) {
            auto r = add(base, info.absoluteFilePath());
            if (r.is_err()) return R::err(r.unwrap_err());
            continue;
        }

        const QDir root(info.absoluteFilePath());
        std::vector<QString> files;
        QDirIterator it(root.absolutePath(), QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                        QDirIterator::Subdirectories);
        while (it.hasNext()) {
            files.push_back(root.relativeFilePath(it.next()));
        }
        std::sort(files.begin(), files.end());

        const auto prefix = base.isEmpty() ? QString{} : base + QLatin1Char('/');
        for (const auto& rel : files) {
            auto r = add(prefix + QDir::fromNativeSeparators(rel), root.absoluteFilePath(rel));
            if (r.is_err()) return R::err(r.unwrap_err());
        }
    }

    return R::ok(std::move(inputs));
}

QString archive_display_name(const QStringList& paths) {
    if (paths.size() == 1) {
        const auto base = input_base_name(paths.first());
        if (!base.isEmpty()) {
            return base + QStringLiteral(".zip");
        }
    }
    return QString::fromLatin1(kMultiArchiveName);
}

Result<PreparedArtifact> prepare(const QStringList& paths, bool force_compress) {
    using R = Result<PreparedArtifact>;

    auto valid = validate_inputs(paths);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }

    if (!needs_archive(paths, force_compress)) {
        const QFileInfo info(paths.first());
        return R::ok(PreparedArtifact(info.absoluteFilePath(), info.fileName()));
    }

    auto collected = collect_archive_inputs(paths);
    if (collected.is_err()) {
        return R::err(collected.unwrap_err());
    }

    auto dir = std::make_unique<QTemporaryDir>(QDir::tempPath() + QStringLiteral("/airshare-XXXXXX"));
    if (!dir->isValid()) {
        return R::err(Error{"cannot create temporary directory: " + dir->errorString().toStdString(),
                            ErrorCode::Io});
    }

    const auto name = archive_display_name(paths);
    const auto archive_path = dir->filePath(name);

    QFile out(archive_path);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return R::err(Error{"cannot create " + archive_path.toStdString() + ": " +
                                out.errorString().toStdString(),
                            ErrorCode::Io});
    }

    ZipWriter writer(out);
    for (const auto& input : collected.unwrap()) {
        auto r = writer.add_file(input.entry_name, input.source_path);
        if (r.is_err()) return R::err(r.unwrap_err());
    }
    auto finished = writer.finish();
    if (finished.is_err()) {
        return R::err(finished.unwrap_err());
    }
    out.close();

    qCInfo(airshareContentLog) << "Packed" << writer.entries().size() << "files into" << archive_path;
    return R::ok(PreparedArtifact(std::move(dir), archive_path, name));
}

} // namespace airshare::content
