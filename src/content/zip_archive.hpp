#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <functional>
#include <vector>

class QIODevice;

namespace airshare::content {

/**
 * ZipEntry - One member of a ZIP archive as recorded in its central directory.
 */
struct ZipEntry {
    QString name;  // '/'-separated path relative to the archive root
    uint16_t method = 0;  // 0 stored, 8 deflated
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;

    [[nodiscard]] bool is_directory() const { return name.endsWith(QLatin1Char('/')); }
};

/**
 * ZipWriter - Streams files into a deflated ZIP archive.
 *
 * Each file is read and compressed in fixed-size blocks, so memory use does not
 * grow with input size. The output device must be seekable: local headers are
 * patched with CRC and sizes once a member is complete. Archives are limited to
 * the classic (non-ZIP64) format: 65535 members, 4 GiB per member and offset.
 */
class ZipWriter {
public:
    explicit ZipWriter(QIODevice& out);

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    Result<void> add_file(const QString& entry_name, const QString& source_path);

    /**
     * Write the central directory. No members may be added afterwards.
     */
    Result<void> finish();

    [[nodiscard]] const std::vector<ZipEntry>& entries() const { return entries_; }

private:
    QIODevice& out_;
    std::vector<ZipEntry> entries_;
    bool finished_ = false;
};

using ZipSink = std::function<Result<void>(const char* data, qint64 size)>;

/**
 * Read the central directory of an archive.
 */
[[nodiscard]] Result<std::vector<ZipEntry>> read_zip_entries(const QString& archive_path);

/**
 * Decompress one member, handing the bytes to `sink` block by block.
 * The CRC and size are checked against the central directory.
 */
[[nodiscard]] Result<void> read_zip_entry(const QString& archive_path,
                                          const ZipEntry& entry,
                                          const ZipSink& sink);

/**
 * Convenience for small members: the whole decompressed content.
 */
[[nodiscard]] Result<QByteArray> read_zip_entry_bytes(const QString& archive_path,
                                                      const ZipEntry& entry);

/**
 * Extract every member below `destination_dir`. Members whose path would land
 * outside it, or onto the archive itself, are rejected before anything is
 * written.
 * Returns the paths of the extracted files.
 */
[[nodiscard]] Result<QStringList> extract_zip(const QString& archive_path,
                                              const QString& destination_dir);

} // namespace airshare::content
