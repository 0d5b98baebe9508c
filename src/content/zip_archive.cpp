#include "content/zip_archive.hpp"

#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QtEndian>

#include <zlib.h>

#include <array>
#include <limits>

namespace airshare::content {
namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;

constexpr int kLocalHeaderSize = 30;
constexpr int kCentralHeaderSize = 46;
constexpr int kEndOfCentralDirSize = 22;
constexpr int kMaxCommentSize = 0xFFFF;

constexpr uint16_t kVersionNeeded = 20;
constexpr uint16_t kVersionMadeBy = (3 << 8) | 20;  // Unix, 2.0
constexpr uint16_t kFlagEncrypted = 0x0001;
constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;
constexpr uint32_t kUnixFileMode = 0100644u << 16;

constexpr qint64 kBlockSize = 64 * 1024;
constexpr uint64_t kZip32Max = std::numeric_limits<uint32_t>::max();

Error io_error(const std::string& what) {
    return Error{what, ErrorCode::Io};
}

void put16(QByteArray& buf, uint16_t v) {
    std::array<char, 2> b{};
    qToLittleEndian(v, b.data());
    buf.append(b.data(), 2);
}

void put32(QByteArray& buf, uint32_t v) {
    std::array<char, 4> b{};
    qToLittleEndian(v, b.data());
    buf.append(b.data(), 4);
}

uint16_t get16(const char* p) { return qFromLittleEndian<uint16_t>(p); }
uint32_t get32(const char* p) { return qFromLittleEndian<uint32_t>(p); }

void to_dos_time(const QDateTime& when, uint16_t& dos_time, uint16_t& dos_date) {
    const auto local = when.isValid() ? when.toLocalTime() : QDateTime::currentDateTime();
    const auto d = local.date();
    const auto t = local.time();
    const int year = qBound(1980, d.year(), 2107);
    dos_date = static_cast<uint16_t>(((year - 1980) << 9) | (d.month() << 5) | d.day());
    dos_time = static_cast<uint16_t>((t.hour() << 11) | (t.minute() << 5) | (t.second() / 2));
}

bool write_all(QIODevice& out, const char* data, qint64 size) {
    return out.write(data, size) == size;
}

struct DeflateStream {
    z_stream zs{};
    bool initialized = false;

    ~DeflateStream() {
        if (initialized) deflateEnd(&zs);
    }
};

struct InflateStream {
    z_stream zs{};
    bool initialized = false;

    ~InflateStream() {
        if (initialized) inflateEnd(&zs);
    }
};

// Offset of the first data byte of a member, read from its local header.
Result<qint64> member_data_offset(QFile& archive, const ZipEntry& entry) {
    if (!archive.seek(static_cast<qint64>(entry.local_header_offset))) {
        return Result<qint64>::err(io_error("cannot seek to local header of " + entry.name.toStdString()));
    }
    const auto header = archive.read(kLocalHeaderSize);
    if (header.size() != kLocalHeaderSize || get32(header.constData()) != kLocalHeaderSig) {
        return Result<qint64>::err(Error{"bad local header for " + entry.name.toStdString(),
                                         ErrorCode::Protocol});
    }
    const auto name_len = get16(header.constData() + 26);
    const auto extra_len = get16(header.constData() + 28);
    return Result<qint64>::ok(static_cast<qint64>(entry.local_header_offset) + kLocalHeaderSize +
                              name_len + extra_len);
}

// Relative member path below `root`, or an empty string if it would escape.
QString contained_path(const QDir& root, const QString& member) {
    if (member.isEmpty() || member.startsWith(QLatin1Char('/')) || member.contains(QLatin1Char('\\')) ||
        member.contains(QLatin1Char(':'))) {
        return {};
    }
    const auto clean = QDir::cleanPath(member);
    if (clean == QLatin1String("..") || clean.startsWith(QLatin1String("../"))) {
        return {};
    }
    const auto full = QDir::cleanPath(root.absoluteFilePath(clean));
    const auto base = QDir::cleanPath(root.absolutePath()) + QLatin1Char('/');
    if (!full.startsWith(base)) {
        return {};
    }
    return full;
}

} // namespace

ZipWriter::ZipWriter(QIODevice& out)
    : out_(out)
{
}

Result<void> ZipWriter::add_file(const QString& entry_name, const QString& source_path) {
    if (finished_) {
        return Result<void>::err(Error{"archive already finished"});
    }
    if (out_.isSequential()) {
        return Result<void>::err(io_error("zip output must be seekable"));
    }
    if (entries_.size() >= 0xFFFF) {
        return Result<void>::err(io_error("too many archive members"));
    }

    QFile in(source_path);
    if (!in.open(QIODevice::ReadOnly)) {
        return Result<void>::err(io_error("cannot read " + source_path.toStdString() + ": " +
                                          in.errorString().toStdString()));
    }

    ZipEntry entry;
    entry.name = entry_name;
    entry.method = kMethodDeflated;
    entry.local_header_offset = static_cast<uint64_t>(out_.pos());
    to_dos_time(QFileInfo(source_path).lastModified(), entry.dos_time, entry.dos_date);

    if (entry.local_header_offset > kZip32Max) {
        return Result<void>::err(io_error("archive exceeds 4 GiB"));
    }

    const auto name = entry_name.toUtf8();
    QByteArray header;
    put32(header, kLocalHeaderSig);
    put16(header, kVersionNeeded);
    put16(header, kFlagUtf8);
    put16(header, entry.method);
    put16(header, entry.dos_time);
    put16(header, entry.dos_date);
    put32(header, 0);  // crc, patched below
    put32(header, 0);  // compressed size
    put32(header, 0);  // uncompressed size
    put16(header, static_cast<uint16_t>(name.size()));
    put16(header, 0);
    header.append(name);
    if (!write_all(out_, header.constData(), header.size())) {
        return Result<void>::err(io_error("cannot write archive: " + out_.errorString().toStdString()));
    }

    DeflateStream stream;
    if (deflateInit2(&stream.zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return Result<void>::err(Error{"deflateInit2 failed"});
    }
    stream.initialized = true;

    QByteArray in_buf(static_cast<int>(kBlockSize), Qt::Uninitialized);
    QByteArray out_buf(static_cast<int>(kBlockSize), Qt::Uninitialized);
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t total_in = 0;
    uint64_t total_out = 0;

    bool done = false;
    while (!done) {
        const qint64 n = in.read(in_buf.data(), kBlockSize);
        if (n < 0) {
            return Result<void>::err(io_error("read failed on " + source_path.toStdString()));
        }
        crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buf.constData()), static_cast<uInt>(n));
        total_in += static_cast<uint64_t>(n);

        const int flush = (n == 0 || in.atEnd()) ? Z_FINISH : Z_NO_FLUSH;
        stream.zs.next_in = reinterpret_cast<Bytef*>(in_buf.data());
        stream.zs.avail_in = static_cast<uInt>(n);
        do {
            stream.zs.next_out = reinterpret_cast<Bytef*>(out_buf.data());
            stream.zs.avail_out = static_cast<uInt>(kBlockSize);
            const int ret = deflate(&stream.zs, flush);
            if (ret == Z_STREAM_ERROR) {
                return Result<void>::err(Error{"deflate failed"});
            }
            const qint64 produced = kBlockSize - stream.zs.avail_out;
            if (!write_all(out_, out_buf.constData(), produced)) {
                return Result<void>::err(io_error("cannot write archive: " +
                                                  out_.errorString().toStdString()));
            }
            total_out += static_cast<uint64_t>(produced);
        } while (stream.zs.avail_out == 0);
        done = (flush == Z_FINISH);
    }

    if (total_in > kZip32Max || total_out > kZip32Max) {
        return Result<void>::err(io_error("member " + entry_name.toStdString() + " exceeds 4 GiB"));
    }

    entry.crc32 = static_cast<uint32_t>(crc);
    entry.compressed_size = total_out;
    entry.uncompressed_size = total_in;

    const qint64 end = out_.pos();
    QByteArray sizes;
    put32(sizes, entry.crc32);
    put32(sizes, static_cast<uint32_t>(entry.compressed_size));
    put32(sizes, static_cast<uint32_t>(entry.uncompressed_size));
    if (!out_.seek(static_cast<qint64>(entry.local_header_offset) + 14) ||
        !write_all(out_, sizes.constData(), sizes.size()) || !out_.seek(end)) {
        return Result<void>::err(io_error("cannot patch local header for " + entry_name.toStdString()));
    }

    qCDebug(airshareContentLog) << "zip: added" << entry_name << total_in << "->" << total_out;
    entries_.push_back(std::move(entry));
    return Result<void>::ok();
}

Result<void> ZipWriter::finish() {
    if (finished_) {
        return Result<void>::ok();
    }

    const qint64 cd_offset = out_.pos();
    QByteArray cd;
    for (const auto& e : entries_) {
        const auto name = e.name.toUtf8();
        put32(cd, kCentralHeaderSig);
        put16(cd, kVersionMadeBy);
        put16(cd, kVersionNeeded);
        put16(cd, kFlagUtf8);
        put16(cd, e.method);
        put16(cd, e.dos_time);
        put16(cd, e.dos_date);
        put32(cd, e.crc32);
        put32(cd, static_cast<uint32_t>(e.compressed_size));
        put32(cd, static_cast<uint32_t>(e.uncompressed_size));
        put16(cd, static_cast<uint16_t>(name.size()));
        put16(cd, 0);  // extra
        put16(cd, 0);  // comment
        put16(cd, 0);  // disk number
        put16(cd, 0);  // internal attributes
        put32(cd, kUnixFileMode);
        put32(cd, static_cast<uint32_t>(e.local_header_offset));
        cd.append(name);
    }

    if (static_cast<uint64_t>(cd_offset) > kZip32Max) {
        return Result<void>::err(io_error("archive exceeds 4 GiB"));
    }

    QByteArray eocd;
    put32(eocd, kEndOfCentralDirSig);
    put16(eocd, 0);
    put16(eocd, 0);
    put16(eocd, static_cast<uint16_t>(entries_.size()));
    put16(eocd, static_cast<uint16_t>(entries_.size()));
    put32(eocd, static_cast<uint32_t>(cd.size()));
    put32(eocd, static_cast<uint32_t>(cd_offset));
    put16(eocd, 0);

    if (!write_all(out_, cd.constData(), cd.size()) ||
        !write_all(out_, eocd.constData(), eocd.size())) {
        return Result<void>::err(io_error("cannot write central directory: " +
                                          out_.errorString().toStdString()));
    }
    finished_ = true;
    return Result<void>::ok();
}

Result<std::vector<ZipEntry>> read_zip_entries(const QString& archive_path) {
    using R = Result<std::vector<ZipEntry>>;

    QFile archive(archive_path);
    if (!archive.open(QIODevice::ReadOnly)) {
        return R::err(io_error("cannot open " + archive_path.toStdString() + ": " +
                               archive.errorString().toStdString()));
    }

    const qint64 size = archive.size();
    if (size < kEndOfCentralDirSize) {
        return R::err(Error{"not a zip archive: " + archive_path.toStdString(), ErrorCode::Protocol});
    }

    const qint64 tail_len = qMin<qint64>(size, kEndOfCentralDirSize + kMaxCommentSize);
    if (!archive.seek(size - tail_len)) {
        return R::err(io_error("cannot seek in " + archive_path.toStdString()));
    }
    const auto tail = archive.read(tail_len);

    qint64 eocd = -1;
    for (qint64 i = tail.size() - kEndOfCentralDirSize; i >= 0; --i) {
        if (get32(tail.constData() + i) == kEndOfCentralDirSig) {
            eocd = i;
            break;
        }
    }
    if (eocd < 0) {
        return R::err(Error{"no end of central directory in " + archive_path.toStdString(),
                            ErrorCode::Protocol});
    }

    const char* e = tail.constData() + eocd;
    const uint16_t count = get16(e + 10);
    const uint32_t cd_size = get32(e + 12);
    const uint32_t cd_offset = get32(e + 16);
    if (count == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF) {
        return R::err(Error{"zip64 archives are not supported", ErrorCode::Protocol});
    }
    if (static_cast<qint64>(cd_offset) + cd_size > size) {
        return R::err(Error{"central directory out of range", ErrorCode::Protocol});
    }

    if (!archive.seek(cd_offset)) {
        return R::err(io_error("cannot seek to central directory"));
    }
    const auto cd = archive.read(cd_size);
    if (cd.size() != static_cast<qint64>(cd_size)) {
        return R::err(io_error("short read of central directory"));
    }

    std::vector<ZipEntry> entries;
    entries.reserve(count);
    qint64 pos = 0;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + kCentralHeaderSize > cd.size() || get32(cd.constData() + pos) != kCentralHeaderSig) {
            return R::err(Error{"corrupt central directory", ErrorCode::Protocol});
        }
        const char* h = cd.constData() + pos;
        const uint16_t flags = get16(h + 8);
        const uint16_t name_len = get16(h + 28);
        const uint16_t extra_len = get16(h + 30);
        const uint16_t comment_len = get16(h + 32);
        if (pos + kCentralHeaderSize + name_len + extra_len + comment_len > cd.size()) {
            return R::err(Error{"corrupt central directory", ErrorCode::Protocol});
        }
        if (flags & kFlagEncrypted) {
            return R::err(Error{"encrypted archives are not supported", ErrorCode::Protocol});
        }

        ZipEntry entry;
        entry.method = get16(h + 10);
        entry.dos_time = get16(h + 12);
        entry.dos_date = get16(h + 14);
        entry.crc32 = get32(h + 16);
        entry.compressed_size = get32(h + 20);
        entry.uncompressed_size = get32(h + 24);
        entry.local_header_offset = get32(h + 42);

        const char* name = h + kCentralHeaderSize;
        entry.name = (flags & kFlagUtf8) ? QString::fromUtf8(name, name_len)
                                         : QString::fromLatin1(name, name_len);
        entries.push_back(std::move(entry));
        pos += kCentralHeaderSize + name_len + extra_len + comment_len;
    }

    return R::ok(std::move(entries));
}

Result<void> read_zip_entry(const QString& archive_path, const ZipEntry& entry, const ZipSink& sink) {
    if (entry.method != kMethodStored && entry.method != kMethodDeflated) {
        return Result<void>::err(Error{"unsupported compression method " +
                                           std::to_string(entry.method) + " for " +
                                           entry.name.toStdString(),
                                       ErrorCode::Protocol});
    }

    QFile archive(archive_path);
    if (!archive.open(QIODevice::ReadOnly)) {
        return Result<void>::err(io_error("cannot open " + archive_path.toStdString()));
    }

    auto offset = member_data_offset(archive, entry);
    if (offset.is_err()) {
        return Result<void>::err(offset.unwrap_err());
    }
    if (!archive.seek(offset.unwrap())) {
        return Result<void>::err(io_error("cannot seek to data of " + entry.name.toStdString()));
    }

    QByteArray in_buf(static_cast<int>(kBlockSize), Qt::Uninitialized);
    QByteArray out_buf(static_cast<int>(kBlockSize), Qt::Uninitialized);
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t produced_total = 0;
    uint64_t remaining = entry.compressed_size;

    InflateStream stream;
    if (entry.method == kMethodDeflated) {
        if (inflateInit2(&stream.zs, -MAX_WBITS) != Z_OK) {
            return Result<void>::err(Error{"inflateInit2 failed"});
        }
        stream.initialized = true;
    }

    bool stream_end = (entry.method != kMethodDeflated);
    while (remaining > 0) {
        const qint64 want = static_cast<qint64>(qMin<uint64_t>(remaining, kBlockSize));
        const qint64 n = archive.read(in_buf.data(), want);
        if (n <= 0) {
            return Result<void>::err(io_error("truncated member " + entry.name.toStdString()));
        }
        remaining -= static_cast<uint64_t>(n);

        if (entry.method == kMethodStored) {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buf.constData()), static_cast<uInt>(n));
            produced_total += static_cast<uint64_t>(n);
            auto r = sink(in_buf.constData(), n);
            if (r.is_err()) return r;
            continue;
        }

        stream.zs.next_in = reinterpret_cast<Bytef*>(in_buf.data());
        stream.zs.avail_in = static_cast<uInt>(n);
        while (stream.zs.avail_in > 0 && !stream_end) {
            stream.zs.next_out = reinterpret_cast<Bytef*>(out_buf.data());
            stream.zs.avail_out = static_cast<uInt>(kBlockSize);
            const int ret = inflate(&stream.zs, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                return Result<void>::err(Error{"corrupt deflate data in " + entry.name.toStdString(),
                                               ErrorCode::Protocol});
            }
            const qint64 produced = kBlockSize - stream.zs.avail_out;
            if (produced > 0) {
                crc = crc32(crc, reinterpret_cast<const Bytef*>(out_buf.constData()),
                            static_cast<uInt>(produced));
                produced_total += static_cast<uint64_t>(produced);
                auto r = sink(out_buf.constData(), produced);
                if (r.is_err()) return r;
            }
            stream_end = (ret == Z_STREAM_END);
        }
    }

    // A deflate stream may still hold output after its last input byte.
    while (!stream_end) {
        stream.zs.next_in = nullptr;
        stream.zs.avail_in = 0;
        stream.zs.next_out = reinterpret_cast<Bytef*>(out_buf.data());
        stream.zs.avail_out = static_cast<uInt>(kBlockSize);
        const int ret = inflate(&stream.zs, Z_FINISH);
        const qint64 produced = kBlockSize - stream.zs.avail_out;
        if (produced > 0) {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(out_buf.constData()),
                        static_cast<uInt>(produced));
            produced_total += static_cast<uint64_t>(produced);
            auto r = sink(out_buf.constData(), produced);
            if (r.is_err()) return r;
        }
        if (ret == Z_STREAM_END) {
            stream_end = true;
        } else if (produced == 0) {
            return Result<void>::err(Error{"truncated deflate data in " + entry.name.toStdString(),
                                           ErrorCode::Protocol});
        }
    }

    if (produced_total != entry.uncompressed_size || static_cast<uint32_t>(crc) != entry.crc32) {
        return Result<void>::err(Error{"checksum mismatch in " + entry.name.toStdString(),
                                       ErrorCode::Protocol});
    }
    return Result<void>::ok();
}

Result<QByteArray> read_zip_entry_bytes(const QString& archive_path, const ZipEntry& entry) {
    QByteArray bytes;
    bytes.reserve(static_cast<int>(qMin<uint64_t>(entry.uncompressed_size, 16 * 1024 * 1024)));
    auto r = read_zip_entry(archive_path, entry, [&](const char* data, qint64 size) {
        bytes.append(data, size);
        return Result<void>::ok();
    });
    if (r.is_err()) {
        return Result<QByteArray>::err(r.unwrap_err());
    }
    return Result<QByteArray>::ok(std::move(bytes));
}

Result<QStringList> extract_zip(const QString& archive_path, const QString& destination_dir) {
    auto listed = read_zip_entries(archive_path);
    if (listed.is_err()) {
        return Result<QStringList>::err(listed.unwrap_err());
    }
    const auto entries = std::move(listed).unwrap();

    QDir root(destination_dir);
    if (!root.mkpath(QStringLiteral("."))) {
        return Result<QStringList>::err(io_error("cannot create " + destination_dir.toStdString()));
    }

    // Validate every member before touching the disk. Members are read back
    // from the archive one at a time, so none may be written over it.
    const QFileInfo archive_info(archive_path);
    const QString archive_file = archive_info.canonicalFilePath().isEmpty() ? archive_info.absoluteFilePath()
                                                                            : archive_info.canonicalFilePath();
    std::vector<QString> targets;
    targets.reserve(entries.size());
    for (const auto& entry : entries) {
        auto target = contained_path(root, entry.name);
        if (target.isEmpty()) {
            return Result<QStringList>::err(Error{"archive member escapes destination: " +
                                                      entry.name.toStdString(),
                                                  ErrorCode::Protocol});
        }
        const QFileInfo target_info(target);
        const QString resolved = target_info.exists() ? target_info.canonicalFilePath() : target_info.absoluteFilePath();
        if (resolved == archive_file) {
            return Result<QStringList>::err(Error{"archive member would overwrite the archive: " +
                                                      entry.name.toStdString(),
                                                  ErrorCode::Protocol});
        }
        targets.push_back(std::move(target));
    }

    QStringList extracted;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const auto& target = targets[i];

        if (entry.is_directory()) {
            if (!QDir().mkpath(target)) {
                return Result<QStringList>::err(io_error("cannot create " + target.toStdString()));
            }
            continue;
        }

        if (!QDir().mkpath(QFileInfo(target).absolutePath())) {
            return Result<QStringList>::err(io_error("cannot create parent of " + target.toStdString()));
        }

        QFile out(target);
        if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return Result<QStringList>::err(io_error("cannot write " + target.toStdString() + ": " +
                                                     out.errorString().toStdString()));
        }
        auto r = read_zip_entry(archive_path, entry, [&](const char* data, qint64 size) {
            if (out.write(data, size) != size) {
                return Result<void>::err(io_error("write failed on " + target.toStdString()));
            }
            return Result<void>::ok();
        });
        if (r.is_err()) {
            return Result<QStringList>::err(r.unwrap_err());
        }
        extracted << target;
    }

    qCInfo(airshareContentLog) << "Extracted" << extracted.size() << "files from" << archive_path;
    return Result<QStringList>::ok(std::move(extracted));
}

} // namespace airshare::content
