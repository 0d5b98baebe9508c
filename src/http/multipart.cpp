#include "http/multipart.hpp"

namespace airshare::http {
namespace {

constexpr qsizetype kMaxPartHeaderSize = 8 * 1024;
constexpr qsizetype kMaxBoundaryLineSize = 256;
constexpr qsizetype kMaxBoundaryLength = 70;

bool only_whitespace(const QByteArray& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t') return false;
    }
    return true;
}

} // namespace

MultipartParser::MultipartParser(QByteArray boundary, Callbacks callbacks)
    : delimiter_("\r\n--" + boundary)
    , callbacks_(std::move(callbacks))
    , buffer_("\r\n")  // lets the first boundary line match the delimiter
{
}

Result<void> MultipartParser::fail(const std::string& why) {
    state_ = State::Failed;
    buffer_.clear();
    return Result<void>::err(Error{"multipart: " + why, ErrorCode::Protocol});
}

Result<void> MultipartParser::abort_with(Error error) {
    state_ = State::Failed;
    buffer_.clear();
    return Result<void>::err(std::move(error));
}

Result<void> MultipartParser::feed(const QByteArray& chunk) {
    if (state_ == State::Failed) {
        return Result<void>::err(Error{"multipart: parser already failed", ErrorCode::Protocol});
    }
    if (state_ == State::Done) {
        return Result<void>::ok();  // epilogue
    }

    buffer_.append(chunk);

    for (;;) {
        switch (state_) {
            case State::Preamble: {
                const auto idx = buffer_.indexOf(delimiter_);
                if (idx < 0) {
                    const auto keep = delimiter_.size() - 1;
                    if (buffer_.size() > keep) {
                        buffer_.remove(0, buffer_.size() - keep);
                    }
                    return Result<void>::ok();
                }
                buffer_.remove(0, idx + delimiter_.size());
                state_ = State::AfterBoundary;
                break;
            }

            case State::AfterBoundary: {
                if (buffer_.size() < 2) {
                    return Result<void>::ok();
                }
                if (buffer_.startsWith("--")) {
                    state_ = State::Done;
                    buffer_.clear();
                    return Result<void>::ok();
                }
                const auto eol = buffer_.indexOf("\r\n");
                if (eol < 0) {
                    if (buffer_.size() > kMaxBoundaryLineSize) {
                        return fail("boundary line too long");
                    }
                    return Result<void>::ok();
                }
                if (!only_whitespace(buffer_.left(eol))) {
                    return fail("garbage after boundary");
                }
                buffer_.remove(0, eol + 2);
                state_ = State::Headers;
                break;
            }

            case State::Headers: {
                QByteArray block;
                if (buffer_.startsWith("\r\n")) {
                    buffer_.remove(0, 2);
                } else {
                    const auto end = buffer_.indexOf("\r\n\r\n");
                    if (end < 0) {
                        if (buffer_.size() > kMaxPartHeaderSize) {
                            return fail("part headers too large");
                        }
                        return Result<void>::ok();
                    }
                    block = buffer_.left(end);
                    buffer_.remove(0, end + 4);
                }
                auto parsed = parse_part_headers(block);
                if (parsed.is_err()) {
                    return parsed;
                }
                state_ = State::Body;
                break;
            }

            case State::Body: {
                const auto idx = buffer_.indexOf(delimiter_);
                if (idx >= 0) {
                    if (idx > 0 && callbacks_.on_part_data) {
                        auto r = callbacks_.on_part_data(buffer_.constData(), idx);
                        if (r.is_err()) return abort_with(r.unwrap_err());
                    }
                    if (callbacks_.on_part_end) {
                        auto r = callbacks_.on_part_end();
                        if (r.is_err()) return abort_with(r.unwrap_err());
                    }
                    buffer_.remove(0, idx + delimiter_.size());
                    state_ = State::AfterBoundary;
                    break;
                }

                // Anything before the last (delimiter - 1) bytes cannot start a boundary.
                const auto safe = buffer_.size() - (delimiter_.size() - 1);
                if (safe > 0) {
                    if (callbacks_.on_part_data) {
                        auto r = callbacks_.on_part_data(buffer_.constData(), safe);
                        if (r.is_err()) return abort_with(r.unwrap_err());
                    }
                    buffer_.remove(0, safe);
                }
                return Result<void>::ok();
            }

            case State::Done:
                return Result<void>::ok();

            case State::Failed:
                return Result<void>::err(Error{"multipart: parser already failed", ErrorCode::Protocol});
        }
    }
}

Result<void> MultipartParser::parse_part_headers(const QByteArray& block) {
    PartHeaders headers;
    bool has_disposition = false;

    for (const auto& raw : block.split('\n')) {
        QByteArray line = raw;
        if (line.endsWith('\r')) line.chop(1);
        if (line.isEmpty()) continue;

        const auto colon = line.indexOf(':');
        if (colon <= 0) {
            return fail("bad part header");
        }
        const auto name = line.left(colon).trimmed().toLower();
        const auto value = line.mid(colon + 1).trimmed();

        if (name == "content-disposition") {
            const auto parsed = parse_header_value(value);
            if (parsed.token != "form-data") {
                return fail("part is not form-data");
            }
            headers.field_name = parsed.params.value("name");
            if (parsed.params.contains("filename")) {
                headers.file_name = QString::fromUtf8(parsed.params.value("filename"));
            }
            has_disposition = true;
        } else if (name == "content-type") {
            headers.content_type = value;
        }
    }

    if (!has_disposition) {
        return fail("part without content-disposition");
    }

    if (callbacks_.on_part_begin) {
        auto r = callbacks_.on_part_begin(headers);
        if (r.is_err()) return abort_with(r.unwrap_err());
    }
    return Result<void>::ok();
}

std::optional<QByteArray> multipart_boundary(const QByteArray& content_type) {
    const auto parsed = parse_header_value(content_type);
    if (parsed.token != "multipart/form-data") {
        return std::nullopt;
    }
    const auto boundary = parsed.params.value("boundary");
    if (boundary.isEmpty() || boundary.size() > kMaxBoundaryLength) {
        return std::nullopt;
    }
    return boundary;
}

} // namespace airshare::http
