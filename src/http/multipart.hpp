#pragma once

#include "core/result.hpp"
#include "http/http_message.hpp"

#include <QByteArray>
#include <QString>

#include <functional>
#include <optional>

namespace airshare::http {

/**
 * Headers of one multipart/form-data part.
 */
struct PartHeaders {
    QByteArray field_name;
    std::optional<QString> file_name;  // present for file fields
    QByteArray content_type;
};

/**
 * MultipartParser - Incremental multipart/form-data decoder.
 *
 * Bytes are pushed in arbitrary slices with feed(); part bodies are handed to
 * the callbacks as soon as they can no longer be the start of a boundary, so
 * memory use is bounded by the boundary length plus one slice. A callback that
 * returns an error aborts parsing with that error.
 */
class MultipartParser {
public:
    struct Callbacks {
        std::function<Result<void>(const PartHeaders&)> on_part_begin;
        std::function<Result<void>(const char* data, qint64 size)> on_part_data;
        std::function<Result<void>()> on_part_end;
    };

    MultipartParser(QByteArray boundary, Callbacks callbacks);

    Result<void> feed(const QByteArray& chunk);

    /**
     * True once the closing boundary has been seen.
     */
    [[nodiscard]] bool finished() const { return state_ == State::Done; }

private:
    enum class State {
        Preamble,
        AfterBoundary,
        Headers,
        Body,
        Done,
        Failed,
    };

    Result<void> fail(const std::string& why);
    Result<void> abort_with(Error error);
    Result<void> parse_part_headers(const QByteArray& block);

    QByteArray delimiter_;  // "\r\n--" + boundary
    Callbacks callbacks_;
    QByteArray buffer_;
    State state_ = State::Preamble;
};

/**
 * Boundary parameter of a `multipart/form-data` Content-Type, or nullopt.
 */
[[nodiscard]] std::optional<QByteArray> multipart_boundary(const QByteArray& content_type);

} // namespace airshare::http
