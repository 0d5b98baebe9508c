#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHash>
#include <QString>

#include <optional>
#include <utility>
#include <vector>

namespace airshare::http {

inline constexpr int MAX_HEAD_SIZE = 16 * 1024;

using HeaderList = std::vector<std::pair<QByteArray, QByteArray>>;

struct HttpRequest {
    QByteArray method;
    QByteArray target;
    QByteArray path;  // target without query string
    QByteArray version;
    HeaderList headers;  // names lower-cased, in arrival order

    /**
     * First header with the given (lower-case) name.
     */
    [[nodiscard]] std::optional<QByteArray> header(const QByteArray& name) const;

    /**
     * Declared body length; nullopt when the request carries no Content-Length.
     */
    [[nodiscard]] std::optional<qint64> content_length() const;
};

/**
 * Take one request head (request line + headers + blank line) off the front
 * of `buffer`. Returns nullopt while the head is incomplete; bytes after the
 * head stay in `buffer`. Malformed heads fail with ErrorCode::Protocol.
 */
[[nodiscard]] Result<std::optional<HttpRequest>> take_request_head(QByteArray& buffer);

struct HttpResponseHead {
    int status = 200;
    HeaderList headers;

    HttpResponseHead& set(QByteArray name, QByteArray value);

    [[nodiscard]] QByteArray serialize() const;
};

[[nodiscard]] QByteArray reason_phrase(int status);

/**
 * `attachment; filename=<name>; size=<bytes>`
 */
[[nodiscard]] QByteArray content_disposition_attachment(const QString& file_name, quint64 size);

/**
 * A structured header value: `form-data; name="x"; filename="a.txt"` splits
 * into the token "form-data" and parameters {name: x, filename: a.txt}.
 * Parameter names are lower-cased; quoted values are unquoted.
 */
struct HeaderValue {
    QByteArray token;
    QHash<QByteArray, QByteArray> params;
};

[[nodiscard]] HeaderValue parse_header_value(const QByteArray& value);

/**
 * Reduce a client-submitted file name to a plain base name. Empty when nothing
 * usable remains (e.g. "..", "/", "").
 */
[[nodiscard]] QString safe_file_name(const QString& submitted);

} // namespace airshare::http
