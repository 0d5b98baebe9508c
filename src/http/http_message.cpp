#include "http/http_message.hpp"

#include <QList>

namespace airshare::http {
namespace {

Error malformed(const std::string& what) {
    return Error{"malformed request: " + what, ErrorCode::Protocol};
}

bool is_token_char(char c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= 'A' && c <= 'Z') return true;
    if (c >= '0' && c <= '9') return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool is_token(const QByteArray& s) {
    if (s.isEmpty()) return false;
    for (char c : s) {
        if (!is_token_char(c)) return false;
    }
    return true;
}

} // namespace

std::optional<QByteArray> HttpRequest::header(const QByteArray& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name) return value;
    }
    return std::nullopt;
}

std::optional<qint64> HttpRequest::content_length() const {
    auto value = header(QByteArrayLiteral("content-length"));
    if (!value) return std::nullopt;
    bool ok = false;
    const qint64 n = value->toLongLong(&ok);
    if (!ok || n < 0) return std::nullopt;
    return n;
}

Result<std::optional<HttpRequest>> take_request_head(QByteArray& buffer) {
    using R = Result<std::optional<HttpRequest>>;

    // Tolerate stray CRLFs between pipelined requests.
    qsizetype skip = 0;
    while (skip + 1 < buffer.size() && buffer[skip] == '\r' && buffer[skip + 1] == '\n') {
        skip += 2;
    }
    if (skip > 0) {
        buffer.remove(0, skip);
    }

    const auto end = buffer.indexOf("\r\n\r\n");
    if (end < 0) {
        return R::ok(std::nullopt);
    }
    if (end > MAX_HEAD_SIZE) {
        return R::err(malformed("head too large"));
    }

    const QByteArray head = buffer.left(end);
    const auto lines = head.split('\n');

    HttpRequest request;

    QByteArray request_line = lines.first();
    if (!request_line.endsWith('\r') && lines.size() > 1) {
        return R::err(malformed("bare LF in request line"));
    }
    request_line = request_line.trimmed();

    const auto parts = request_line.split(' ');
    if (parts.size() != 3) {
        return R::err(malformed("bad request line"));
    }
    request.method = parts[0];
    request.target = parts[1];
    request.version = parts[2];
    if (!is_token(request.method)) {
        return R::err(malformed("bad method"));
    }
    if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0") {
        return R::err(malformed("unsupported version " + request.version.toStdString()));
    }
    if (!request.target.startsWith('/')) {
        return R::err(malformed("bad target"));
    }

    const auto query = request.target.indexOf('?');
    request.path = query < 0 ? request.target : request.target.left(query);

    for (qsizetype i = 1; i < lines.size(); ++i) {
        QByteArray line = lines[i];
        if (line.endsWith('\r')) {
            line.chop(1);
        } else if (i + 1 < lines.size()) {
            return R::err(malformed("bare LF in headers"));
        }
        if (line.isEmpty()) continue;
        if (line.startsWith(' ') || line.startsWith('\t')) {
            return R::err(malformed("folded header"));
        }
        const auto colon = line.indexOf(':');
        if (colon <= 0) {
            return R::err(malformed("header without name"));
        }
        const QByteArray name = line.left(colon).toLower();
        if (!is_token(name)) {
            return R::err(malformed("bad header name"));
        }
        request.headers.emplace_back(name, line.mid(colon + 1).trimmed());
    }

    // Conflicting or unparsable Content-Length values are a framing error.
    std::optional<QByteArray> length;
    for (const auto& [key, value] : request.headers) {
        if (key != "content-length") continue;
        bool ok = false;
        const qint64 n = value.toLongLong(&ok);
        if (!ok || n < 0) {
            return R::err(malformed("bad content-length"));
        }
        if (length && *length != value) {
            return R::err(malformed("conflicting content-length"));
        }
        length = value;
    }

    buffer.remove(0, end + 4);
    return R::ok(std::move(request));
}

HttpResponseHead& HttpResponseHead::set(QByteArray name, QByteArray value) {
    for (auto& [key, v] : headers) {
        if (key.compare(name, Qt::CaseInsensitive) == 0) {
            v = std::move(value);
            return *this;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
    return *this;
}

QByteArray HttpResponseHead::serialize() const {
    QByteArray out;
    out += "HTTP/1.1 ";
    out += QByteArray::number(status);
    out += ' ';
    out += reason_phrase(status);
    out += "\r\n";
    for (const auto& [key, value] : headers) {
        out += key;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "\r\n";
    return out;
}

QByteArray reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default: return "Unknown";
    }
}

QByteArray content_disposition_attachment(const QString& file_name, quint64 size) {
    return "attachment; filename=" + file_name.toUtf8() + "; size=" + QByteArray::number(size);
}

HeaderValue parse_header_value(const QByteArray& value) {
    HeaderValue out;

    qsizetype pos = value.indexOf(';');
    out.token = (pos < 0 ? value : value.left(pos)).trimmed().toLower();
    if (pos < 0) {
        return out;
    }

    ++pos;
    const qsizetype n = value.size();
    while (pos < n) {
        while (pos < n && (value[pos] == ' ' || value[pos] == '\t' || value[pos] == ';')) ++pos;
        if (pos >= n) break;

        const qsizetype eq = value.indexOf('=', pos);
        const qsizetype semi = value.indexOf(';', pos);
        if (eq < 0 || (semi >= 0 && semi < eq)) {
            // Parameter without a value; skip it.
            pos = semi < 0 ? n : semi + 1;
            continue;
        }

        const QByteArray name = value.mid(pos, eq - pos).trimmed().toLower();
        pos = eq + 1;
        while (pos < n && (value[pos] == ' ' || value[pos] == '\t')) ++pos;

        QByteArray param;
        if (pos < n && value[pos] == '"') {
            ++pos;
            while (pos < n && value[pos] != '"') {
                if (value[pos] == '\\' && pos + 1 < n) ++pos;
                param += value[pos];
                ++pos;
            }
            ++pos;  // closing quote
            const qsizetype next = value.indexOf(';', pos);
            pos = next < 0 ? n : next + 1;
        } else {
            const qsizetype next = value.indexOf(';', pos);
            param = (next < 0 ? value.mid(pos) : value.mid(pos, next - pos)).trimmed();
            pos = next < 0 ? n : next + 1;
        }

        if (!name.isEmpty() && !out.params.contains(name)) {
            out.params.insert(name, param);
        }
    }
    return out;
}

QString safe_file_name(const QString& submitted) {
    QString name = submitted;
    const auto slash = qMax(name.lastIndexOf(QLatin1Char('/')), name.lastIndexOf(QLatin1Char('\\')));
    if (slash >= 0) {
        name = name.mid(slash + 1);
    }
    name = name.trimmed();
    name.remove(QChar(0));
    if (name == QLatin1String(".") || name == QLatin1String("..")) {
        return {};
    }
    return name;
}

} // namespace airshare::http
