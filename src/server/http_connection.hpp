#pragma once

#include "core/result.hpp"
#include "http/http_message.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QObject>

#include <functional>
#include <memory>

class QFile;
class QTcpSocket;

namespace airshare::server {

/**
 * HttpConnection - One accepted HTTP/1.1 connection.
 *
 * Reads exactly one request head, hands it to the request handler and closes
 * the connection after the response (every response says `Connection: close`).
 * The handler answers with respond() / respond_file(), or asks for the request
 * body with receive_body() and answers from its completion callback.
 *
 * Deletes itself once the socket has disconnected.
 */
class HttpConnection : public QObject {
    Q_OBJECT

public:
    using RequestHandler = std::function<void(HttpConnection&, const http::HttpRequest&)>;
    using BodyChunkHandler = std::function<Result<void>(const QByteArray&)>;
    using BodyDoneHandler = std::function<void(HttpConnection&)>;

    /**
     * Body bytes are sent in blocks of this size; the next block is queued
     * only once fewer than WRITE_HIGH_WATER bytes are still pending.
     */
    static constexpr qint64 CHUNK_SIZE = 8 * 1024;
    static constexpr qint64 WRITE_HIGH_WATER = 4 * CHUNK_SIZE;

    HttpConnection(QTcpSocket* socket, RequestHandler handler, QObject* parent = nullptr);
    ~HttpConnection() override;

    void respond(int status, const QByteArray& content_type, const QByteArray& body);

    /**
     * Stream `path` as the response body. `head` must already carry the
     * content headers; Content-Length is `size`. A file whose size on disk is
     * no longer `size` is answered with 500 instead.
     */
    void respond_file(http::HttpResponseHead head, const QString& path, qint64 size);

    /**
     * Answer with the status matching an error's code and its message as body.
     */
    void respond_error(const Error& error);

    /**
     * Deliver the next `length` body bytes to `on_chunk` as they arrive, then
     * call `on_done`. A failing chunk handler ends the exchange with
     * respond_error().
     */
    void receive_body(qint64 length, BodyChunkHandler on_chunk, BodyDoneHandler on_done);

    [[nodiscard]] QHostAddress peer_address() const;

signals:
    void closed();

private slots:
    void onReadyRead();
    void onBytesWritten(qint64 bytes);
    void onDisconnected();

private:
    enum class State {
        ReadingHead,
        Handling,
        ReadingBody,
        Streaming,
        Closing,
    };

    void dispatch_body(const QByteArray& bytes);
    void pump_file();
    void close_after_write();

    QTcpSocket* socket_;
    RequestHandler handler_;
    State state_ = State::ReadingHead;
    QByteArray buffer_;

    qint64 body_remaining_ = 0;
    BodyChunkHandler on_chunk_;
    BodyDoneHandler on_done_;

    std::unique_ptr<QFile> file_;
    qint64 file_remaining_ = 0;
};

/**
 * HTTP status for a failure: 400 for malformed input, 500 for local I/O.
 */
[[nodiscard]] int status_for_error(const Error& error);

} // namespace airshare::server
