#include "server/http_connection.hpp"

#include "core/logging.hpp"

#include <QFile>
#include <QTcpSocket>

#include <string>
#include <utility>

namespace airshare::server {

int status_for_error(const Error& error) {
    switch (error.code) {
        case ErrorCode::Io:
        case ErrorCode::Generic:
            return 500;
        default:
            return 400;
    }
}

HttpConnection::HttpConnection(QTcpSocket* socket, RequestHandler handler, QObject* parent)
    : QObject(parent)
    , socket_(socket)
    , handler_(std::move(handler))
{
    socket_->setParent(this);

    connect(socket_, &QTcpSocket::readyRead, this, &HttpConnection::onReadyRead);
    connect(socket_, &QTcpSocket::bytesWritten, this, &HttpConnection::onBytesWritten);
    connect(socket_, &QTcpSocket::disconnected, this, &HttpConnection::onDisconnected);

    // Data may have arrived before the signals were connected.
    if (socket_->bytesAvailable() > 0) {
        QMetaObject::invokeMethod(this, &HttpConnection::onReadyRead, Qt::QueuedConnection);
    }
}

HttpConnection::~HttpConnection() = default;

QHostAddress HttpConnection::peer_address() const {
    return socket_->peerAddress();
}

void HttpConnection::onReadyRead() {
    const QByteArray incoming = socket_->readAll();

    switch (state_) {
        case State::ReadingHead:
            buffer_.append(incoming);
            break;
        case State::ReadingBody:
            dispatch_body(incoming);
            return;
        case State::Handling:
            buffer_.append(incoming);
            return;
        case State::Streaming:
        case State::Closing:
            return;
    }

    auto head = http::take_request_head(buffer_);
    if (head.is_err()) {
        qCDebug(airshareServerLog) << "Rejecting request from" << peer_address().toString() << ":"
                                   << head.unwrap_err().message.c_str();
        const bool too_large = buffer_.size() > http::MAX_HEAD_SIZE;
        respond(too_large ? 413 : 400, "text/plain; charset=utf-8",
                QByteArray::fromStdString(head.unwrap_err().message));
        return;
    }
    if (!head.unwrap()) {
        if (buffer_.size() > http::MAX_HEAD_SIZE) {
            respond(413, "text/plain; charset=utf-8", "request head too large");
        }
        return;
    }

    const http::HttpRequest request = std::move(*head.unwrap());
    qCDebug(airshareServerLog) << request.method << request.target << "from" << peer_address().toString();

    state_ = State::Handling;
    handler_(*this, request);
}

void HttpConnection::receive_body(qint64 length, BodyChunkHandler on_chunk, BodyDoneHandler on_done) {
    if (state_ != State::Handling) {
        return;
    }
    state_ = State::ReadingBody;
    body_remaining_ = length;
    on_chunk_ = std::move(on_chunk);
    on_done_ = std::move(on_done);

    // Whatever followed the head in the same read is the start of the body.
    const QByteArray pending = std::exchange(buffer_, QByteArray{});
    dispatch_body(pending);
}

void HttpConnection::dispatch_body(const QByteArray& bytes) {
    if (state_ != State::ReadingBody) {
        return;
    }

    if (!bytes.isEmpty() && body_remaining_ > 0) {
        const qint64 take = qMin<qint64>(bytes.size(), body_remaining_);
        body_remaining_ -= take;
        auto accepted = on_chunk_(take == bytes.size() ? bytes : bytes.left(take));
        if (accepted.is_err()) {
            on_chunk_ = {};
            on_done_ = {};
            respond_error(accepted.unwrap_err());
            return;
        }
    }

    if (body_remaining_ == 0) {
        auto done = std::move(on_done_);
        on_chunk_ = {};
        on_done_ = {};
        state_ = State::Handling;
        if (done) {
            done(*this);
        }
    }
}

void HttpConnection::respond(int status, const QByteArray& content_type, const QByteArray& body) {
    if (state_ == State::Streaming || state_ == State::Closing) {
        return;
    }

    http::HttpResponseHead head;
    head.status = status;
    head.set("Content-Type", content_type)
        .set("Content-Length", QByteArray::number(body.size()))
        .set("Connection", "close");

    socket_->write(head.serialize());
    socket_->write(body);
    close_after_write();
}

void HttpConnection::respond_error(const Error& error) {
    const int status = status_for_error(error);
    if (status >= 500) {
        qCWarning(airshareServerLog) << "Request from" << peer_address().toString()
                                     << "failed:" << error.message.c_str();
    }
    respond(status, "text/plain; charset=utf-8", QByteArray::fromStdString(error.message));
}

void HttpConnection::respond_file(http::HttpResponseHead head, const QString& path, qint64 size) {
    if (state_ == State::Streaming || state_ == State::Closing) {
        return;
    }

    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::ReadOnly)) {
        respond_error(Error{"cannot open " + path.toStdString() + ": " + file->errorString().toStdString(),
                            ErrorCode::Io});
        return;
    }

    if (file->size() != size) {
        respond_error(Error{path.toStdString() + " changed size since it was shared (" + std::to_string(size) +
                                " -> " + std::to_string(file->size()) + " bytes)",
                            ErrorCode::Io});
        return;
    }

    file_remaining_ = size;
    file_ = std::move(file);

    head.set("Content-Length", QByteArray::number(file_remaining_))
        .set("Connection", "close");
    socket_->write(head.serialize());

    state_ = State::Streaming;
    pump_file();
}

void HttpConnection::onBytesWritten(qint64) {
    if (state_ == State::Streaming) {
        pump_file();
    }
}

void HttpConnection::pump_file() {
    while (file_remaining_ > 0 && socket_->bytesToWrite() < WRITE_HIGH_WATER) {
        const QByteArray chunk = file_->read(qMin(CHUNK_SIZE, file_remaining_));
        if (chunk.isEmpty()) {
            // The file shrank or failed under us; the length already went out,
            // so all that is left is to drop the connection.
            qCWarning(airshareServerLog) << "Read failed while streaming" << file_->fileName() << ":"
                                         << file_->errorString();
            file_.reset();
            state_ = State::Closing;
            socket_->abort();
            return;
        }
        file_remaining_ -= chunk.size();
        socket_->write(chunk);
    }

    if (file_remaining_ == 0) {
        file_.reset();
        close_after_write();
    }
}

void HttpConnection::close_after_write() {
    state_ = State::Closing;
    // Pending output is flushed before the socket actually closes.
    socket_->disconnectFromHost();
}

void HttpConnection::onDisconnected() {
    if (state_ == State::Streaming) {
        qCDebug(airshareServerLog) << "Peer" << peer_address().toString() << "left during download";
    } else if (state_ == State::ReadingBody) {
        qCDebug(airshareServerLog) << "Peer" << peer_address().toString() << "left during upload";
    }
    state_ = State::Closing;
    file_.reset();
    on_chunk_ = {};
    on_done_ = {};
    emit closed();
    deleteLater();
}

} // namespace airshare::server
