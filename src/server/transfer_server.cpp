#include "server/transfer_server.hpp"

#include "content/packager.hpp"
#include "content/zip_archive.hpp"
#include "core/logging.hpp"
#include "http/multipart.hpp"
#include "network/local_address.hpp"
#include "server/http_connection.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTcpServer>
#include <QTcpSocket>

namespace airshare::server {

namespace {

constexpr const char* kTextPlain = "text/plain; charset=utf-8";
constexpr const char* kTextHtml = "text/html; charset=utf-8";
constexpr const char* kUploadField = "upload_file";

QByteArray identifier_body(Role role) {
    const auto id = role_identifier(role);
    return QByteArray(id.data(), static_cast<qsizetype>(id.size()));
}

QByteArray download_page(const FilePayload& file) {
    const QString label = QStringLiteral("Download %1 (%2)")
                              .arg(file.display_name, content::human_readable_size(file.size_bytes))
                              .toHtmlEscaped();
    return QStringLiteral(
               "<!DOCTYPE html>\n"
               "<html lang=\"en\">\n"
               "<head>\n"
               "<meta charset=\"UTF-8\">\n"
               "<title>Airshare Download</title>\n"
               "</head>\n"
               "<body>\n"
               "<form action=\"/download\" method=\"get\">\n"
               "    <input type=\"submit\" value=\"%1\"/>\n"
               "</form>\n"
               "</body>\n"
               "</html>\n")
        .arg(label)
        .toUtf8();
}

QByteArray upload_page() {
    return QByteArrayLiteral(
        "<!DOCTYPE html>\n"
        "<html lang=\"en\">\n"
        "<head>\n"
        "<meta charset=\"UTF-8\">\n"
        "<title>Airshare Upload</title>\n"
        "</head>\n"
        "<body>\n"
        "<form action=\"/upload\" method=\"post\" enctype=\"multipart/form-data\">\n"
        "    <input type=\"file\" name=\"upload_file\"/>\n"
        "    <input type=\"submit\" value=\"Upload\"/>\n"
        "</form>\n"
        "</body>\n"
        "</html>\n");
}

// Receiving side of one POST /upload: the file part streams straight to disk.
struct UploadState {
    QString upload_dir;
    std::unique_ptr<http::MultipartParser> parser;
    QFile file;
    bool writing = false;
    QString saved_path;

    Result<void> begin_part(const http::PartHeaders& headers) {
        if (headers.field_name != kUploadField || !headers.file_name || !saved_path.isEmpty()) {
            return Result<void>::ok();  // other form fields are ignored
        }
        const QString name = http::safe_file_name(*headers.file_name);
        if (name.isEmpty()) {
            return Result<void>::err(Error{"upload has no usable file name", ErrorCode::InvalidInput});
        }
        file.setFileName(QDir(upload_dir).filePath(name));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return Result<void>::err(Error{"cannot write " + file.fileName().toStdString() + ": " +
                                              file.errorString().toStdString(),
                                          ErrorCode::Io});
        }
        writing = true;
        return Result<void>::ok();
    }

    Result<void> part_data(const char* data, qint64 size) {
        if (!writing) {
            return Result<void>::ok();
        }
        if (file.write(data, size) != size) {
            return Result<void>::err(Error{"write to " + file.fileName().toStdString() + " failed: " +
                                              file.errorString().toStdString(),
                                          ErrorCode::Io});
        }
        return Result<void>::ok();
    }

    Result<void> end_part() {
        if (!writing) {
            return Result<void>::ok();
        }
        writing = false;
        if (!file.flush()) {
            return Result<void>::err(Error{"write to " + file.fileName().toStdString() + " failed: " +
                                              file.errorString().toStdString(),
                                          ErrorCode::Io});
        }
        file.close();
        saved_path = file.fileName();
        return Result<void>::ok();
    }
};

} // namespace

// ============================================================================
// Configuration
// ============================================================================

ServerConfig ServerConfig::for_session(QString code, content::ShareSession session, uint16_t port) {
    ServerConfig config;
    config.code = std::move(code);
    config.role = session.sender_role();
    config.session = std::move(session);
    config.port = port;
    return config;
}

ServerConfig ServerConfig::for_upload(QString code, QString upload_dir, uint16_t port) {
    ServerConfig config;
    config.code = std::move(code);
    config.role = Role::UploadReceiver;
    config.upload_dir = std::move(upload_dir);
    config.port = port;
    return config;
}

Result<void> validate_config(const ServerConfig& config) {
    auto name_ok = network::validate_instance_name(config.code);
    if (name_ok.is_err()) {
        return name_ok;
    }
    if (config.port == 0) {
        return Result<void>::err(Error{"port must be non-zero", ErrorCode::InvalidInput});
    }
    if (config.advertise_address &&
        config.advertise_address->protocol() != QAbstractSocket::IPv4Protocol) {
        return Result<void>::err(Error{"advertised address must be IPv4: " +
                                           config.advertise_address->toString().toStdString(),
                                       ErrorCode::InvalidInput});
    }

    switch (config.role) {
        case Role::TextSender:
        case Role::FileSender:
            if (!config.session || config.session->sender_role() != config.role) {
                return Result<void>::err(Error{"a " + std::string(role_identifier(config.role)) +
                                                   " needs matching content",
                                               ErrorCode::InvalidInput});
            }
            break;
        case Role::UploadReceiver:
            if (config.upload_dir.isEmpty()) {
                return Result<void>::err(Error{"an Upload Receiver needs an upload directory",
                                               ErrorCode::InvalidInput});
            }
            break;
    }
    return Result<void>::ok();
}

Result<ServerConfig> make_send_config(const QString& code,
                                      const QString& text,
                                      const QStringList& paths,
                                      bool compress,
                                      uint16_t port) {
    if (!text.isEmpty()) {
        return Result<ServerConfig>::ok(ServerConfig::for_session(code, content::ShareSession::from_text(text), port));
    }
    if (paths.isEmpty()) {
        return Result<ServerConfig>::err(
            Error{"either text or files must be given and non-empty", ErrorCode::InvalidInput});
    }

    auto prepared = content::prepare(paths, compress);
    if (prepared.is_err()) {
        return Result<ServerConfig>::err(prepared.unwrap_err());
    }
    auto artifact = std::make_shared<const content::PreparedArtifact>(std::move(prepared).unwrap());
    auto session = content::ShareSession::from_artifact(std::move(artifact));
    if (session.is_err()) {
        return Result<ServerConfig>::err(session.unwrap_err());
    }
    return Result<ServerConfig>::ok(ServerConfig::for_session(code, std::move(session).unwrap(), port));
}

QString display_url(const QString& host, uint16_t port) {
    QString url = QStringLiteral("http://") + host;
    if (port != DEFAULT_PORT) {
        url += QStringLiteral(":%1").arg(port);
    }
    return url;
}

QString startup_banner(const ServerConfig& config, const ServiceRecord& record) {
    const QString port_suffix =
        record.port == DEFAULT_PORT ? QString() : QStringLiteral(":%1").arg(record.port);
    const QString where = QStringLiteral("available at %1%2 and `%3`")
                              .arg(record.address.toString(), port_suffix,
                                   display_url(network::instance_host_name(record.name), record.port));

    if (!config.session) {
        return QStringLiteral("Upload Receiver `%1` ").arg(record.name) + where;
    }
    if (const auto* text = config.session->text()) {
        return QStringLiteral("`%1` ").arg(text->body) + where;
    }
    const auto* file = config.session->file();
    return QStringLiteral("`%1` (%2) ").arg(file->display_name, content::human_readable_size(file->size_bytes)) +
           where;
}

// ============================================================================
// TransferServer
// ============================================================================

TransferServer::TransferServer(ServerConfig config,
                               std::unique_ptr<network::DiscoveryBackend> backend,
                               std::chrono::milliseconds lookup_timeout,
                               QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , registry_(std::move(backend), lookup_timeout)
{
    register_routes();
}

TransferServer::~TransferServer() {
    stop();
}

bool TransferServer::is_running() const {
    return listener_ && listener_->isListening();
}

Result<ServiceRecord> TransferServer::start() {
    using R = Result<ServiceRecord>;

    if (is_running()) {
        return R::err(Error{"server already running", ErrorCode::InvalidInput});
    }
    auto valid = validate_config(config_);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }

    if (config_.role == Role::UploadReceiver && !QDir().mkpath(config_.upload_dir)) {
        return R::err(Error{"cannot create upload directory " + config_.upload_dir.toStdString(),
                            ErrorCode::Io});
    }

    auto init = registry_.init();
    if (init.is_err()) {
        return R::err(init.unwrap_err());
    }

    const QHostAddress address = config_.advertise_address.value_or(network::local_ipv4_address());
    auto registered = registry_.register_service(config_.code, address, config_.port);
    if (registered.is_err()) {
        return registered;
    }
    ServiceRecord record = std::move(registered).unwrap();

    listener_ = std::make_unique<QTcpServer>();
    connect(listener_.get(), &QTcpServer::newConnection, this, &TransferServer::onNewConnection);
    if (!listener_->listen(QHostAddress::AnyIPv4, config_.port)) {
        const auto reason = listener_->errorString().toStdString();
        listener_.reset();
        registry_.unregister_service(config_.code);
        return R::err(Error{"cannot listen on port " + std::to_string(config_.port) + ": " + reason,
                            ErrorCode::Network});
    }

    record_ = record;
    qCInfo(airshareServerLog).noquote() << startup_banner(config_, record);
    return R::ok(std::move(record));
}

void TransferServer::stop() {
    if (listener_) {
        listener_->close();
        listener_.reset();
    }
    const auto connections = findChildren<HttpConnection*>(QString(), Qt::FindDirectChildrenOnly);
    for (auto* connection : connections) {
        delete connection;
    }
    if (record_) {
        registry_.unregister_service(record_->name);
        qCInfo(airshareServerLog) << "Stopped sharing" << record_->name;
        record_.reset();
    }
    registry_.shutdown();
}

void TransferServer::onNewConnection() {
    while (listener_ && listener_->hasPendingConnections()) {
        QTcpSocket* socket = listener_->nextPendingConnection();
        new HttpConnection(
            socket,
            [this](HttpConnection& connection, const http::HttpRequest& request) {
                handle_request(connection, request);
            },
            this);
    }
}

// ============================================================================
// Routing
// ============================================================================

void TransferServer::register_routes() {
    routes_.emplace("/airshare", Route{"GET", [role = config_.role](HttpConnection& c, const http::HttpRequest&) {
                        c.respond(200, kTextPlain, identifier_body(role));
                    }});

    switch (config_.role) {
        case Role::TextSender:
            routes_.emplace("/", Route{"GET", [this](HttpConnection& c, const http::HttpRequest&) {
                                serve_text(c);
                            }});
            break;
        case Role::FileSender:
            routes_.emplace("/", Route{"GET", [this](HttpConnection& c, const http::HttpRequest&) {
                                serve_download_page(c);
                            }});
            routes_.emplace("/download", Route{"GET", [this](HttpConnection& c, const http::HttpRequest&) {
                                serve_download(c);
                            }});
            break;
        case Role::UploadReceiver:
            routes_.emplace("/", Route{"GET", [this](HttpConnection& c, const http::HttpRequest&) {
                                serve_upload_page(c);
                            }});
            routes_.emplace("/upload", Route{"POST", [this](HttpConnection& c, const http::HttpRequest& r) {
                                receive_upload(c, r);
                            }});
            break;
    }
}

void TransferServer::handle_request(HttpConnection& connection, const http::HttpRequest& request) {
    const auto it = routes_.find(request.path);
    if (it == routes_.end()) {
        connection.respond(404, kTextPlain, "Not Found");
        return;
    }
    if (request.method != it->second.method) {
        connection.respond(405, kTextPlain, "Method Not Allowed");
        return;
    }
    it->second.handler(connection, request);
}

void TransferServer::note_content_requested(const HttpConnection& connection) {
    const QHostAddress peer = connection.peer_address();
    const QString by = peer.isNull() ? QString() : QStringLiteral(" (by %1)").arg(peer.toString());
    qCInfo(airshareServerLog).noquote() << QStringLiteral("Content requested%1, transferred!").arg(by);

    QMetaObject::invokeMethod(this, [this, peer] { emit contentRequested(peer); }, Qt::QueuedConnection);
}

// ============================================================================
// Handlers
// ============================================================================

void TransferServer::serve_text(HttpConnection& connection) {
    note_content_requested(connection);
    connection.respond(200, kTextPlain, config_.session->text()->body.toUtf8());
}

void TransferServer::serve_download_page(HttpConnection& connection) {
    note_content_requested(connection);
    connection.respond(200, kTextHtml, download_page(*config_.session->file()));
}

void TransferServer::serve_download(HttpConnection& connection) {
    const FilePayload& file = *config_.session->file();
    note_content_requested(connection);

    http::HttpResponseHead head;
    head.status = 200;
    head.set("Content-Type", file.mime_type.toUtf8())
        .set("Content-Disposition", http::content_disposition_attachment(file.display_name, file.size_bytes));
    connection.respond_file(std::move(head), file.path, static_cast<qint64>(file.size_bytes));
}

void TransferServer::serve_upload_page(HttpConnection& connection) {
    connection.respond(200, kTextHtml, upload_page());
}

void TransferServer::receive_upload(HttpConnection& connection, const http::HttpRequest& request) {
    const auto length = request.content_length();
    if (!length) {
        connection.respond(411, kTextPlain, "Length Required");
        return;
    }
    const auto boundary = http::multipart_boundary(request.header("content-type").value_or(QByteArray()));
    if (!boundary) {
        connection.respond(400, kTextPlain, "expected a multipart/form-data body");
        return;
    }

    auto state = std::make_shared<UploadState>();
    state->upload_dir = config_.upload_dir;
    UploadState* raw = state.get();
    state->parser = std::make_unique<http::MultipartParser>(
        *boundary,
        http::MultipartParser::Callbacks{
            [raw](const http::PartHeaders& headers) { return raw->begin_part(headers); },
            [raw](const char* data, qint64 size) { return raw->part_data(data, size); },
            [raw]() { return raw->end_part(); },
        });

    connection.receive_body(
        *length,
        [state](const QByteArray& chunk) { return state->parser->feed(chunk); },
        [this, state](HttpConnection& c) {
            if (!state->parser->finished()) {
                c.respond(400, kTextPlain, "truncated multipart body");
                return;
            }
            if (state->saved_path.isEmpty()) {
                c.respond(400, kTextPlain, "missing `upload_file` field");
                return;
            }

            const QString name = QFileInfo(state->saved_path).fileName();
            qCInfo(airshareServerLog).noquote()
                << QStringLiteral("Received `%1` (by %2)").arg(name, c.peer_address().toString());

            if (config_.decompress && name.endsWith(QLatin1String(".zip"), Qt::CaseInsensitive)) {
                auto extracted = content::extract_zip(state->saved_path, config_.upload_dir);
                if (extracted.is_err()) {
                    c.respond_error(extracted.unwrap_err());
                    return;
                }
                if (!QFile::remove(state->saved_path)) {
                    qCWarning(airshareServerLog) << "Cannot remove" << state->saved_path;
                }
                for (const auto& path : extracted.unwrap()) {
                    emit uploadReceived(path);
                }
            } else {
                emit uploadReceived(state->saved_path);
            }
            c.respond(200, kTextPlain, QStringLiteral("Uploaded `%1`").arg(name).toUtf8());
        });
}

} // namespace airshare::server
