#include "client/transfer_client.hpp"

#include "content/packager.hpp"
#include "content/share_session.hpp"
#include "core/logging.hpp"
#include "http/http_message.hpp"

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QHttpMultiPart>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <optional>

namespace airshare::client {

namespace {

constexpr const char* kFallbackFileName = "airshare-download";

std::string host_label(const QString& code) {
    return "`" + network::instance_host_name(code).toStdString() + "`";
}

Error http_status_error(QNetworkReply* reply, const QByteArray& body) {
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    return Error{reply->url().toString().toStdString() + " answered " + std::to_string(status) + ": " +
                     body.left(200).toStdString(),
                 ErrorCode::Protocol};
}

} // namespace

QString disposition_file_name(const QByteArray& header) {
    const auto value = http::parse_header_value(header);
    if (value.token != "attachment" && value.token != "inline") {
        return {};
    }
    return http::safe_file_name(QString::fromUtf8(value.params.value("filename")));
}

TransferClient::TransferClient(network::ServiceRegistry& registry, ClientOptions options)
    : registry_(registry)
    , options_(std::move(options))
    , network_(std::make_unique<QNetworkAccessManager>())
{
    // Peers are on the local link; a configured proxy would only get in the way.
    network_->setProxy(QNetworkProxy::NoProxy);
}

TransferClient::~TransferClient() = default;

QNetworkRequest TransferClient::make_request(const QUrl& url) const {
    QNetworkRequest request(url);
    request.setTransferTimeout(static_cast<int>(options_.transfer_timeout.count()));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    return request;
}

Result<void> TransferClient::wait_for(QNetworkReply* reply) {
    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }
    if (reply->error() != QNetworkReply::NoError &&
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isNull()) {
        return Result<void>::err(Error{reply->url().toString().toStdString() + ": " +
                                           reply->errorString().toStdString(),
                                       ErrorCode::Network});
    }
    return Result<void>::ok();
}

Result<QByteArray> TransferClient::get(const QUrl& url) {
    std::unique_ptr<QNetworkReply> reply(network_->get(make_request(url)));
    auto done = wait_for(reply.get());
    if (done.is_err()) {
        return Result<QByteArray>::err(done.unwrap_err());
    }
    const QByteArray body = reply->readAll();
    if (reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() != 200) {
        return Result<QByteArray>::err(http_status_error(reply.get(), body));
    }
    return Result<QByteArray>::ok(body);
}

Result<ServiceRecord> TransferClient::resolve(const QString& code) {
    auto found = registry_.lookup(code);
    if (found.is_err()) {
        return Result<ServiceRecord>::err(found.unwrap_err());
    }
    if (!found.unwrap()) {
        return Result<ServiceRecord>::err(
            Error{"The airshare " + host_label(code) + " does not exist!", ErrorCode::ServiceNotFound});
    }
    return Result<ServiceRecord>::ok(*std::move(found).unwrap());
}

Result<Role> TransferClient::query_role(const ServiceRecord& record) {
    const TransferRequest target{record.name, record.address, record.port, Role::UploadReceiver};
    std::unique_ptr<QNetworkReply> reply(network_->get(make_request(target.url(QStringLiteral("/airshare")))));
    auto done = wait_for(reply.get());
    if (done.is_err()) {
        return Result<Role>::err(done.unwrap_err());
    }

    // Anything that speaks HTTP but not the role route is some other service.
    std::optional<Role> role;
    if (reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() == 200) {
        const QByteArray text = reply->readAll();
        role = role_from_identifier(std::string_view(text.constData(), static_cast<size_t>(text.size())));
    }
    if (!role) {
        return Result<Role>::err(
            Error{"The airshare " + host_label(record.name) + " is not an airshare service!", ErrorCode::RoleMismatch});
    }
    return Result<Role>::ok(*role);
}

Result<TransferRequest> TransferClient::identify(const QString& code) {
    auto record = resolve(code);
    if (record.is_err()) {
        return Result<TransferRequest>::err(record.unwrap_err());
    }
    const ServiceRecord& found = record.unwrap();
    auto role = query_role(found);
    if (role.is_err()) {
        return Result<TransferRequest>::err(role.unwrap_err());
    }
    qCDebug(airshareClientLog) << code << "is a" << role_identifier(role.unwrap()).data() << "at"
                               << found.address.toString() << found.port;
    return Result<TransferRequest>::ok(TransferRequest{found.name, found.address, found.port, role.unwrap()});
}

// ============================================================================
// Upload
// ============================================================================

Result<QString> TransferClient::send(const QString& code, const QStringList& paths, bool compress) {
    auto valid = content::validate_inputs(paths);
    if (valid.is_err()) {
        return Result<QString>::err(valid.unwrap_err());
    }

    auto target = identify(code);
    if (target.is_err()) {
        return Result<QString>::err(target.unwrap_err());
    }
    if (target.unwrap().expected_role != Role::UploadReceiver) {
        return Result<QString>::err(
            Error{"The airshare " + host_label(code) + " is not an upload receiver!", ErrorCode::RoleMismatch});
    }

    // Any temporary archive is deleted when `artifact` goes out of scope.
    auto artifact = content::prepare(paths, compress);
    if (artifact.is_err()) {
        return Result<QString>::err(artifact.unwrap_err());
    }
    const content::PreparedArtifact& prepared = artifact.unwrap();

    auto sent = upload(target.unwrap(), prepared.path(), prepared.display_name());
    if (sent.is_err()) {
        return Result<QString>::err(sent.unwrap_err());
    }
    qCInfo(airshareClientLog).noquote()
        << QStringLiteral("Uploaded `%1` to airshare `%2`!").arg(prepared.display_name(),
                                                                network::instance_host_name(code));
    return Result<QString>::ok(prepared.display_name());
}

Result<void> TransferClient::upload(const TransferRequest& target, const QString& path, const QString& name) {
    auto* multipart = new QHttpMultiPart(QHttpMultiPart::FormDataType);

    auto* file = new QFile(path, multipart);
    if (!file->open(QIODevice::ReadOnly)) {
        const auto reason = file->errorString().toStdString();
        delete multipart;
        return Result<void>::err(Error{"cannot read " + path.toStdString() + ": " + reason, ErrorCode::Io});
    }

    QString quoted = name;
    quoted.replace(QLatin1Char('"'), QLatin1String("\\\""));

    QHttpPart part;
    part.setHeader(QNetworkRequest::ContentDispositionHeader,
                   QStringLiteral("form-data; name=\"upload_file\"; filename=\"%1\"").arg(quoted));
    part.setHeader(QNetworkRequest::ContentTypeHeader, content::sniff_mime_type(path));
    part.setBodyDevice(file);
    multipart->append(part);

    std::unique_ptr<QNetworkReply> reply(network_->post(make_request(target.url(QStringLiteral("/upload"))), multipart));
    multipart->setParent(reply.get());

    auto done = wait_for(reply.get());
    if (done.is_err()) {
        return done;
    }
    const QByteArray body = reply->readAll();
    if (reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() != 200) {
        return Result<void>::err(http_status_error(reply.get(), body));
    }
    return Result<void>::ok();
}

// ============================================================================
// Fetch
// ============================================================================

Result<FetchResult> TransferClient::fetch(const QString& code) {
    auto target = identify(code);
    if (target.is_err()) {
        return Result<FetchResult>::err(target.unwrap_err());
    }
    const TransferRequest& request = target.unwrap();

    switch (request.expected_role) {
        case Role::TextSender: {
            auto body = get(request.url(QStringLiteral("/")));
            if (body.is_err()) {
                return Result<FetchResult>::err(body.unwrap_err());
            }
            FetchResult result;
            result.role = Role::TextSender;
            result.text = QString::fromUtf8(body.unwrap());
            result.size_bytes = static_cast<quint64>(body.unwrap().size());
            return Result<FetchResult>::ok(std::move(result));
        }
        case Role::FileSender:
            return download(request);
        case Role::UploadReceiver:
            break;
    }
    return Result<FetchResult>::err(
        Error{"The airshare " + host_label(code) + " is an upload receiver, nothing to fetch!", ErrorCode::RoleMismatch});
}

Result<FetchResult> TransferClient::download(const TransferRequest& target) {
    using R = Result<FetchResult>;

    std::unique_ptr<QNetworkReply> reply(network_->get(make_request(target.url(QStringLiteral("/download")))));

    std::unique_ptr<QFile> file;
    std::optional<Error> failure;
    quint64 written = 0;

    auto open_target = [&]() -> bool {
        if (file || failure) {
            return static_cast<bool>(file);
        }
        if (reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() != 200) {
            return false;
        }
        QString name = disposition_file_name(reply->rawHeader("content-disposition"));
        if (name.isEmpty()) {
            name = QString::fromLatin1(kFallbackFileName);
        }
        const QDir dir(options_.download_dir.isEmpty() ? QDir::currentPath() : options_.download_dir);
        if (!dir.mkpath(QStringLiteral("."))) {
            failure = Error{"cannot create " + dir.path().toStdString(), ErrorCode::Io};
            return false;
        }
        file = std::make_unique<QFile>(dir.filePath(name));
        if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            failure = Error{"cannot write " + file->fileName().toStdString() + ": " + file->errorString().toStdString(),
                            ErrorCode::Io};
            file.reset();
            return false;
        }
        return true;
    };

    auto drain = [&]() {
        if (!open_target()) {
            return;
        }
        const QByteArray chunk = reply->readAll();
        if (file->write(chunk) != chunk.size()) {
            failure = Error{"write to " + file->fileName().toStdString() + " failed: " +
                                file->errorString().toStdString(),
                            ErrorCode::Io};
            reply->abort();
            return;
        }
        written += static_cast<quint64>(chunk.size());
    };

    QObject::connect(reply.get(), &QNetworkReply::readyRead, reply.get(), drain);

    auto done = wait_for(reply.get());
    if (failure) {
        return R::err(*failure);
    }
    if (done.is_err()) {
        return R::err(done.unwrap_err());
    }
    if (reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() != 200) {
        return R::err(http_status_error(reply.get(), reply->readAll()));
    }
    drain();
    if (failure) {
        return R::err(*failure);
    }
    if (!file) {
        return R::err(Error{"download produced no file", ErrorCode::Io});
    }
    file->close();

    const auto declared = reply->header(QNetworkRequest::ContentLengthHeader);
    if (declared.isValid() && declared.toULongLong() != written) {
        return R::err(Error{"download of " + file->fileName().toStdString() + " ended after " +
                                std::to_string(written) + " of " + std::to_string(declared.toULongLong()) + " bytes",
                            ErrorCode::Network});
    }

    qCInfo(airshareClientLog).noquote() << QStringLiteral("Downloaded `%1` (%2)")
                                               .arg(file->fileName(), content::human_readable_size(written));

    FetchResult result;
    result.role = Role::FileSender;
    result.saved_path = file->fileName();
    result.size_bytes = written;
    return R::ok(std::move(result));
}

} // namespace airshare::client
