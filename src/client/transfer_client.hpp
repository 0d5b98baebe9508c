#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "network/discovery.hpp"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <chrono>
#include <memory>

class QNetworkAccessManager;
class QNetworkRequest;
class QNetworkReply;

namespace airshare::client {

struct ClientOptions {
    // Abort a request when no bytes move for this long.
    std::chrono::milliseconds transfer_timeout{30000};

    // Where fetched files land; the current directory when empty.
    QString download_dir;
};

/**
 * What fetch() brought back: text for a Text Sender, a saved file for a
 * File Sender.
 */
struct FetchResult {
    Role role = Role::TextSender;
    QString text;
    QString saved_path;
    quint64 size_bytes = 0;
};

/**
 * TransferClient - Finds a named service and moves content to or from it.
 *
 * Every operation resolves the name, checks the remote role on `/airshare`
 * and only then transfers. Calls block the calling thread, running a local
 * event loop while waiting; they never retry.
 */
class TransferClient {
public:
    explicit TransferClient(network::ServiceRegistry& registry, ClientOptions options = {});
    ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    /**
     * Upload files or directories to the Upload Receiver named `code`.
     *
     * Inputs are validated first: an empty or missing path fails with
     * InvalidInput without any discovery traffic. Several inputs, a directory,
     * or `compress` produce an archive that is removed once the upload ends.
     * Returns the name the content was uploaded under.
     */
    Result<QString> send(const QString& code, const QStringList& paths, bool compress = false);

    /**
     * Pull whatever the sender named `code` shares. Text comes back in the
     * result; a file is streamed into the download directory under the name
     * from its content-disposition header. Upload Receivers fail with
     * RoleMismatch.
     */
    Result<FetchResult> fetch(const QString& code);

    /**
     * Resolve `code` and ask it which role it plays.
     */
    Result<TransferRequest> identify(const QString& code);

private:
    Result<ServiceRecord> resolve(const QString& code);
    Result<Role> query_role(const ServiceRecord& record);

    Result<QByteArray> get(const QUrl& url);
    Result<FetchResult> download(const TransferRequest& target);
    Result<void> upload(const TransferRequest& target, const QString& path, const QString& name);

    QNetworkRequest make_request(const QUrl& url) const;
    Result<void> wait_for(QNetworkReply* reply);

    network::ServiceRegistry& registry_;
    ClientOptions options_;
    std::unique_ptr<QNetworkAccessManager> network_;
};

/**
 * File name carried by a `content-disposition` header, reduced to a base name.
 * Empty when the header names none.
 */
[[nodiscard]] QString disposition_file_name(const QByteArray& header);

} // namespace airshare::client
