#pragma once

#include "content/share_session.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "http/http_message.hpp"
#include "network/discovery.hpp"

#include <QHostAddress>
#include <QObject>
#include <QString>
#include <QStringList>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>

class QTcpServer;

namespace airshare::server {

class HttpConnection;

inline constexpr uint16_t DEFAULT_PORT = 80;

/**
 * ServerConfig - Everything one server instance is started with.
 *
 * Sender roles carry the ShareSession they expose; the upload receiver carries
 * the directory uploads are written to. The port must be non-zero: the name is
 * registered before the socket is bound, so the advertised port has to be
 * known up front.
 */
struct ServerConfig {
    QString code;
    Role role = Role::UploadReceiver;
    std::optional<content::ShareSession> session;
    uint16_t port = DEFAULT_PORT;

    // Address put in the service record; defaults to the first LAN IPv4 address.
    std::optional<QHostAddress> advertise_address;

    QString upload_dir;
    bool decompress = false;

    [[nodiscard]] static ServerConfig for_session(QString code, content::ShareSession session,
                                                  uint16_t port = DEFAULT_PORT);
    [[nodiscard]] static ServerConfig for_upload(QString code, QString upload_dir,
                                                 uint16_t port = DEFAULT_PORT);
};

/**
 * Check a configuration before anything touches the network.
 */
[[nodiscard]] Result<void> validate_config(const ServerConfig& config);

/**
 * Build a sender configuration from caller content. Text wins when both text
 * and paths are given; paths go through the packager, and the resulting
 * artifact lives as long as the configuration (or any copy of it) does.
 * Fails with InvalidInput when there is nothing to share.
 */
[[nodiscard]] Result<ServerConfig> make_send_config(const QString& code,
                                                    const QString& text,
                                                    const QStringList& paths,
                                                    bool compress,
                                                    uint16_t port = DEFAULT_PORT);

/**
 * "http://<host>[:port]"; the port is left out for 80.
 */
[[nodiscard]] QString display_url(const QString& host, uint16_t port);

/**
 * One line announcing what is shared and where, e.g.
 * "`report.pdf` (1.2 MB) available at 192.168.1.7:8000 and `http://demo.local:8000`".
 */
[[nodiscard]] QString startup_banner(const ServerConfig& config, const ServiceRecord& record);

/**
 * TransferServer - HTTP endpoint set for one role, advertised under one name.
 *
 * start() registers the name and only then binds the port, so no request is
 * ever served under a name the discovery layer refused. Routes are fixed by
 * the role at construction. Runs on the event loop of the thread it lives in;
 * downloads and uploads of different clients interleave on that loop.
 */
class TransferServer : public QObject {
    Q_OBJECT

public:
    TransferServer(ServerConfig config,
                   std::unique_ptr<network::DiscoveryBackend> backend,
                   std::chrono::milliseconds lookup_timeout = std::chrono::milliseconds{3000},
                   QObject* parent = nullptr);
    ~TransferServer() override;

    /**
     * Resolve the local address, register, bind, listen.
     */
    Result<ServiceRecord> start();

    /**
     * Stop listening, drop open connections and withdraw the record.
     */
    void stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] const ServerConfig& config() const { return config_; }
    [[nodiscard]] const std::optional<ServiceRecord>& record() const { return record_; }

signals:
    /**
     * Content was served to `peer` (queued; never delays the response).
     */
    void contentRequested(const QHostAddress& peer);

    /**
     * A file was stored (or extracted) under the upload directory.
     */
    void uploadReceived(const QString& path);

private slots:
    void onNewConnection();

private:
    using Handler = std::function<void(HttpConnection&, const http::HttpRequest&)>;

    struct Route {
        QByteArray method;
        Handler handler;
    };

    void register_routes();
    void handle_request(HttpConnection& connection, const http::HttpRequest& request);
    void note_content_requested(const HttpConnection& connection);

    void serve_text(HttpConnection& connection);
    void serve_download_page(HttpConnection& connection);
    void serve_download(HttpConnection& connection);
    void serve_upload_page(HttpConnection& connection);
    void receive_upload(HttpConnection& connection, const http::HttpRequest& request);

    ServerConfig config_;
    network::ServiceRegistry registry_;
    std::unique_ptr<QTcpServer> listener_;
    std::map<QByteArray, Route> routes_;
    std::optional<ServiceRecord> record_;
};

} // namespace airshare::server
