#pragma once

#include "network/discovery.hpp"

#include <QHash>
#include <QObject>

#include <chrono>
#include <functional>
#include <memory>

class QUdpSocket;

namespace airshare::network {

/**
 * UDP multicast discovery backend.
 *
 * Cross-platform and needs no system daemon. Resolving sends a query for a
 * name to the multicast group and waits (running a local event loop) for an
 * answer; published names answer queries for themselves. Must be used from the
 * thread that owns it.
 *
 * Publishing first claims the name for CLAIM_ROUNDS intervals. The claim fails
 * with NameAlreadyRegistered when another backend answers for the name or
 * claims it at the same time with a lower claimant id.
 */
class UdpDiscoveryBackend final : public QObject, public DiscoveryBackend {
    Q_OBJECT

public:
    static constexpr quint16 DISCOVERY_PORT = 45353;
    static constexpr const char* MULTICAST_GROUP = "239.255.42.99";
    static constexpr int CLAIM_ROUNDS = 3;
    static constexpr std::chrono::milliseconds CLAIM_INTERVAL{250};

    using DatagramSink = std::function<void(const QByteArray&)>;

    explicit UdpDiscoveryBackend(QObject* parent = nullptr);
    ~UdpDiscoveryBackend() override;

    Result<void, Error> start() override;
    void stop() override;

    Result<void, Error> publish(const ServiceRecord& record) override;
    void unpublish(const QString& name) override;

    Result<std::optional<ServiceRecord>, Error> resolve(const QString& name,
                                                        std::chrono::milliseconds timeout) override;

    /**
     * Send datagrams to `sink` instead of the multicast group. Must be set
     * before start(), which then opens no socket; incoming datagrams are
     * handed in through receive_datagram().
     */
    void set_datagram_sink(DatagramSink sink);

    /**
     * Process one datagram as if it had arrived from `sender`.
     */
    void receive_datagram(const QByteArray& datagram, const QHostAddress& sender);

    [[nodiscard]] quint64 claimant_id() const { return claimant_id_; }

signals:
    void answerReceived(const QString& name);
    void claimConflicted(const QString& name);

private slots:
    void onReadyRead();

private:
    void send(const QByteArray& datagram);

    std::unique_ptr<QUdpSocket> socket_;
    DatagramSink sink_;
    bool started_ = false;
    quint64 claimant_id_;
    QHash<QString, ServiceRecord> published_;
    QHash<QString, ServiceRecord> answers_;
    QHash<QString, bool> claims_;  // name -> conflict seen
};

} // namespace airshare::network
