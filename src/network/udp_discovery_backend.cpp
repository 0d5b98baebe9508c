#include "network/udp_discovery_backend.hpp"

#include "core/logging.hpp"
#include "network/discovery_datagram.hpp"

#include <QByteArray>
#include <QEventLoop>
#include <QRandomGenerator>
#include <QTimer>
#include <QUdpSocket>

#include <algorithm>
#include <limits>

namespace airshare::network {
namespace {

constexpr int kRequeryIntervalMs = 250;

QHostAddress group_address() {
    return QHostAddress(QString::fromLatin1(UdpDiscoveryBackend::MULTICAST_GROUP));
}

quint64 new_claimant_id() {
    quint64 id = 0;
    while (id == 0) {
        id = QRandomGenerator::global()->generate64();
    }
    return id;
}

int timer_interval(std::chrono::milliseconds timeout) {
    const auto clamped = std::clamp<std::chrono::milliseconds::rep>(
        timeout.count(), 0, std::numeric_limits<int>::max());
    return static_cast<int>(clamped);
}

} // namespace

UdpDiscoveryBackend::UdpDiscoveryBackend(QObject* parent)
    : QObject(parent)
    , claimant_id_(new_claimant_id())
{
}

UdpDiscoveryBackend::~UdpDiscoveryBackend() {
    stop();
}

void UdpDiscoveryBackend::set_datagram_sink(DatagramSink sink) {
    sink_ = std::move(sink);
}

Result<void, Error> UdpDiscoveryBackend::start() {
    if (started_) {
        return Result<void, Error>::ok();
    }
    if (sink_) {
        started_ = true;
        return Result<void, Error>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);
    if (!socket_->bind(QHostAddress::AnyIPv4,
                       DISCOVERY_PORT,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto msg = socket_->errorString().toStdString();
        socket_.reset();
        return Result<void, Error>::err(Error{"cannot bind discovery socket: " + msg,
                                              ErrorCode::DiscoveryUnavailable});
    }

    socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    socket_->setSocketOption(QAbstractSocket::MulticastLoopbackOption, 1);
    if (!socket_->joinMulticastGroup(group_address())) {
        qCWarning(airshareDiscoveryLog) << "Cannot join multicast group" << MULTICAST_GROUP << ":"
                                        << socket_->errorString();
    }
    connect(socket_.get(), &QUdpSocket::readyRead, this, &UdpDiscoveryBackend::onReadyRead);

    started_ = true;
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::stop() {
    published_.clear();
    answers_.clear();
    claims_.clear();
    started_ = false;
    if (!socket_) return;
    socket_->leaveMulticastGroup(group_address());
    socket_.reset();
}

Result<void, Error> UdpDiscoveryBackend::publish(const ServiceRecord& record) {
    if (!started_) {
        return Result<void, Error>::err(Error{"discovery not started", ErrorCode::DiscoveryUnavailable});
    }
    if (published_.contains(record.name) || claims_.contains(record.name)) {
        return Result<void, Error>::err(Error{"`" + record.name.toStdString() + "` already exists",
                                              ErrorCode::NameAlreadyRegistered});
    }

    claims_.insert(record.name, false);

    QEventLoop loop;
    QTimer round;
    round.setInterval(static_cast<int>(CLAIM_INTERVAL.count()));
    int sent = 0;
    auto next_round = [&]() {
        if (sent == CLAIM_ROUNDS) {
            loop.quit();
            return;
        }
        send(encode_claim_datagram(record, claimant_id_));
        ++sent;
    };
    connect(&round, &QTimer::timeout, &loop, next_round);
    connect(this, &UdpDiscoveryBackend::claimConflicted, &loop, [&loop, &record](const QString& name) {
        if (name == record.name) {
            loop.quit();
        }
    });

    next_round();
    round.start();
    loop.exec();

    const bool conflict = claims_.take(record.name);
    if (conflict) {
        qCInfo(airshareDiscoveryLog) << "Claim for" << record.name << "lost to another host";
        return Result<void, Error>::err(Error{"`" + record.name.toStdString() + "` already exists",
                                              ErrorCode::NameAlreadyRegistered});
    }

    published_.insert(record.name, record);

    // Unsolicited answer so waiting resolvers see the record immediately.
    send(encode_answer_datagram(record));
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::unpublish(const QString& name) {
    published_.remove(name);
}

Result<std::optional<ServiceRecord>, Error> UdpDiscoveryBackend::resolve(const QString& name,
                                                                         std::chrono::milliseconds timeout) {
    using R = Result<std::optional<ServiceRecord>, Error>;

    if (!started_) {
        return R::err(Error{"discovery not started", ErrorCode::DiscoveryUnavailable});
    }

    if (auto it = published_.constFind(name); it != published_.constEnd()) {
        return R::ok(*it);
    }

    answers_.remove(name);

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    deadline.setInterval(timer_interval(timeout));
    connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer requery;
    requery.setInterval(kRequeryIntervalMs);
    connect(&requery, &QTimer::timeout, &loop, [this, &name]() {
        send(encode_query_datagram(name));
    });

    connect(this, &UdpDiscoveryBackend::answerReceived, &loop, [&loop, &name](const QString& answered) {
        if (answered == name) {
            loop.quit();
        }
    });

    send(encode_query_datagram(name));
    deadline.start();
    requery.start();
    loop.exec();

    if (auto it = answers_.constFind(name); it != answers_.constEnd()) {
        return R::ok(*it);
    }
    return R::ok(std::nullopt);
}

void UdpDiscoveryBackend::send(const QByteArray& datagram) {
    if (sink_) {
        sink_(datagram);
        return;
    }
    if (!socket_) return;
    if (socket_->writeDatagram(datagram, group_address(), DISCOVERY_PORT) < 0) {
        qCDebug(airshareDiscoveryLog) << "Multicast send failed:" << socket_->errorString();
    }
}

void UdpDiscoveryBackend::onReadyRead() {
    if (!socket_) return;

    while (socket_->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<int>(socket_->pendingDatagramSize()));

        QHostAddress sender;
        quint16 sender_port = 0;
        socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        Q_UNUSED(sender_port)

        receive_datagram(datagram, sender);
    }
}

void UdpDiscoveryBackend::receive_datagram(const QByteArray& datagram, const QHostAddress& sender) {
    if (!started_) return;

    auto decoded = decode_discovery_datagram(datagram, sender);
    if (decoded.is_err()) {
        return;
    }
    const auto msg = std::move(decoded).unwrap();

    switch (msg.kind) {
        case DatagramKind::Query:
            if (auto it = published_.constFind(msg.name); it != published_.constEnd()) {
                send(encode_answer_datagram(*it));
            }
            return;

        case DatagramKind::Claim: {
            if (msg.claimant == claimant_id_) {
                return;  // our own claim, looped back
            }
            if (auto it = published_.constFind(msg.name); it != published_.constEnd()) {
                send(encode_answer_datagram(*it));
                return;
            }
            // Simultaneous claims: the lower id keeps the name.
            auto claim = claims_.find(msg.name);
            if (claim != claims_.end() && msg.claimant < claimant_id_ && !claim.value()) {
                claim.value() = true;
                emit claimConflicted(msg.name);
            }
            return;
        }

        case DatagramKind::Answer: {
            auto claim = claims_.find(msg.name);
            if (claim != claims_.end() && !claim.value()) {
                claim.value() = true;
                emit claimConflicted(msg.name);
            }
            answers_.insert(msg.name, msg.record);
            emit answerReceived(msg.name);
            return;
        }
    }
}

} // namespace airshare::network
