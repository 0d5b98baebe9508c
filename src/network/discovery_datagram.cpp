#include "network/discovery_datagram.hpp"

#include "network/discovery.hpp"

#include <QJsonDocument>
#include <QJsonObject>

namespace airshare::network {
namespace {

constexpr const char* kMsgType = "airshare";
constexpr const char* kOpQuery = "query";
constexpr const char* kOpAnswer = "answer";
constexpr const char* kOpClaim = "claim";

QJsonObject header(const char* op, const QString& name) {
    QJsonObject obj;
    obj["t"] = QString::fromLatin1(kMsgType);
    obj["svc"] = QString::fromLatin1(SERVICE_TYPE);
    obj["op"] = QString::fromLatin1(op);
    obj["name"] = name;
    return obj;
}

Result<DiscoveryDatagram, Error> reject(const char* why) {
    return Result<DiscoveryDatagram, Error>::err(Error{why, ErrorCode::Protocol});
}

} // namespace

QByteArray encode_query_datagram(const QString& name) {
    return QJsonDocument(header(kOpQuery, name)).toJson(QJsonDocument::Compact);
}

QByteArray encode_answer_datagram(const ServiceRecord& record) {
    auto obj = header(kOpAnswer, record.name);
    obj["addr"] = record.address.toString();
    obj["port"] = static_cast<int>(record.port);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray encode_claim_datagram(const ServiceRecord& record, quint64 claimant) {
    auto obj = header(kOpClaim, record.name);
    obj["addr"] = record.address.toString();
    obj["port"] = static_cast<int>(record.port);
    // JSON numbers are doubles; 64-bit ids travel as hex.
    obj["id"] = QString::number(claimant, 16);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<DiscoveryDatagram, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                           const QHostAddress& sender) {
    const auto doc = QJsonDocument::fromJson(datagram);
    if (doc.isNull() || !doc.isObject()) {
        return reject("invalid json");
    }

    const auto obj = doc.object();
    if (obj["t"].toString() != QString::fromLatin1(kMsgType) ||
        obj["svc"].toString() != QString::fromLatin1(SERVICE_TYPE)) {
        return reject("wrong message type");
    }

    const auto name = obj["name"].toString();
    if (validate_instance_name(name).is_err()) {
        return reject("invalid instance name");
    }

    DiscoveryDatagram msg;
    msg.name = name;

    const auto op = obj["op"].toString();
    if (op == QLatin1String(kOpQuery)) {
        msg.kind = DatagramKind::Query;
        return Result<DiscoveryDatagram, Error>::ok(std::move(msg));
    }
    if (op == QLatin1String(kOpAnswer)) {
        msg.kind = DatagramKind::Answer;
    } else if (op == QLatin1String(kOpClaim)) {
        msg.kind = DatagramKind::Claim;
        bool id_ok = false;
        msg.claimant = obj["id"].toString().toULongLong(&id_ok, 16);
        if (!id_ok || msg.claimant == 0) {
            return reject("invalid claimant id");
        }
    } else {
        return reject("unknown op");
    }

    const int port_int = obj["port"].toInt();
    if (port_int <= 0 || port_int > 65535) {
        return reject("invalid port");
    }

    QHostAddress address = sender;
    if (obj.contains("addr")) {
        address = QHostAddress(obj["addr"].toString());
    }
    bool is_v4 = false;
    address.toIPv4Address(&is_v4);
    if (!is_v4) {
        return reject("not an IPv4 address");
    }

    msg.record = ServiceRecord{name, QHostAddress(address.toIPv4Address()), static_cast<uint16_t>(port_int)};
    return Result<DiscoveryDatagram, Error>::ok(std::move(msg));
}

} // namespace airshare::network
