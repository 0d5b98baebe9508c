#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>

namespace airshare::network {

// UDP discovery message helpers (used by UdpDiscoveryBackend).
// Kept separate so we can unit test encode/decode without sockets.

enum class DatagramKind {
    Query,
    Answer,
    Claim,  // a backend about to publish `record`
};

struct DiscoveryDatagram {
    DatagramKind kind = DatagramKind::Query;
    QString name;
    ServiceRecord record;  // Answer and Claim
    quint64 claimant = 0;  // Claim only
};

QByteArray encode_query_datagram(const QString& name);

QByteArray encode_answer_datagram(const ServiceRecord& record);

QByteArray encode_claim_datagram(const ServiceRecord& record, quint64 claimant);

/**
 * Decode a datagram. An answer without an explicit address is attributed to
 * `sender`; non-IPv4 addresses are rejected.
 */
Result<DiscoveryDatagram, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                           const QHostAddress& sender);

} // namespace airshare::network
