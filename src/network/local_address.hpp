#pragma once

#include <QHostAddress>

namespace airshare::network {

/**
 * First IPv4 address of an interface that is up, running and not loopback.
 * Falls back to 127.0.0.1 when the host has no such interface.
 */
QHostAddress local_ipv4_address();

} // namespace airshare::network
