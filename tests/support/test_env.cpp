#include "support/test_env.hpp"

#include <QFile>
#include <QTcpServer>
#include <QTcpSocket>

#include <stdexcept>

namespace airshare::testing {

uint16_t free_port() {
    QTcpServer listener;
    if (!listener.listen(QHostAddress::AnyIPv4, 0)) {
        throw std::runtime_error("no free port: " + listener.errorString().toStdString());
    }
    return listener.serverPort();
}

void write_file(const QString& path, const QByteArray& bytes) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate) || file.write(bytes) != bytes.size()) {
        throw std::runtime_error("cannot write " + path.toStdString());
    }
}

QByteArray read_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("cannot read " + path.toStdString());
    }
    return file.readAll();
}

QByteArray pattern_bytes(qsizetype size, uint32_t seed) {
    QByteArray out(size, Qt::Uninitialized);
    uint32_t state = seed ? seed : 1;
    for (qsizetype i = 0; i < size; ++i) {
        // xorshift32
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        out[i] = static_cast<char>(state & 0xFF);
    }
    return out;
}

server::SessionHost memory_session_host(const std::shared_ptr<MemoryDirectory>& directory) {
    return server::SessionHost(
        [directory] { return std::make_unique<MemoryDiscoveryBackend>(directory); },
        std::chrono::milliseconds{50});
}

std::unique_ptr<network::ServiceRegistry> memory_registry(const std::shared_ptr<MemoryDirectory>& directory) {
    auto registry = std::make_unique<network::ServiceRegistry>(
        std::make_unique<MemoryDiscoveryBackend>(directory), std::chrono::milliseconds{50});
    registry->init().unwrap();
    return registry;
}

server::ServerConfig local_config(server::ServerConfig config) {
    config.advertise_address = QHostAddress(QHostAddress::LocalHost);
    if (config.port == server::DEFAULT_PORT) {
        config.port = free_port();
    }
    return config;
}

QByteArray RawResponse::header(const QByteArray& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name) return value;
    }
    return {};
}

RawResponse raw_http(uint16_t port, const QByteArray& request) {
    QTcpSocket socket;
    socket.connectToHost(QHostAddress(QHostAddress::LocalHost), port);
    if (!socket.waitForConnected(3000)) {
        throw std::runtime_error("cannot connect: " + socket.errorString().toStdString());
    }
    socket.write(request);
    socket.waitForBytesWritten(3000);

    QByteArray raw;
    while (socket.state() != QAbstractSocket::UnconnectedState) {
        if (!socket.waitForReadyRead(5000)) {
            break;
        }
        raw += socket.readAll();
    }
    raw += socket.readAll();

    RawResponse response;
    const auto end = raw.indexOf("\r\n\r\n");
    if (end < 0) {
        throw std::runtime_error("no response head in: " + raw.left(200).toStdString());
    }
    const auto lines = raw.left(end).split('\n');
    response.status = lines.first().split(' ').value(1).toInt();
    for (qsizetype i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        const auto colon = line.indexOf(':');
        if (colon > 0) {
            response.headers.emplace_back(line.left(colon).toLower(), line.mid(colon + 1).trimmed());
        }
    }
    response.body = raw.mid(end + 4);
    return response;
}

} // namespace airshare::testing
