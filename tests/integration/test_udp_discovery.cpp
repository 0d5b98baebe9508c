#include <catch2/catch_test_macros.hpp>

#include "network/discovery.hpp"
#include "network/udp_discovery_backend.hpp"

#include <QHostAddress>
#include <QMetaObject>
#include <QTimer>

#include <vector>

using namespace airshare;
using namespace airshare::network;

namespace {

constexpr std::chrono::milliseconds kLookupTimeout{300};

// Stands in for the multicast group: every datagram reaches every attached
// backend, the sender included, on a later event loop pass.
class DatagramHub {
public:
    void attach(UdpDiscoveryBackend* backend) {
        backends_.push_back(backend);
        backend->set_datagram_sink([this](const QByteArray& datagram) { broadcast(datagram); });
    }

private:
    void broadcast(const QByteArray& datagram) {
        for (auto* backend : backends_) {
            QMetaObject::invokeMethod(
                backend,
                [backend, datagram]() { backend->receive_datagram(datagram, QHostAddress(QHostAddress::LocalHost)); },
                Qt::QueuedConnection);
        }
    }

    std::vector<UdpDiscoveryBackend*> backends_;
};

struct HubPeer {
    UdpDiscoveryBackend* backend = nullptr;
    std::unique_ptr<ServiceRegistry> registry;
};

HubPeer hub_peer(DatagramHub& hub) {
    auto backend = std::make_unique<UdpDiscoveryBackend>();
    HubPeer peer;
    peer.backend = backend.get();
    hub.attach(peer.backend);
    peer.registry = std::make_unique<ServiceRegistry>(std::move(backend), kLookupTimeout);
    REQUIRE(peer.registry->init().is_ok());
    return peer;
}

} // namespace

TEST_CASE("UDP discovery: a published name resolves from another backend", "[integration][discovery]") {
    DatagramHub hub;
    auto publisher = hub_peer(hub);
    auto resolver = hub_peer(hub);

    const QHostAddress address(QStringLiteral("192.168.77.5"));
    REQUIRE(publisher.registry->register_service(QStringLiteral("udpcheck"), address, 8123).is_ok());

    auto found = resolver.registry->lookup(QStringLiteral("udpcheck"));
    REQUIRE(found.is_ok());
    REQUIRE(found.unwrap().has_value());
    CHECK(found.unwrap()->address == address);
    CHECK(found.unwrap()->port == 8123);

    SECTION("a second registration of the name is refused") {
        auto again = resolver.registry->register_service(QStringLiteral("udpcheck"), address, 8124);
        REQUIRE(again.is_err());
        CHECK(again.unwrap_err().code == ErrorCode::NameAlreadyRegistered);
    }

    SECTION("the name disappears after unregistering") {
        publisher.registry->unregister_service(QStringLiteral("udpcheck"));
        auto gone = resolver.registry->lookup(QStringLiteral("udpcheck"));
        REQUIRE(gone.is_ok());
        CHECK_FALSE(gone.unwrap().has_value());
    }
}

TEST_CASE("UDP discovery: claiming a name another backend publishes fails", "[integration][discovery]") {
    DatagramHub hub;
    auto owner = hub_peer(hub);
    auto latecomer = hub_peer(hub);

    const ServiceRecord record{QStringLiteral("taken"), QHostAddress(QStringLiteral("10.0.0.7")), 8000};
    REQUIRE(owner.backend->publish(record).is_ok());

    // Skips the registry's lookup, so only the claim can catch the clash.
    auto second = latecomer.backend->publish(ServiceRecord{record.name, QHostAddress(QStringLiteral("10.0.0.8")), 8001});
    REQUIRE(second.is_err());
    CHECK(second.unwrap_err().code == ErrorCode::NameAlreadyRegistered);

    auto found = latecomer.registry->lookup(record.name);
    REQUIRE(found.is_ok());
    REQUIRE(found.unwrap().has_value());
    CHECK(found.unwrap()->port == 8000);
}

TEST_CASE("UDP discovery: simultaneous claims leave exactly one owner", "[integration][discovery]") {
    DatagramHub hub;
    auto first = hub_peer(hub);
    auto second = hub_peer(hub);
    REQUIRE(first.backend->claimant_id() != second.backend->claimant_id());

    const QString name = QStringLiteral("contested");
    std::optional<Result<void, Error>> second_result;

    // Runs inside the first publish's claim loop, so both claims overlap.
    QTimer::singleShot(0, second.backend, [&]() {
        second_result = second.backend->publish(ServiceRecord{name, QHostAddress(QStringLiteral("10.0.0.2")), 9002});
    });
    auto first_result = first.backend->publish(ServiceRecord{name, QHostAddress(QStringLiteral("10.0.0.1")), 9001});
    REQUIRE(second_result.has_value());

    const bool first_won = first_result.is_ok();
    const bool second_won = second_result->is_ok();
    REQUIRE(first_won != second_won);

    const auto& loser = first_won ? *second_result : first_result;
    CHECK(loser.unwrap_err().code == ErrorCode::NameAlreadyRegistered);

    // The lower claimant id keeps the name.
    const bool first_is_lower = first.backend->claimant_id() < second.backend->claimant_id();
    CHECK(first_won == first_is_lower);
}

// Needs a multicast-capable interface; run with `airshare_tests [multicast]`.
TEST_CASE("UDP discovery: resolves over the multicast group", "[.][multicast][discovery]") {
    ServiceRegistry publisher(std::make_unique<UdpDiscoveryBackend>(), std::chrono::milliseconds{1500});
    ServiceRegistry resolver(std::make_unique<UdpDiscoveryBackend>(), std::chrono::milliseconds{1500});
    REQUIRE(publisher.init().is_ok());
    REQUIRE(resolver.init().is_ok());

    const QHostAddress address(QStringLiteral("192.168.77.5"));
    REQUIRE(publisher.register_service(QStringLiteral("udpcheck"), address, 8123).is_ok());

    auto found = resolver.lookup(QStringLiteral("udpcheck"));
    REQUIRE(found.is_ok());
    REQUIRE(found.unwrap().has_value());
    CHECK(found.unwrap()->address == address);
}
