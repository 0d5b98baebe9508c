#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QHostAddress>
#include <QString>

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace airshare::network {

/**
 * DNS-SD service type shared by every airshare instance. An instance named
 * `code` is published as `<code>._airshare._http._tcp.local.` with its host
 * record at `<code>.local`.
 */
inline constexpr const char* SERVICE_TYPE = "_airshare._http._tcp";
inline constexpr const char* SERVICE_DOMAIN = "local";

/**
 * Fully qualified instance name, e.g. "demo._airshare._http._tcp.local.".
 */
[[nodiscard]] QString qualified_instance_name(const QString& name);

/**
 * Host name advertised for an instance, e.g. "demo.local".
 */
[[nodiscard]] QString instance_host_name(const QString& name);

/**
 * DiscoveryBackend - Abstract interface for platform-specific mDNS.
 *
 * Implementations must be IPv4-only. publish() must fail with
 * ErrorCode::NameAlreadyRegistered rather than replace a live record.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    virtual Result<void, Error> start() = 0;
    virtual void stop() = 0;

    virtual Result<void, Error> publish(const ServiceRecord& record) = 0;
    virtual void unpublish(const QString& name) = 0;

    /**
     * Query for `name` for at most `timeout`. nullopt when nobody answered.
     */
    virtual Result<std::optional<ServiceRecord>, Error> resolve(const QString& name,
                                                                std::chrono::milliseconds timeout) = 0;
};

/**
 * ServiceRegistry - Register and look up named airshare services.
 *
 * Owns one backend and drives its lifecycle: init() starts it, shutdown()
 * withdraws everything this registry published and stops it. Each registry is
 * independent, so several can coexist in one process.
 */
class ServiceRegistry {
public:
    explicit ServiceRegistry(std::unique_ptr<DiscoveryBackend> backend,
                             std::chrono::milliseconds lookup_timeout = std::chrono::milliseconds{3000});
    ~ServiceRegistry();

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    Result<void, Error> init();
    void shutdown();

    [[nodiscard]] bool is_initialized() const { return initialized_; }

    /**
     * Publish `name` at address:port. Fails with NameAlreadyRegistered when a
     * live record with that name already answers on the network.
     */
    Result<ServiceRecord, Error> register_service(const QString& name,
                                                  const QHostAddress& address,
                                                  uint16_t port);

    /**
     * Withdraw a record this registry published.
     */
    void unregister_service(const QString& name);

    /**
     * Bounded-time lookup. Absence is nullopt, not an error.
     */
    Result<std::optional<ServiceRecord>, Error> lookup(const QString& name);

    [[nodiscard]] std::chrono::milliseconds lookup_timeout() const { return lookup_timeout_; }

private:
    Result<void, Error> ensure_initialized();

    std::unique_ptr<DiscoveryBackend> backend_;
    std::chrono::milliseconds lookup_timeout_;
    std::vector<QString> published_;
    bool initialized_ = false;
};

/**
 * Check that `name` can be used as a DNS-SD instance label: non-empty, no
 * dots, at most 63 bytes of UTF-8.
 */
[[nodiscard]] Result<void, Error> validate_instance_name(const QString& name);

/**
 * Create the platform-appropriate discovery backend. `preferred` is "avahi",
 * "udp" or empty for the default (Avahi when built in, UDP otherwise).
 */
std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(const QString& preferred = {});

} // namespace airshare::network
