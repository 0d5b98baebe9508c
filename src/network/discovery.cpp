#include "network/discovery.hpp"

#include "core/logging.hpp"
#include "network/udp_discovery_backend.hpp"

#include <algorithm>

namespace airshare::network {

namespace {

constexpr int kMaxLabelBytes = 63;

} // namespace

QString qualified_instance_name(const QString& name) {
    return QStringLiteral("%1.%2.%3.").arg(name, QLatin1String(SERVICE_TYPE), QLatin1String(SERVICE_DOMAIN));
}

QString instance_host_name(const QString& name) {
    return QStringLiteral("%1.%2").arg(name, QLatin1String(SERVICE_DOMAIN));
}

Result<void, Error> validate_instance_name(const QString& name) {
    if (name.trimmed().isEmpty()) {
        return Result<void, Error>::err(Error{"service name must not be empty", ErrorCode::InvalidInput});
    }
    if (name.contains(QLatin1Char('.'))) {
        return Result<void, Error>::err(
            Error{"service name must not contain '.': " + name.toStdString(), ErrorCode::InvalidInput});
    }
    if (name.toUtf8().size() > kMaxLabelBytes) {
        return Result<void, Error>::err(
            Error{"service name longer than 63 bytes: " + name.toStdString(), ErrorCode::InvalidInput});
    }
    return Result<void, Error>::ok();
}

ServiceRegistry::ServiceRegistry(std::unique_ptr<DiscoveryBackend> backend,
                                 std::chrono::milliseconds lookup_timeout)
    : backend_(std::move(backend))
    , lookup_timeout_(lookup_timeout)
{
}

ServiceRegistry::~ServiceRegistry() {
    shutdown();
}

Result<void, Error> ServiceRegistry::init() {
    if (initialized_) {
        return Result<void, Error>::ok();
    }
    if (!backend_) {
        return Result<void, Error>::err(
            Error{"Discovery backend not available", ErrorCode::DiscoveryUnavailable});
    }

    auto started = backend_->start();
    if (started.is_err()) {
        qCWarning(airshareDiscoveryLog) << "Discovery backend failed to start:"
                                        << started.unwrap_err().message.c_str();
        return started;
    }
    initialized_ = true;
    return Result<void, Error>::ok();
}

void ServiceRegistry::shutdown() {
    if (!initialized_) {
        return;
    }
    for (const auto& name : published_) {
        backend_->unpublish(name);
    }
    published_.clear();
    backend_->stop();
    initialized_ = false;
}

Result<void, Error> ServiceRegistry::ensure_initialized() {
    return initialized_ ? Result<void, Error>::ok() : init();
}

Result<ServiceRecord, Error> ServiceRegistry::register_service(const QString& name,
                                                               const QHostAddress& address,
                                                               uint16_t port) {
    using R = Result<ServiceRecord, Error>;

    auto valid = validate_instance_name(name);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }
    if (address.protocol() != QAbstractSocket::IPv4Protocol) {
        return R::err(Error{"only IPv4 addresses can be advertised, got " + address.toString().toStdString(),
                            ErrorCode::InvalidInput});
    }
    if (port == 0) {
        return R::err(Error{"port must be non-zero", ErrorCode::InvalidInput});
    }

    auto ready = ensure_initialized();
    if (ready.is_err()) {
        return R::err(ready.unwrap_err());
    }

    // A live record must be detected before publishing; mDNS backends would
    // otherwise rename or overwrite silently.
    auto existing = backend_->resolve(name, lookup_timeout_);
    if (existing.is_err()) {
        return R::err(existing.unwrap_err());
    }
    if (existing.unwrap().has_value()) {
        return R::err(Error{"`" + name.toStdString() + "` already exists, please use a different code!",
                            ErrorCode::NameAlreadyRegistered});
    }

    ServiceRecord record{name, address, port};
    auto published = backend_->publish(record);
    if (published.is_err()) {
        return R::err(published.unwrap_err());
    }

    published_.push_back(name);
    qCInfo(airshareDiscoveryLog).noquote()
        << "Registered" << qualified_instance_name(name) << "at" << address.toString() << "port" << port;
    return R::ok(std::move(record));
}

void ServiceRegistry::unregister_service(const QString& name) {
    auto it = std::find(published_.begin(), published_.end(), name);
    if (it == published_.end()) {
        return;
    }
    published_.erase(it);
    backend_->unpublish(name);
    qCInfo(airshareDiscoveryLog).noquote() << "Unregistered" << qualified_instance_name(name);
}

Result<std::optional<ServiceRecord>, Error> ServiceRegistry::lookup(const QString& name) {
    using R = Result<std::optional<ServiceRecord>, Error>;

    auto valid = validate_instance_name(name);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }

    auto ready = ensure_initialized();
    if (ready.is_err()) {
        return R::err(ready.unwrap_err());
    }

    auto found = backend_->resolve(name, lookup_timeout_);
    if (found.is_ok()) {
        const auto& record = found.unwrap();
        if (record) {
            qCDebug(airshareDiscoveryLog) << "Resolved" << name << "->" << record->address << record->port;
        } else {
            qCDebug(airshareDiscoveryLog) << "No answer for" << name << "within" << lookup_timeout_.count() << "ms";
        }
    }
    return found;
}

std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(const QString& preferred) {
    if (preferred == QLatin1String("udp")) {
        return std::make_unique<UdpDiscoveryBackend>();
    }

#ifdef AIRSHARE_HAS_AVAHI
    // Implemented in platform/linux/avahi_discovery.cpp
    extern std::unique_ptr<DiscoveryBackend> createAvahiBackend();
    return createAvahiBackend();
#else
    if (preferred == QLatin1String("avahi")) {
        qCWarning(airshareDiscoveryLog) << "Avahi support not built in, using UDP discovery";
    }
    return std::make_unique<UdpDiscoveryBackend>();
#endif
}

} // namespace airshare::network
