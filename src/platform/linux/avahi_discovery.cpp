#include "network/discovery.hpp"

#ifdef AIRSHARE_HAS_AVAHI

#include "core/logging.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-client/publish.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/thread-watch.h>

#include <condition_variable>
#include <map>
#include <mutex>

namespace airshare::network {

namespace {

constexpr std::chrono::seconds kPublishTimeout{5};

// Serializes access to the Avahi objects from callers' threads.
class PollLock {
public:
    explicit PollLock(AvahiThreadedPoll* poll) : poll_(poll) { avahi_threaded_poll_lock(poll_); }
    ~PollLock() { avahi_threaded_poll_unlock(poll_); }

    PollLock(const PollLock&) = delete;
    PollLock& operator=(const PollLock&) = delete;

private:
    AvahiThreadedPoll* poll_;
};

} // namespace

/**
 * Avahi-based mDNS discovery backend for Linux.
 *
 * Avahi callbacks run on the threaded poll's own thread; callers block on a
 * condition variable until the callback they wait for fires or a deadline
 * passes.
 */
class AvahiDiscoveryBackend : public DiscoveryBackend {
public:
    AvahiDiscoveryBackend() = default;

    ~AvahiDiscoveryBackend() override {
        stop();
    }

    Result<void, Error> start() override {
        if (client_) {
            return Result<void, Error>::ok();
        }

        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) {
            return Result<void, Error>::err(
                Error{"Failed to create Avahi poll", ErrorCode::DiscoveryUnavailable});
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::err(Error{
                "Failed to create Avahi client: " + std::string(avahi_strerror(error)),
                ErrorCode::DiscoveryUnavailable});
        }

        if (avahi_threaded_poll_start(threaded_poll_) < 0) {
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::err(
                Error{"Failed to start Avahi poll thread", ErrorCode::DiscoveryUnavailable});
        }

        return Result<void, Error>::ok();
    }

    void stop() override {
        if (!threaded_poll_) {
            return;
        }

        avahi_threaded_poll_stop(threaded_poll_);

        for (auto& [name, publication] : groups_) {
            avahi_entry_group_free(publication->group);
        }
        groups_.clear();

        if (client_) {
            avahi_client_free(client_);
            client_ = nullptr;
        }
        avahi_threaded_poll_free(threaded_poll_);
        threaded_poll_ = nullptr;
    }

    Result<void, Error> publish(const ServiceRecord& record) override {
        if (!client_) {
            return Result<void, Error>::err(Error{"discovery not started", ErrorCode::DiscoveryUnavailable});
        }

        AvahiAddress address;
        const auto address_text = record.address.toString().toUtf8();
        if (!avahi_address_parse(address_text.constData(), AVAHI_PROTO_INET, &address)) {
            return Result<void, Error>::err(
                Error{"not an IPv4 address: " + address_text.toStdString(), ErrorCode::InvalidInput});
        }

        const auto name = record.name.toUtf8();
        const auto host = instance_host_name(record.name).toUtf8();
        auto publication = std::make_unique<Publication>();

        {
            PollLock lock(threaded_poll_);

            if (groups_.count(record.name) != 0) {
                return Result<void, Error>::err(Error{"`" + record.name.toStdString() + "` already exists",
                                                      ErrorCode::NameAlreadyRegistered});
            }

            publication->group = avahi_entry_group_new(client_, entry_group_callback, publication.get());
            if (!publication->group) {
                return Result<void, Error>::err(Error{
                    "Failed to create entry group: " + std::string(avahi_strerror(avahi_client_errno(client_))),
                    ErrorCode::DiscoveryUnavailable});
            }

            int ret = avahi_entry_group_add_address(
                publication->group,
                AVAHI_IF_UNSPEC,
                AVAHI_PROTO_INET,
                static_cast<AvahiPublishFlags>(0),
                host.constData(),
                &address
            );

            if (ret >= 0) {
                ret = avahi_entry_group_add_service_strlst(
                    publication->group,
                    AVAHI_IF_UNSPEC,
                    AVAHI_PROTO_INET,
                    static_cast<AvahiPublishFlags>(0),
                    name.constData(),
                    SERVICE_TYPE,
                    nullptr,  // domain
                    host.constData(),
                    record.port,
                    nullptr   // txt
                );
            }

            if (ret >= 0) {
                ret = avahi_entry_group_commit(publication->group);
            }

            if (ret < 0) {
                avahi_entry_group_free(publication->group);
                const auto code = (ret == AVAHI_ERR_COLLISION) ? ErrorCode::NameAlreadyRegistered
                                                               : ErrorCode::DiscoveryUnavailable;
                return Result<void, Error>::err(
                    Error{"Failed to publish service: " + std::string(avahi_strerror(ret)), code});
            }
        }

        // Wait for the daemon to confirm the records or report a collision.
        AvahiEntryGroupState state = AVAHI_ENTRY_GROUP_REGISTERING;
        {
            std::unique_lock<std::mutex> wait_lock(publication->mu);
            publication->cv.wait_for(wait_lock, kPublishTimeout, [&] { return publication->settled; });
            state = publication->state;
        }

        if (state != AVAHI_ENTRY_GROUP_ESTABLISHED) {
            {
                PollLock lock(threaded_poll_);
                avahi_entry_group_free(publication->group);
            }
            if (state == AVAHI_ENTRY_GROUP_COLLISION) {
                return Result<void, Error>::err(Error{"`" + record.name.toStdString() + "` already exists",
                                                      ErrorCode::NameAlreadyRegistered});
            }
            return Result<void, Error>::err(Error{"Service registration did not complete",
                                                  ErrorCode::DiscoveryUnavailable});
        }

        PollLock lock(threaded_poll_);
        groups_.emplace(record.name, std::move(publication));
        return Result<void, Error>::ok();
    }

    void unpublish(const QString& name) override {
        if (!threaded_poll_) {
            return;
        }
        PollLock lock(threaded_poll_);
        auto it = groups_.find(name);
        if (it == groups_.end()) {
            return;
        }
        avahi_entry_group_reset(it->second->group);
        avahi_entry_group_free(it->second->group);
        groups_.erase(it);
    }

    Result<std::optional<ServiceRecord>, Error> resolve(const QString& name,
                                                        std::chrono::milliseconds timeout) override {
        using R = Result<std::optional<ServiceRecord>, Error>;

        if (!client_) {
            return R::err(Error{"discovery not started", ErrorCode::DiscoveryUnavailable});
        }

        PendingResolve pending;
        pending.name = name;
        const auto utf8 = name.toUtf8();

        AvahiServiceResolver* resolver = nullptr;
        {
            PollLock lock(threaded_poll_);
            resolver = avahi_service_resolver_new(
                client_,
                AVAHI_IF_UNSPEC,
                AVAHI_PROTO_INET,
                utf8.constData(),
                SERVICE_TYPE,
                SERVICE_DOMAIN,
                AVAHI_PROTO_INET,
                static_cast<AvahiLookupFlags>(0),
                resolve_callback,
                &pending
            );
        }
        if (!resolver) {
            return R::err(Error{
                "Failed to create resolver: " + std::string(avahi_strerror(avahi_client_errno(client_))),
                ErrorCode::DiscoveryUnavailable});
        }

        {
            std::unique_lock<std::mutex> wait_lock(pending.mu);
            pending.cv.wait_for(wait_lock, timeout, [&] { return pending.done; });
        }

        // Freeing under the poll lock guarantees no callback still uses `pending`.
        {
            PollLock lock(threaded_poll_);
            avahi_service_resolver_free(resolver);
        }

        std::lock_guard<std::mutex> guard(pending.mu);
        return R::ok(pending.record);
    }

private:
    struct Publication {
        AvahiEntryGroup* group = nullptr;
        std::mutex mu;
        std::condition_variable cv;
        AvahiEntryGroupState state = AVAHI_ENTRY_GROUP_UNCOMMITED;
        bool settled = false;
    };

    struct PendingResolve {
        QString name;
        std::mutex mu;
        std::condition_variable cv;
        bool done = false;
        std::optional<ServiceRecord> record;
    };

    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    std::map<QString, std::unique_ptr<Publication>> groups_;

    static void client_callback(AvahiClient*, AvahiClientState state, void*) {
        switch (state) {
            case AVAHI_CLIENT_FAILURE:
                qCWarning(airshareDiscoveryLog) << "Avahi client failure";
                break;
            case AVAHI_CLIENT_S_COLLISION:
                qCWarning(airshareDiscoveryLog) << "Avahi host name collision";
                break;
            case AVAHI_CLIENT_S_RUNNING:
            case AVAHI_CLIENT_S_REGISTERING:
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    static void entry_group_callback(AvahiEntryGroup*,
                                     AvahiEntryGroupState state,
                                     void* userdata) {
        auto* publication = static_cast<Publication*>(userdata);
        std::lock_guard<std::mutex> lock(publication->mu);
        publication->state = state;
        switch (state) {
            case AVAHI_ENTRY_GROUP_ESTABLISHED:
            case AVAHI_ENTRY_GROUP_COLLISION:
            case AVAHI_ENTRY_GROUP_FAILURE:
                publication->settled = true;
                publication->cv.notify_all();
                break;
            case AVAHI_ENTRY_GROUP_UNCOMMITED:
            case AVAHI_ENTRY_GROUP_REGISTERING:
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver*,
                                 AvahiIfIndex,
                                 AvahiProtocol,
                                 AvahiResolverEvent event,
                                 const char*,
                                 const char*,
                                 const char*,
                                 const char*,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList*,
                                 AvahiLookupResultFlags,
                                 void* userdata) {
        auto* pending = static_cast<PendingResolve*>(userdata);
        std::lock_guard<std::mutex> lock(pending->mu);
        if (pending->done) {
            return;
        }

        if (event == AVAHI_RESOLVER_FOUND && address && address->proto == AVAHI_PROTO_INET) {
            char addr_str[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(addr_str, sizeof(addr_str), address);
            pending->record = ServiceRecord{pending->name, QHostAddress(QString::fromUtf8(addr_str)), port};
        }
        // AVAHI_RESOLVER_FAILURE covers timeouts and "no such service".
        pending->done = true;
        pending->cv.notify_all();
    }
};

std::unique_ptr<DiscoveryBackend> createAvahiBackend() {
    return std::make_unique<AvahiDiscoveryBackend>();
}

} // namespace airshare::network

#endif // AIRSHARE_HAS_AVAHI
