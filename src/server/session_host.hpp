#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/discovery.hpp"
#include "server/transfer_server.hpp"

#include <chrono>
#include <functional>
#include <memory>

class QThread;

namespace airshare::server {

/**
 * Creates the discovery backend for a session. Called on the session's own
 * thread, so QObject-based backends end up with the right thread affinity.
 */
using BackendFactory = std::function<std::unique_ptr<network::DiscoveryBackend>()>;

/**
 * SessionHandle - A TransferServer running on its own thread.
 *
 * Destroying the handle stops the session.
 */
class SessionHandle {
public:
    ~SessionHandle();

    SessionHandle(const SessionHandle&) = delete;
    SessionHandle& operator=(const SessionHandle&) = delete;

    /**
     * Quit the session's event loop, withdraw its record and join the thread.
     * Safe to call more than once.
     */
    void stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] const ServiceRecord& record() const { return record_; }
    [[nodiscard]] uint16_t port() const { return record_.port; }
    [[nodiscard]] Role role() const { return role_; }

private:
    friend class SessionHost;

    SessionHandle(std::unique_ptr<QThread> thread, ServiceRecord record, Role role);

    std::unique_ptr<QThread> thread_;
    ServiceRecord record_;
    Role role_;
};

/**
 * SessionHost - Launches servers so the caller's thread stays free.
 *
 * start() returns once the session has registered and bound its port, or with
 * the error that stopped it from doing so.
 */
class SessionHost {
public:
    explicit SessionHost(BackendFactory factory = {},
                         std::chrono::milliseconds lookup_timeout = Settings::DEFAULT_LOOKUP_TIMEOUT);

    [[nodiscard]] Result<std::unique_ptr<SessionHandle>> start(ServerConfig config) const;

    static void stop(SessionHandle& handle);

private:
    BackendFactory factory_;
    std::chrono::milliseconds lookup_timeout_;
};

} // namespace airshare::server
