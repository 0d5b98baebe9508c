#include "server/session_host.hpp"

#include "core/logging.hpp"

#include <QEventLoop>
#include <QThread>

#include <future>

namespace airshare::server {

SessionHandle::SessionHandle(std::unique_ptr<QThread> thread, ServiceRecord record, Role role)
    : thread_(std::move(thread))
    , record_(std::move(record))
    , role_(role)
{
}

SessionHandle::~SessionHandle() {
    stop();
}

void SessionHandle::stop() {
    if (!thread_) {
        return;
    }
    thread_->quit();
    thread_->wait();
    thread_.reset();
}

bool SessionHandle::is_running() const {
    return thread_ && thread_->isRunning();
}

SessionHost::SessionHost(BackendFactory factory, std::chrono::milliseconds lookup_timeout)
    : factory_(std::move(factory))
    , lookup_timeout_(lookup_timeout)
{
    if (!factory_) {
        factory_ = [] { return network::createDiscoveryBackend(); };
    }
}

Result<std::unique_ptr<SessionHandle>> SessionHost::start(ServerConfig config) const {
    using R = Result<std::unique_ptr<SessionHandle>>;

    // Fail fast on the caller's thread; no thread is spawned for a bad config.
    auto valid = validate_config(config);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }

    const Role role = config.role;
    const QString code = config.code;
    auto started = std::make_shared<std::promise<Result<ServiceRecord>>>();
    auto outcome = started->get_future();

    std::unique_ptr<QThread> thread(QThread::create(
        [config = std::move(config), factory = factory_, timeout = lookup_timeout_, started]() mutable {
            TransferServer server(std::move(config), factory(), timeout);
            auto result = server.start();
            const bool ok = result.is_ok();
            started->set_value(std::move(result));
            if (!ok) {
                return;
            }

            QEventLoop loop;
            loop.exec();  // until QThread::quit()
            server.stop();
        }));
    thread->setObjectName(QStringLiteral("airshare-%1").arg(code));
    thread->start();

    auto result = outcome.get();
    if (result.is_err()) {
        thread->wait();
        qCWarning(airshareServerLog) << "Session" << code << "failed to start:" << result.unwrap_err().message.c_str();
        return R::err(result.unwrap_err());
    }

    return R::ok(std::unique_ptr<SessionHandle>(
        new SessionHandle(std::move(thread), std::move(result).unwrap(), role)));
}

void SessionHost::stop(SessionHandle& handle) {
    handle.stop();
}

} // namespace airshare::server
