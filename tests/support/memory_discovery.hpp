#pragma once

#include "network/discovery.hpp"

#include <QHash>
#include <QList>

#include <atomic>
#include <memory>
#include <mutex>

namespace airshare::testing {

/**
 * Shared "network" for MemoryDiscoveryBackend instances. Every backend created
 * from the same directory sees the others' records, across threads.
 */
class MemoryDirectory {
public:
    std::mutex mu;
    QHash<QString, ServiceRecord> records;
    std::atomic<int> resolve_calls{0};
    std::atomic<int> publish_calls{0};
};

/**
 * In-process DiscoveryBackend for tests: no sockets, answers instantly.
 */
class MemoryDiscoveryBackend : public network::DiscoveryBackend {
public:
    explicit MemoryDiscoveryBackend(std::shared_ptr<MemoryDirectory> directory);
    ~MemoryDiscoveryBackend() override;

    Result<void, Error> start() override;
    void stop() override;
    Result<void, Error> publish(const ServiceRecord& record) override;
    void unpublish(const QString& name) override;
    Result<std::optional<ServiceRecord>, Error> resolve(const QString& name,
                                                        std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<MemoryDirectory> directory_;
    QList<QString> mine_;
    bool started_ = false;
};

} // namespace airshare::testing
