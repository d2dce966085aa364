#ifndef WAM_REGISTRY_H
#define WAM_REGISTRY_H

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "device_client.h"
#include "wam_groups.h"
#include "wam_types.h"

struct RegistryOptions {
    int settleDelayMs;          // Wait between transport connect and first state read
    uint16_t defaultPort;

    RegistryOptions();
};

/**
 * Devices currently under management, keyed by ip.
 *
 * All record and group mutations happen under registryMutex (lock order:
 * registry, then groups). Transport I/O for connect and refresh runs
 * outside the lock; a connect already in flight for an ip makes later
 * callers wait for its outcome instead of opening a second connection.
 */
class DeviceRegistry {
private:
    DeviceClient& client;
    GroupManager& groups;
    RegistryOptions options;

    mutable std::mutex registryMutex;
    std::condition_variable pendingChanged;
    std::set<std::string> pendingConnects;
    std::map<std::string, DeviceRecord> devices;

    DeviceSummary summarize(const DeviceRecord& record) const;

public:
    DeviceRegistry(DeviceClient& client, GroupManager& groups,
                   const RegistryOptions& options = RegistryOptions());
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Lifecycle
    WamError connect(const std::string& ip, uint16_t port, ConnectResult& result);
    WamError disconnectOne(const std::string& ip);
    void disconnectAll();

    // State
    WamError refreshState(const std::string& ip, PropertyMap& state);
    WamError snapshot(const std::string& ip, PropertyMap& state) const;
    WamError summary(const std::string& ip, DeviceSummary& out) const;
    WamError handleOf(const std::string& ip, ClientHandle& handle) const;

    std::vector<DeviceSummary> list() const;
    std::vector<std::string> connectedIps() const;
    bool contains(const std::string& ip) const;
    size_t count() const;

    GroupManager& groupManager() { return groups; }

    static DeviceInfo normalizeInfo(const std::string& ip, const PropertyMap& props);
};

#endif // WAM_REGISTRY_H
