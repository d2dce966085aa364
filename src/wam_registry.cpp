/**
 * Device registry - connected speakers and their property snapshots
 */

#include "wam_registry.h"
#include "config.h"
#include "property_keys.h"
#include "response_parser.h"
#include <chrono>
#include <thread>

RegistryOptions::RegistryOptions()
    : settleDelayMs(WAM_SETTLE_DELAY_MS),
      defaultPort(WAM_DEFAULT_API_PORT) {
}

DeviceRegistry::DeviceRegistry(DeviceClient& client, GroupManager& groups, const RegistryOptions& options)
    : client(client), groups(groups), options(options) {
    DEBUG_INFO("[REGISTRY] Device registry initialized (settle delay %d ms)", options.settleDelayMs);
}

DeviceRegistry::~DeviceRegistry() {
    disconnectAll();
}

DeviceSummary DeviceRegistry::summarize(const DeviceRecord& record) const {
    DeviceSummary summary;
    summary.ip = record.ip;
    summary.name = propertyOr(record.propertySnapshot, PropertyKeys::kName, placeholderName(record.ip));
    summary.model = propertyOr(record.propertySnapshot, PropertyKeys::kModel, placeholderModel());
    summary.isGrouped = groups.isGrouped(record.ip);
    return summary;
}

DeviceInfo DeviceRegistry::normalizeInfo(const std::string& ip, const PropertyMap& props) {
    DeviceInfo info;
    info.name = propertyOr(props, PropertyKeys::kName, placeholderName(ip));
    info.model = propertyOr(props, PropertyKeys::kModel, placeholderModel());
    info.mac = propertyOr(props, PropertyKeys::kMac, "Unknown");
    info.version = propertyOr(props, PropertyKeys::kVersion, "Unknown");
    info.power = propertyOr(props, PropertyKeys::kPower, "Unknown");
    info.volume = propertyOr(props, PropertyKeys::kVolume, "Unknown");
    info.input = propertyOr(props, PropertyKeys::kInput, "Unknown");
    return info;
}

// ============================================================================
// Connect / Disconnect
// ============================================================================
WamError DeviceRegistry::connect(const std::string& ip, uint16_t port, ConnectResult& result) {
    if (port == 0) port = options.defaultPort;

    {
        std::unique_lock<std::mutex> lock(registryMutex);
        pendingChanged.wait(lock, [&]() { return pendingConnects.count(ip) == 0; });

        auto it = devices.find(ip);
        if (it != devices.end()) {
            result.alreadyConnected = true;
            result.port = it->second.port;
            result.summary = summarize(it->second);
            DEBUG_INFO("[REGISTRY] %s already connected, reusing existing connection", ip.c_str());
            return WamError::success();
        }
        pendingConnects.insert(ip);
    }

    DEBUG_INFO("[REGISTRY] Connecting to %s:%u...", ip.c_str(), port);

    ClientHandle handle = 0;
    PropertyMap state;
    WamError err = client.connect(ip, port, handle);
    if (err.ok()) {
        if (options.settleDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options.settleDelayMs));
        }
        err = client.fetchState(handle, state);
        if (!err.ok()) {
            // No partial record: drop the transport connection again
            client.disconnect(handle);
        }
    }

    std::lock_guard<std::mutex> lock(registryMutex);
    pendingConnects.erase(ip);
    pendingChanged.notify_all();

    if (!err.ok()) {
        DEBUG_ERROR("[REGISTRY] Connection to %s failed: %s", ip.c_str(), err.cause.c_str());
        return WamError::make(WamErrorCode::ConnectionError, ip,
                              err.cause.empty() ? wamErrorName(err.code) : err.cause);
    }

    DeviceRecord record;
    record.ip = ip;
    record.port = port;
    record.clientHandle = handle;
    record.propertySnapshot = state;
    record.connectedAt = std::chrono::system_clock::now();
    devices[ip] = record;

    groups.deriveGroup(ip, state);

    result.alreadyConnected = false;
    result.port = port;
    result.summary = summarize(record);
    DEBUG_INFO("[REGISTRY] Connected %s ('%s', %d properties)",
               ip.c_str(), result.summary.name.c_str(), (int)state.size());
    return WamError::success();
}

WamError DeviceRegistry::disconnectOne(const std::string& ip) {
    ClientHandle handle = 0;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = devices.find(ip);
        if (it == devices.end()) {
            return WamError::make(WamErrorCode::NotFound, ip, "device not connected");
        }
        handle = it->second.clientHandle;
        devices.erase(it);
        groups.removeMember(ip);
    }

    // Teardown may block on the speaker; never under registryMutex
    client.disconnect(handle);
    DEBUG_INFO("[REGISTRY] Disconnected %s", ip.c_str());
    return WamError::success();
}

void DeviceRegistry::disconnectAll() {
    std::vector<ClientHandle> handles;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        for (const auto& entry : devices) {
            handles.push_back(entry.second.clientHandle);
        }
        devices.clear();
        groups.clear();
    }

    for (ClientHandle handle : handles) {
        client.disconnect(handle);
    }
    if (!handles.empty()) {
        DEBUG_INFO("[REGISTRY] Disconnected all %d device(s)", (int)handles.size());
    }
}

// ============================================================================
// State
// ============================================================================
WamError DeviceRegistry::refreshState(const std::string& ip, PropertyMap& state) {
    ClientHandle handle = 0;
    WamError err = handleOf(ip, handle);
    if (!err.ok()) {
        return WamError::make(WamErrorCode::NotFound, ip, "device not connected");
    }

    PropertyMap fresh;
    err = client.fetchState(handle, fresh);
    if (!err.ok()) {
        DEBUG_WARN("[REGISTRY] State refresh for %s failed: %s", ip.c_str(), err.cause.c_str());
        if (err.ip.empty()) err.ip = ip;
        return err;
    }

    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = devices.find(ip);
    if (it == devices.end() || it->second.clientHandle != handle) {
        // Disconnected (or reconnected) while the read was in flight
        return WamError::make(WamErrorCode::NotFound, ip, "device disconnected during refresh");
    }
    it->second.propertySnapshot = fresh;
    state = fresh;
    DEBUG_VERBOSE("[REGISTRY] Refreshed %s (%d properties)", ip.c_str(), (int)fresh.size());
    return WamError::success();
}

WamError DeviceRegistry::snapshot(const std::string& ip, PropertyMap& state) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = devices.find(ip);
    if (it == devices.end()) {
        return WamError::make(WamErrorCode::NotFound, ip, "device not connected");
    }
    state = it->second.propertySnapshot;
    return WamError::success();
}

WamError DeviceRegistry::summary(const std::string& ip, DeviceSummary& out) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = devices.find(ip);
    if (it == devices.end()) {
        return WamError::make(WamErrorCode::NotFound, ip, "device not connected");
    }
    out = summarize(it->second);
    return WamError::success();
}

WamError DeviceRegistry::handleOf(const std::string& ip, ClientHandle& handle) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = devices.find(ip);
    if (it == devices.end()) {
        return WamError::make(WamErrorCode::DeviceNotConnected, ip, "device not connected");
    }
    handle = it->second.clientHandle;
    return WamError::success();
}

std::vector<DeviceSummary> DeviceRegistry::list() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    std::vector<DeviceSummary> out;
    out.reserve(devices.size());
    for (const auto& entry : devices) {
        out.push_back(summarize(entry.second));
    }
    return out;
}

std::vector<std::string> DeviceRegistry::connectedIps() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    std::vector<std::string> out;
    for (const auto& entry : devices) out.push_back(entry.first);
    return out;
}

bool DeviceRegistry::contains(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return devices.count(ip) > 0;
}

size_t DeviceRegistry::count() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return devices.size();
}
