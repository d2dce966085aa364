/**
 * WAM Manager - facade over discovery, registry, groups and dispatch
 * Background command worker and event history
 */

#include "wam_manager.h"
#include "command_table.h"
#include "config.h"
#include "wam_json.h"
#include <algorithm>
#include <chrono>

WamManager::WamManager(DeviceClient& client, DiscoveryNetwork& network,
                       const DiscoveryOptions& discoveryOptions, const RegistryOptions& registryOptions)
    : client(client),
      registry(client, groups, registryOptions),
      dispatcher(client, registry),
      discovery(network, discoveryOptions),
      running(false) {
}

WamManager::~WamManager() {
    stopTasks();
    client.setEventReceiver(nullptr);
}

void WamManager::begin() {
    client.setEventReceiver([this](const DeviceEvent& event) { onClientEvent(event); });
    DEBUG_INFO("[WAM] Manager ready");
}

bool WamManager::fail(JsonDocument& out, const WamError& err) {
    out.clear();
    writeError(out, err);
    return false;
}

// ============================================================================
// Background command worker
// ============================================================================
void WamManager::startTasks() {
    if (running.exchange(true)) return;
    commandThread = std::thread(&WamManager::commandTaskFunction, this);
    DEBUG_INFO("[WAM] Background command task started");
}

void WamManager::stopTasks() {
    if (!running.exchange(false)) return;
    commandReady.notify_all();
    if (commandThread.joinable()) {
        commandThread.join();
    }

    std::lock_guard<std::mutex> lock(commandMutex);
    if (!commandQueue.empty()) {
        DEBUG_WARN("[WAM] Discarding %d queued command(s)", (int)commandQueue.size());
        commandQueue.clear();
    }
    DEBUG_INFO("[WAM] Background command task stopped");
}

bool WamManager::queueCommand(const std::string& target, const std::string& command,
                              const std::string& value, const std::string& mode) {
    if (mode != WAM_MODE_INDIVIDUAL && mode != WAM_MODE_GROUP) {
        DEBUG_WARN("[WAM] Unknown dispatch mode '%s'", mode.c_str());
        return false;
    }
    if (!running.load()) {
        DEBUG_WARN("[WAM] Command task not running, dropping %s", command.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(commandMutex);
    if (commandQueue.size() >= WAM_CMD_QUEUE_SIZE) {
        DEBUG_WARN("[WAM] Command queue full, dropping %s for %s", command.c_str(), target.c_str());
        return false;
    }
    CommandRequest request;
    request.target = target;
    request.command = command;
    request.value = value;
    request.groupMode = (mode == WAM_MODE_GROUP);
    commandQueue.push_back(request);
    commandReady.notify_one();
    return true;
}

void WamManager::commandTaskFunction() {
    while (running.load()) {
        CommandRequest request;
        {
            std::unique_lock<std::mutex> lock(commandMutex);
            commandReady.wait_for(lock, std::chrono::milliseconds(WAM_CMD_POLL_MS),
                                  [this]() { return !commandQueue.empty() || !running.load(); });
            if (commandQueue.empty()) continue;
            request = commandQueue.front();
            commandQueue.pop_front();
        }
        processCommand(request);
    }
}

void WamManager::processCommand(const CommandRequest& request) {
    const CommandSpec* spec = findCommand(request.command);

    DeviceEvent event;
    event.ip = request.target;
    event.apiType = spec ? spec->apiType : WAM_API_TYPE;
    event.method = spec ? spec->protocolMethod : request.command;

    if (request.groupMode) {
        GroupDispatchResult result;
        WamError err = dispatcher.dispatchToGroup(request.target, request.command, request.value, result);
        if (err.ok()) {
            event.success = (result.failCount == 0);
            event.data = std::to_string(result.successCount) + " of " +
                         std::to_string(result.results.size()) + " member(s) succeeded";
            if (!event.success) {
                event.errorMessage = std::to_string(result.failCount) + " member(s) failed";
            }
        } else {
            event.success = false;
            event.errorMessage = err.cause;
        }
    } else {
        CommandAck ack;
        WamError err = dispatcher.dispatchToDevice(request.target, request.command, request.value, ack);
        event.success = err.ok();
        if (err.ok()) {
            event.data = ack.response;
        } else {
            event.errorMessage = err.cause;
        }
    }

    recordEvent(event);
    hub.publishEvent(event);
}

// ============================================================================
// Events
// ============================================================================
void WamManager::recordEvent(const DeviceEvent& event) {
    std::lock_guard<std::mutex> lock(eventMutex);
    eventHistory.push_back(event);
    while (eventHistory.size() > WAM_EVENT_HISTORY_MAX) {
        eventHistory.pop_front();
    }
}

void WamManager::onClientEvent(const DeviceEvent& event) {
    DEBUG_VERBOSE("[WAM] Event from %s: %s.%s", event.ip.c_str(), event.apiType.c_str(), event.method.c_str());
    recordEvent(event);
    hub.publishEvent(event);
}

void WamManager::recentEvents(int limit, JsonDocument& out) const {
    limit = std::max(1, std::min(limit, (int)WAM_EVENT_HISTORY_MAX));

    out.clear();
    JsonArray events = out["events"].to<JsonArray>();

    std::lock_guard<std::mutex> lock(eventMutex);
    int emitted = 0;
    for (auto it = eventHistory.rbegin(); it != eventHistory.rend() && emitted < limit; ++it, ++emitted) {
        writeDeviceEvent(events.add<JsonObject>(), *it);
    }
}

size_t WamManager::eventCount() const {
    std::lock_guard<std::mutex> lock(eventMutex);
    return eventHistory.size();
}

void WamManager::status(JsonDocument& out) const {
    std::vector<std::string> ips = registry.connectedIps();
    out.clear();
    out["speakers_count"] = ips.size();
    JsonArray connected = out["connected_speakers"].to<JsonArray>();
    for (const std::string& ip : ips) {
        connected.add(ip);
    }
}

// ============================================================================
// Discovery
// ============================================================================
bool WamManager::discover(int timeoutSeconds, JsonDocument& out) {
    std::vector<DeviceDescriptor> found;
    WamError err = discovery.discover(timeoutSeconds, found);
    if (!err.ok()) return fail(out, err);

    out.clear();
    JsonArray speakers = out["speakers"].to<JsonArray>();
    for (const DeviceDescriptor& desc : found) {
        writeDescriptor(speakers.add<JsonObject>(), desc);
    }
    return true;
}

// ============================================================================
// Devices
// ============================================================================
bool WamManager::connectDevice(const std::string& ip, uint16_t port, JsonDocument& out) {
    ConnectResult result;
    WamError err = registry.connect(ip, port, result);
    if (!err.ok()) return fail(out, err);

    out.clear();
    out["status"] = result.alreadyConnected ? "already_connected" : "connected";
    out["ip"] = ip;
    out["port"] = result.port;
    out["model"] = result.summary.model;
    out["name"] = result.summary.name;
    out["isGroupMember"] = result.summary.isGrouped;

    if (!result.alreadyConnected) {
        PropertyMap props;
        if (registry.snapshot(ip, props).ok()) {
            hub.publishPropertyUpdate(ip, props);
        }
    }
    return true;
}

bool WamManager::getDeviceProperties(const std::string& ip, JsonDocument& out) {
    PropertyMap props;
    WamError err = registry.snapshot(ip, props);
    if (!err.ok()) return fail(out, err);

    out.clear();
    writeProperties(out["properties"].to<JsonObject>(), props);
    return true;
}

bool WamManager::getDeviceInfo(const std::string& ip, JsonDocument& out) {
    PropertyMap props;
    WamError err = registry.snapshot(ip, props);
    if (!err.ok()) return fail(out, err);

    out.clear();
    writeInfo(out["info"].to<JsonObject>(), DeviceRegistry::normalizeInfo(ip, props));
    return true;
}

bool WamManager::refreshDevice(const std::string& ip, JsonDocument& out) {
    PropertyMap props;
    WamError err = registry.refreshState(ip, props);
    if (!err.ok()) return fail(out, err);

    out.clear();
    writeProperties(out["properties"].to<JsonObject>(), props);
    hub.publishPropertyUpdate(ip, props);
    return true;
}

bool WamManager::disconnectDevice(const std::string& ip, JsonDocument& out) {
    WamError err = registry.disconnectOne(ip);
    if (!err.ok()) return fail(out, err);

    out.clear();
    out["status"] = "disconnected";
    out["ip"] = ip;
    return true;
}

void WamManager::disconnectAll(JsonDocument& out) {
    size_t before = registry.count();
    registry.disconnectAll();
    out.clear();
    out["status"] = "disconnected";
    out["count"] = before;
}

void WamManager::listDevices(JsonDocument& out) {
    out.clear();
    JsonArray devices = out["devices"].to<JsonArray>();
    for (const DeviceSummary& summary : registry.list()) {
        writeSummary(devices.add<JsonObject>(), summary);
    }
}

void WamManager::listGroups(JsonDocument& out) {
    out.clear();
    JsonArray list = out["groups"].to<JsonArray>();
    for (const GroupRecord& group : groups.allGroups()) {
        writeGroup(list.add<JsonObject>(), group);
    }
}

// ============================================================================
// Commands
// ============================================================================
bool WamManager::dispatchCommand(const std::string& target, const std::string& command,
                                 const std::string& value, const std::string& mode, JsonDocument& out) {
    if (mode == WAM_MODE_GROUP) {
        GroupDispatchResult result;
        WamError err = dispatcher.dispatchToGroup(target, command, value, result);
        if (!err.ok()) return fail(out, err);

        out.clear();
        out["command"] = command;
        out["value"] = value;
        writeGroupResult(out.as<JsonObject>(), result);
        return true;
    }

    if (mode != WAM_MODE_INDIVIDUAL) {
        return fail(out, WamError::make(WamErrorCode::InvalidArgument, target,
                                        "unknown dispatch mode '" + mode + "'"));
    }

    CommandAck ack;
    WamError err = dispatcher.dispatchToDevice(target, command, value, ack);
    if (!err.ok()) return fail(out, err);

    out.clear();
    out["status"] = "command_sent";
    out["ip"] = target;
    out["command"] = command;
    out["value"] = value;
    return true;
}

bool WamManager::sendApiCall(const std::string& ip, const ApiCall& call, JsonDocument& out) {
    WamError err = validateApiCall(call);
    if (!err.ok()) {
        DEBUG_WARN("[WAM] Rejected api call for %s: %s", ip.c_str(), err.cause.c_str());
        err.ip = ip;
        return fail(out, err);
    }

    CommandAck ack;
    err = dispatcher.dispatchApiCall(ip, call, ack);
    if (err.code == WamErrorCode::DeviceNotConnected) return fail(out, err);

    DeviceEvent event;
    event.ip = ip;
    event.apiType = call.apiType;
    event.method = call.method;
    event.success = err.ok();
    if (err.ok()) {
        event.data = ack.response;
    } else {
        event.errorMessage = err.cause;
    }
    recordEvent(event);
    hub.publishEvent(event);

    if (!err.ok()) return fail(out, err);

    out.clear();
    out["status"] = "sent";
    out["ip"] = ip;
    out["api_type"] = call.apiType;
    out["method"] = call.method;
    out["response"] = ack.response;
    return true;
}
