#ifndef WAM_MANAGER_H
#define WAM_MANAGER_H

#include <ArduinoJson.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "command_dispatcher.h"
#include "device_client.h"
#include "notification_hub.h"
#include "wam_discovery.h"
#include "wam_groups.h"
#include "wam_registry.h"
#include "wam_types.h"

#define WAM_MODE_INDIVIDUAL     "individual"
#define WAM_MODE_GROUP          "group"

// Command handed to the background worker
struct CommandRequest {
    std::string target;         // Device ip (any member ip in group mode)
    std::string command;        // Logical command name
    std::string value;
    bool groupMode = false;
};

/**
 * Front door for transports (CLI, HTTP, WebSocket bridges).
 *
 * Owns the registry, group state, dispatcher and notification hub for one
 * DeviceClient. Every call fills a JSON document: the result on success, an
 * {"error", "ip", "detail"} object on failure (and returns false).
 */
class WamManager {
private:
    DeviceClient& client;
    GroupManager groups;
    DeviceRegistry registry;
    CommandDispatcher dispatcher;
    DiscoveryEngine discovery;
    NotificationHub hub;

    // Event history (oldest first)
    mutable std::mutex eventMutex;
    std::deque<DeviceEvent> eventHistory;

    // Command worker
    std::mutex commandMutex;
    std::condition_variable commandReady;
    std::deque<CommandRequest> commandQueue;
    std::thread commandThread;
    std::atomic<bool> running;

    void recordEvent(const DeviceEvent& event);
    void onClientEvent(const DeviceEvent& event);

    void commandTaskFunction();
    void processCommand(const CommandRequest& request);

    bool fail(JsonDocument& out, const WamError& err);

public:
    WamManager(DeviceClient& client, DiscoveryNetwork& network,
               const DiscoveryOptions& discoveryOptions = DiscoveryOptions(),
               const RegistryOptions& registryOptions = RegistryOptions());
    ~WamManager();

    WamManager(const WamManager&) = delete;
    WamManager& operator=(const WamManager&) = delete;

    // Lifecycle
    void begin();
    void startTasks();
    void stopTasks();
    bool tasksRunning() const { return running.load(); }

    // Discovery
    bool discover(int timeoutSeconds, JsonDocument& out);

    // Devices
    bool connectDevice(const std::string& ip, uint16_t port, JsonDocument& out);
    bool getDeviceProperties(const std::string& ip, JsonDocument& out);
    bool getDeviceInfo(const std::string& ip, JsonDocument& out);
    bool refreshDevice(const std::string& ip, JsonDocument& out);
    bool disconnectDevice(const std::string& ip, JsonDocument& out);
    void disconnectAll(JsonDocument& out);
    void listDevices(JsonDocument& out);
    void listGroups(JsonDocument& out);

    // Commands
    bool dispatchCommand(const std::string& target, const std::string& command,
                         const std::string& value, const std::string& mode, JsonDocument& out);

    // Caller-built protocol call; the outcome is recorded and published as an event
    bool sendApiCall(const std::string& ip, const ApiCall& call, JsonDocument& out);

    // Non-blocking; false when the queue is full or the worker is stopped
    bool queueCommand(const std::string& target, const std::string& command,
                      const std::string& value, const std::string& mode);

    // Events and status
    void recentEvents(int limit, JsonDocument& out) const;
    size_t eventCount() const;
    void status(JsonDocument& out) const;

    NotificationHub& notifications() { return hub; }
    DeviceRegistry& getRegistry() { return registry; }
    GroupManager& getGroups() { return groups; }
};

#endif // WAM_MANAGER_H
