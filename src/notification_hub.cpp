/**
 * Notification hub - pushes events and property updates to listeners
 */

#include "notification_hub.h"
#include "wam_json.h"
#include <algorithm>
#include <chrono>

// ============================================================================
// QueuedSink
// ============================================================================
QueuedSink::QueuedSink(size_t capacity)
    : capacity(capacity), droppedCount(0), closed(false) {
}

bool QueuedSink::deliver(const std::string& message) {
    std::lock_guard<std::mutex> lock(queueMutex);
    if (closed) return false;

    if (queue.size() >= capacity) {
        droppedCount++;
        DEBUG_VERBOSE("[NOTIFY] Listener queue full, dropping message (%d dropped)", (int)droppedCount);
        return true;
    }
    queue.push_back(message);
    queueChanged.notify_one();
    return true;
}

bool QueuedSink::poll(std::string& message, int timeoutMs) {
    std::unique_lock<std::mutex> lock(queueMutex);
    queueChanged.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                          [this]() { return !queue.empty() || closed; });
    if (queue.empty()) return false;

    message = queue.front();
    queue.pop_front();
    return true;
}

void QueuedSink::close() {
    std::lock_guard<std::mutex> lock(queueMutex);
    closed = true;
    queueChanged.notify_all();
}

bool QueuedSink::isClosed() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return closed;
}

size_t QueuedSink::pending() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return queue.size();
}

size_t QueuedSink::dropped() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return droppedCount;
}

// ============================================================================
// NotificationHub
// ============================================================================
void NotificationHub::addListener(const std::shared_ptr<NotificationSink>& sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(listenerMutex);
    if (std::find(listeners.begin(), listeners.end(), sink) != listeners.end()) return;
    listeners.push_back(sink);
    DEBUG_INFO("[NOTIFY] Listener added (%d total)", (int)listeners.size());
}

void NotificationHub::removeListener(const std::shared_ptr<NotificationSink>& sink) {
    std::lock_guard<std::mutex> lock(listenerMutex);
    auto it = std::find(listeners.begin(), listeners.end(), sink);
    if (it == listeners.end()) return;
    listeners.erase(it);
    DEBUG_INFO("[NOTIFY] Listener removed (%d left)", (int)listeners.size());
}

size_t NotificationHub::listenerCount() const {
    std::lock_guard<std::mutex> lock(listenerMutex);
    return listeners.size();
}

int NotificationHub::publish(const char* type, JsonVariantConst payload) {
    JsonDocument doc;
    doc["type"] = type;
    doc["payload"] = payload;
    std::string message = toJsonString(doc);

    std::vector<std::shared_ptr<NotificationSink>> current;
    {
        std::lock_guard<std::mutex> lock(listenerMutex);
        current = listeners;
    }

    // Delivery happens outside the lock; failures are removed after the pass
    int delivered = 0;
    std::vector<std::shared_ptr<NotificationSink>> gone;
    for (const auto& sink : current) {
        if (sink->deliver(message)) {
            delivered++;
        } else {
            gone.push_back(sink);
        }
    }

    for (const auto& sink : gone) {
        DEBUG_WARN("[NOTIFY] Dropping disconnected listener");
        removeListener(sink);
    }

    DEBUG_VERBOSE("[NOTIFY] Published '%s' to %d listener(s)", type, delivered);
    return delivered;
}

int NotificationHub::publishEvent(const DeviceEvent& event) {
    JsonDocument payload;
    writeDeviceEvent(payload.to<JsonObject>(), event);
    return publish("event", payload.as<JsonVariantConst>());
}

int NotificationHub::publishPropertyUpdate(const std::string& ip, const PropertyMap& properties) {
    JsonDocument payload;
    payload["ip"] = ip;
    writeProperties(payload["properties"].to<JsonObject>(), properties);
    return publish("property_update", payload.as<JsonVariantConst>());
}
