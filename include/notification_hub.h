#ifndef NOTIFICATION_HUB_H
#define NOTIFICATION_HUB_H

#include <ArduinoJson.h>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config.h"
#include "wam_types.h"

// Push channel to one external listener
class NotificationSink {
public:
    virtual ~NotificationSink() {}

    // false = listener is gone and should be dropped
    virtual bool deliver(const std::string& message) = 0;
};

/**
 * Bounded, non-blocking listener queue. deliver() never waits: when the
 * queue is full the new message is dropped. The consumer drains with poll().
 */
class QueuedSink : public NotificationSink {
private:
    mutable std::mutex queueMutex;
    std::condition_variable queueChanged;
    std::deque<std::string> queue;
    size_t capacity;
    size_t droppedCount;
    bool closed;

public:
    explicit QueuedSink(size_t capacity = WAM_NOTIFY_QUEUE_SIZE);

    bool deliver(const std::string& message) override;

    // Waits up to timeoutMs for a message; false on timeout or when closed and empty
    bool poll(std::string& message, int timeoutMs);

    // Further deliver() calls fail, so the hub drops this listener
    void close();

    bool isClosed() const;
    size_t pending() const;
    size_t dropped() const;
};

class NotificationHub {
private:
    mutable std::mutex listenerMutex;
    std::vector<std::shared_ptr<NotificationSink>> listeners;

public:
    NotificationHub() {}

    void addListener(const std::shared_ptr<NotificationSink>& sink);
    void removeListener(const std::shared_ptr<NotificationSink>& sink);
    size_t listenerCount() const;

    // Sends {"type": type, "payload": payload} to every listener. Returns the
    // number of listeners that accepted it; failed ones are removed.
    int publish(const char* type, JsonVariantConst payload);

    int publishEvent(const DeviceEvent& event);
    int publishPropertyUpdate(const std::string& ip, const PropertyMap& properties);
};

#endif // NOTIFICATION_HUB_H
