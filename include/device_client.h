#ifndef DEVICE_CLIENT_H
#define DEVICE_CLIENT_H

#include <functional>
#include <string>
#include "wam_types.h"

typedef std::function<void(const DeviceEvent&)> DeviceEventReceiver;

/**
 * Transport connection to speakers, one handle per device.
 * Implementations own the socket, the vendor request/response framing and
 * any retry policy. Every method may be called from several threads at once
 * for distinct handles.
 */
class DeviceClient {
public:
    virtual ~DeviceClient() {}

    virtual WamError connect(const std::string& ip, uint16_t port, ClientHandle& handle) = 0;
    virtual void disconnect(ClientHandle handle) = 0;
    virtual WamError sendCommand(ClientHandle handle, const ApiCall& call, CommandAck& ack) = 0;
    virtual WamError fetchState(ClientHandle handle, PropertyMap& state) = 0;

    // Protocol events for all handles are delivered here (may be called on a client thread)
    virtual void setEventReceiver(DeviceEventReceiver receiver) = 0;
};

#endif // DEVICE_CLIENT_H
