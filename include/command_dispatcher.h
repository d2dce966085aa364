#ifndef COMMAND_DISPATCHER_H
#define COMMAND_DISPATCHER_H

#include <string>
#include "command_table.h"
#include "device_client.h"
#include "wam_registry.h"
#include "wam_types.h"

class CommandDispatcher {
private:
    DeviceClient& client;
    DeviceRegistry& registry;

public:
    CommandDispatcher(DeviceClient& client, DeviceRegistry& registry);

    // Single device; client errors come back unchanged (no retry here)
    WamError dispatchToDevice(const std::string& ip, const std::string& logicalCommand,
                              const std::string& value, CommandAck& ack);

    // Already-built call to a connected device
    WamError dispatchApiCall(const std::string& ip, const ApiCall& call, CommandAck& ack);

    // Every member of anyMemberIp's group, concurrently. Member failures are
    // reported in result; only GroupNotFound is returned as an error.
    WamError dispatchToGroup(const std::string& anyMemberIp, const std::string& logicalCommand,
                             const std::string& value, GroupDispatchResult& result);
};

#endif // COMMAND_DISPATCHER_H
