/**
 * Command dispatch - logical commands to UIC protocol calls
 * Group commands fan out to every member concurrently
 */

#include "command_dispatcher.h"
#include "config.h"
#include <exception>
#include <future>
#include <system_error>
#include <vector>

CommandDispatcher::CommandDispatcher(DeviceClient& client, DeviceRegistry& registry)
    : client(client), registry(registry) {
}

WamError CommandDispatcher::dispatchToDevice(const std::string& ip, const std::string& logicalCommand,
                                             const std::string& value, CommandAck& ack) {
    const CommandSpec* spec = findCommand(logicalCommand);
    if (!spec) {
        DEBUG_WARN("[CMD] Unknown command '%s' for %s", logicalCommand.c_str(), ip.c_str());
        return WamError::make(WamErrorCode::UnknownCommand, ip, "unknown command '" + logicalCommand + "'");
    }

    ApiCall call;
    WamError err = buildApiCall(*spec, value, call);
    if (!err.ok()) {
        DEBUG_WARN("[CMD] Rejected %s for %s: %s", logicalCommand.c_str(), ip.c_str(), err.cause.c_str());
        err.ip = ip;
        return err;
    }

    return dispatchApiCall(ip, call, ack);
}

WamError CommandDispatcher::dispatchApiCall(const std::string& ip, const ApiCall& call, CommandAck& ack) {
    ClientHandle handle = 0;
    WamError err = registry.handleOf(ip, handle);
    if (!err.ok()) {
        DEBUG_WARN("[CMD] %s is not connected, dropping %s", ip.c_str(), call.method.c_str());
        return err;
    }

    DEBUG_INFO("[CMD] %s -> %s.%s (%d arg(s))",
               ip.c_str(), call.apiType.c_str(), call.method.c_str(), (int)call.args.size());

    err = client.sendCommand(handle, call, ack);
    if (!err.ok()) {
        DEBUG_ERROR("[CMD] %s.%s failed on %s: %s",
                    call.apiType.c_str(), call.method.c_str(), ip.c_str(), err.cause.c_str());
        if (err.ip.empty()) err.ip = ip;
    }
    return err;
}

WamError CommandDispatcher::dispatchToGroup(const std::string& anyMemberIp, const std::string& logicalCommand,
                                            const std::string& value, GroupDispatchResult& result) {
    GroupManager& groups = registry.groupManager();
    std::optional<std::string> groupId = groups.groupOf(anyMemberIp);
    if (!groupId) {
        DEBUG_WARN("[CMD] %s is not a member of any group", anyMemberIp.c_str());
        return WamError::make(WamErrorCode::GroupNotFound, anyMemberIp, "device is not in a group");
    }

    std::set<std::string> members = groups.members(*groupId);
    DEBUG_INFO("[CMD] Group '%s': sending %s to %d member(s)",
               groupId->c_str(), logicalCommand.c_str(), (int)members.size());

    // One task per member so a slow speaker does not delay the others
    std::vector<std::string> launched;
    std::vector<std::future<MemberOutcome>> pending;
    GroupDispatchResult aggregate;
    aggregate.groupId = *groupId;
    for (const std::string& ip : members) {
        try {
            pending.push_back(std::async(std::launch::async, [this, ip, logicalCommand, value]() {
                MemberOutcome outcome;
                outcome.ip = ip;
                outcome.error = dispatchToDevice(ip, logicalCommand, value, outcome.ack);
                return outcome;
            }));
            launched.push_back(ip);
        } catch (const std::system_error& e) {
            DEBUG_ERROR("[CMD] Could not start task for %s: %s", ip.c_str(), e.what());
            MemberOutcome outcome;
            outcome.ip = ip;
            outcome.error = WamError::make(WamErrorCode::CommandError, ip, e.what());
            aggregate.failCount++;
            aggregate.results.push_back(outcome);
        }
    }

    for (size_t i = 0; i < pending.size(); i++) {
        MemberOutcome outcome;
        try {
            outcome = pending[i].get();
        } catch (const std::exception& e) {
            DEBUG_ERROR("[CMD] %s raised during %s: %s", launched[i].c_str(), logicalCommand.c_str(), e.what());
            outcome = MemberOutcome();
            outcome.ip = launched[i];
            outcome.error = WamError::make(WamErrorCode::CommandError, launched[i], e.what());
        }
        if (outcome.error.ok()) {
            aggregate.successCount++;
        } else {
            aggregate.failCount++;
        }
        aggregate.results.push_back(outcome);
    }

    DEBUG_INFO("[CMD] Group '%s' %s: %d succeeded, %d failed",
               groupId->c_str(), logicalCommand.c_str(), aggregate.successCount, aggregate.failCount);
    result = aggregate;
    return WamError::success();
}
