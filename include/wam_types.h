#ifndef WAM_TYPES_H
#define WAM_TYPES_H

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// Property snapshot as reported by the speaker (field name -> value)
typedef std::map<std::string, std::string> PropertyMap;

// Opaque connection handle issued by a DeviceClient
typedef uint32_t ClientHandle;

// Error taxonomy shared by every module
enum class WamErrorCode {
    Ok,
    DiscoverySocketError,
    ParseSkipped,
    ConnectionError,
    NotFound,
    DeviceNotConnected,
    UnknownCommand,
    InvalidArgument,
    GroupNotFound,
    CommandError
};

const char* wamErrorName(WamErrorCode code);

struct WamError {
    WamErrorCode code = WamErrorCode::Ok;
    std::string ip;
    std::string cause;

    bool ok() const { return code == WamErrorCode::Ok; }

    static WamError success() { return WamError(); }
    static WamError make(WamErrorCode code, const std::string& ip, const std::string& cause) {
        WamError err;
        err.code = code;
        err.ip = ip;
        err.cause = cause;
        return err;
    }
};

// One advertisement (or fallback probe hit) as seen on the wire
struct DeviceDescriptor {
    std::string ip;
    uint16_t port = 0;
    std::string advertisedName;
    std::string advertisedModel;
};

struct DeviceRecord {
    std::string ip;
    uint16_t port = 0;
    ClientHandle clientHandle = 0;
    PropertyMap propertySnapshot;
    std::chrono::system_clock::time_point connectedAt;
};

struct DeviceSummary {
    std::string ip;
    std::string name;
    std::string model;
    bool isGrouped = false;
};

struct ConnectResult {
    bool alreadyConnected = false;
    uint16_t port = 0;
    DeviceSummary summary;
};

struct GroupRecord {
    std::string groupId;
    std::set<std::string> memberIps;
};

// Normalized identity/status fields for display
struct DeviceInfo {
    std::string name;
    std::string model;
    std::string mac;
    std::string version;
    std::string power;
    std::string volume;
    std::string input;
};

// Protocol call handed to the device client
struct ApiArg {
    std::string name;
    std::string value;
    std::string type;   // "str" or "dec"
};

struct ApiCall {
    std::string apiType;
    std::string method;
    std::vector<ApiArg> args;
    std::string expectedResponse;
    bool requiresPower = false;
    bool userCheck = false;
    int timeoutMultiple = 1;
};

struct CommandAck {
    std::string method;
    std::string response;
};

// Event pushed by a device client (protocol notifications, command replies)
struct DeviceEvent {
    std::string ip;
    std::string apiType;
    std::string method;
    bool success = true;
    std::string data;
    std::string errorMessage;
    std::string rawResponse;
};

struct MemberOutcome {
    std::string ip;
    WamError error;
    CommandAck ack;
};

struct GroupDispatchResult {
    std::string groupId;
    std::vector<MemberOutcome> results;
    int successCount = 0;
    int failCount = 0;
};

#endif // WAM_TYPES_H
