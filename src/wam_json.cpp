#include "wam_json.h"

void writeProperties(JsonObject obj, const PropertyMap& props) {
    for (const auto& entry : props) {
        obj[entry.first] = entry.second;
    }
}

void writeDescriptor(JsonObject obj, const DeviceDescriptor& desc) {
    obj["ip"] = desc.ip;
    obj["port"] = std::to_string(desc.port);
    obj["name"] = desc.advertisedName;
    obj["model"] = desc.advertisedModel;
}

void writeSummary(JsonObject obj, const DeviceSummary& summary) {
    obj["ip"] = summary.ip;
    obj["name"] = summary.name;
    obj["model"] = summary.model;
    obj["isGrouped"] = summary.isGrouped;
}

void writeGroup(JsonObject obj, const GroupRecord& group) {
    obj["groupId"] = group.groupId;
    JsonArray members = obj["members"].to<JsonArray>();
    for (const std::string& ip : group.memberIps) {
        members.add(ip);
    }
}

void writeDeviceEvent(JsonObject obj, const DeviceEvent& event) {
    obj["speaker_ip"] = event.ip;
    obj["api_type"] = event.apiType;
    obj["method"] = event.method;
    obj["success"] = event.success;
    obj["data"] = event.data;
    obj["err_msg"] = event.errorMessage;
    obj["raw_response"] = event.rawResponse;
}

void writeInfo(JsonObject obj, const DeviceInfo& info) {
    obj["name"] = info.name;
    obj["model"] = info.model;
    obj["mac"] = info.mac;
    obj["version"] = info.version;
    obj["power"] = info.power;
    obj["volume"] = info.volume;
    obj["input"] = info.input;
}

void writeGroupResult(JsonObject obj, const GroupDispatchResult& result) {
    obj["groupId"] = result.groupId;
    JsonArray results = obj["results"].to<JsonArray>();
    for (const MemberOutcome& outcome : result.results) {
        JsonObject entry = results.add<JsonObject>();
        entry["ip"] = outcome.ip;
        entry["status"] = outcome.error.ok() ? "ok" : "failed";
        if (!outcome.error.ok()) {
            entry["error"] = wamErrorName(outcome.error.code);
            entry["detail"] = outcome.error.cause;
        }
    }
    obj["successCount"] = result.successCount;
    obj["failCount"] = result.failCount;
}

void writeError(JsonDocument& doc, const WamError& err) {
    doc["error"] = wamErrorName(err.code);
    doc["ip"] = err.ip;
    doc["detail"] = err.cause;
}

std::string toJsonString(const JsonDocument& doc) {
    std::string out;
    serializeJson(doc, out);
    return out;
}
