#ifndef WAM_JSON_H
#define WAM_JSON_H

#include <ArduinoJson.h>
#include <string>
#include <vector>
#include "wam_types.h"

// JSON renderings shared by the manager facade and the notification hub
void writeProperties(JsonObject obj, const PropertyMap& props);
void writeDescriptor(JsonObject obj, const DeviceDescriptor& desc);
void writeSummary(JsonObject obj, const DeviceSummary& summary);
void writeGroup(JsonObject obj, const GroupRecord& group);
void writeDeviceEvent(JsonObject obj, const DeviceEvent& event);
void writeInfo(JsonObject obj, const DeviceInfo& info);
void writeGroupResult(JsonObject obj, const GroupDispatchResult& result);

// {"error": <code name>, "ip": ..., "detail": ...}
void writeError(JsonDocument& doc, const WamError& err);

std::string toJsonString(const JsonDocument& doc);

#endif // WAM_JSON_H
