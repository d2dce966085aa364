#include "property_keys.h"
#include "response_parser.h"

namespace PropertyKeys {
    // Preferred field first, legacy aliases after
    const std::vector<std::string> kName = {"friendlyName", "name", "spkname", "modelName"};
    const std::vector<std::string> kModel = {"model", "modelName", "modelname"};
    const std::vector<std::string> kMac = {"mac", "macAddress", "spkmacaddr"};
    const std::vector<std::string> kVersion = {"version", "swVersion", "firmware"};
    const std::vector<std::string> kPower = {"power", "powerStatus"};
    const std::vector<std::string> kVolume = {"volume", "nVolume", "volumelevel"};
    const std::vector<std::string> kInput = {"input", "source", "strSource", "function"};

    const std::vector<std::string> kGroupId = {"groupId", "group_id", "groupid"};
    const std::vector<std::string> kGroupName = {"groupName", "group_name", "groupname"};
    const std::vector<std::string> kGroupedFlag = {"grouped", "isGrouped", "is_grouped"};
}

PropertyLookup findFirstProperty(const PropertyMap& props, const std::vector<std::string>& synonyms) {
    for (const std::string& key : synonyms) {
        PropertyMap::const_iterator it = props.find(key);
        if (it == props.end()) continue;
        std::string value = trimCopy(it->second);
        if (value.empty()) continue;

        PropertyLookup result;
        result.found = true;
        result.key = key;
        result.value = value;
        return result;
    }
    return PropertyLookup::notFound();
}

std::string propertyOr(const PropertyMap& props, const std::vector<std::string>& synonyms,
                       const std::string& fallback) {
    PropertyLookup lookup = findFirstProperty(props, synonyms);
    return lookup.found ? lookup.value : fallback;
}

bool isTruthy(const std::string& value) {
    std::string lower = toLowerAscii(trimCopy(value));
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}
