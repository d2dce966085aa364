#ifndef PROPERTY_KEYS_H
#define PROPERTY_KEYS_H

#include <string>
#include <vector>
#include "wam_types.h"

/**
 * Field-name synonyms for speaker properties.
 * Firmware revisions report the same value under different names; each list
 * is consulted in order and the first non-empty value wins.
 */
namespace PropertyKeys {
    extern const std::vector<std::string> kName;
    extern const std::vector<std::string> kModel;
    extern const std::vector<std::string> kMac;
    extern const std::vector<std::string> kVersion;
    extern const std::vector<std::string> kPower;
    extern const std::vector<std::string> kVolume;
    extern const std::vector<std::string> kInput;

    extern const std::vector<std::string> kGroupId;
    extern const std::vector<std::string> kGroupName;
    extern const std::vector<std::string> kGroupedFlag;
}

struct PropertyLookup {
    bool found = false;
    std::string key;
    std::string value;

    static PropertyLookup notFound() { return PropertyLookup(); }
};

PropertyLookup findFirstProperty(const PropertyMap& props, const std::vector<std::string>& synonyms);

// Found value, or fallback when every synonym is missing or empty
std::string propertyOr(const PropertyMap& props, const std::vector<std::string>& synonyms,
                       const std::string& fallback);

// "1", "true", "yes", "on" (any case)
bool isTruthy(const std::string& value);

#endif // PROPERTY_KEYS_H
