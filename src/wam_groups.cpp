/**
 * Group membership derived from speaker property snapshots
 */

#include "wam_groups.h"
#include "config.h"
#include "property_keys.h"

std::optional<std::string> GroupManager::groupIdFromSnapshot(const PropertyMap& snapshot) {
    PropertyLookup id = findFirstProperty(snapshot, PropertyKeys::kGroupId);
    if (id.found) return id.value;

    PropertyLookup name = findFirstProperty(snapshot, PropertyKeys::kGroupName);
    if (name.found) return "name:" + name.value;

    PropertyLookup flag = findFirstProperty(snapshot, PropertyKeys::kGroupedFlag);
    if (flag.found && isTruthy(flag.value)) return std::string(WAM_FLAG_ONLY_GROUP_ID);

    return std::nullopt;
}

std::optional<std::string> GroupManager::deriveGroup(const std::string& ip, const PropertyMap& snapshot) {
    std::optional<std::string> groupId = groupIdFromSnapshot(snapshot);
    if (!groupId) {
        DEBUG_VERBOSE("[GROUP] %s reports no group fields", ip.c_str());
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(groupMutex);
    bool inserted = groups[*groupId].insert(ip).second;
    if (inserted) {
        DEBUG_INFO("[GROUP] %s joined group '%s' (%d member(s))",
                   ip.c_str(), groupId->c_str(), (int)groups[*groupId].size());
    }
    return groupId;
}

std::optional<std::string> GroupManager::groupOf(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(groupMutex);
    for (const auto& entry : groups) {
        if (entry.second.count(ip)) return entry.first;
    }
    return std::nullopt;
}

std::set<std::string> GroupManager::members(const std::string& groupId) const {
    std::lock_guard<std::mutex> lock(groupMutex);
    auto it = groups.find(groupId);
    if (it == groups.end()) return std::set<std::string>();
    return it->second;
}

std::vector<GroupRecord> GroupManager::allGroups() const {
    std::lock_guard<std::mutex> lock(groupMutex);
    std::vector<GroupRecord> out;
    for (const auto& entry : groups) {
        GroupRecord record;
        record.groupId = entry.first;
        record.memberIps = entry.second;
        out.push_back(record);
    }
    return out;
}

bool GroupManager::isGrouped(const std::string& ip) const {
    return groupOf(ip).has_value();
}

void GroupManager::removeMember(const std::string& ip) {
    std::lock_guard<std::mutex> lock(groupMutex);
    for (auto it = groups.begin(); it != groups.end();) {
        if (it->second.erase(ip)) {
            DEBUG_INFO("[GROUP] %s left group '%s'", ip.c_str(), it->first.c_str());
        }
        if (it->second.empty()) {
            it = groups.erase(it);
        } else {
            ++it;
        }
    }
}

void GroupManager::clear() {
    std::lock_guard<std::mutex> lock(groupMutex);
    if (!groups.empty()) {
        DEBUG_INFO("[GROUP] Cleared %d group(s)", (int)groups.size());
    }
    groups.clear();
}
