#ifndef WAM_GROUPS_H
#define WAM_GROUPS_H

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "wam_types.h"

// Shared id for devices that only report a grouped flag
#define WAM_FLAG_ONLY_GROUP_ID  "group:default"

class GroupManager {
private:
    mutable std::mutex groupMutex;
    std::map<std::string, std::set<std::string>> groups;   // groupId -> member ips

public:
    GroupManager() {}

    // Adds ip to the group its snapshot names. Membership is add-only: a
    // snapshot without group fields leaves earlier membership untouched.
    std::optional<std::string> deriveGroup(const std::string& ip, const PropertyMap& snapshot);

    std::optional<std::string> groupOf(const std::string& ip) const;
    std::set<std::string> members(const std::string& groupId) const;
    std::vector<GroupRecord> allGroups() const;
    bool isGrouped(const std::string& ip) const;

    // Explicit disconnect of a member; empty groups are dropped
    void removeMember(const std::string& ip);
    void clear();

    // Group id a snapshot would map to, without touching membership
    static std::optional<std::string> groupIdFromSnapshot(const PropertyMap& snapshot);
};

#endif // WAM_GROUPS_H
