#include "ActivityDirectory.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace {
    bool hasParticipant(const Activity& a, const std::string& participantId) {
        return std::find(a.participants.begin(), a.participants.end(), participantId)
               != a.participants.end();
    }
}

const char* toString(DirectoryStatus status) {
    switch (status) {
        case DirectoryStatus::Ok:                  return "Ok";
        case DirectoryStatus::ActivityNotFound:    return "ActivityNotFound";
        case DirectoryStatus::AlreadyRegistered:   return "AlreadyRegistered";
        case DirectoryStatus::ParticipantNotFound: return "ParticipantNotFound";
        case DirectoryStatus::ActivityFull:        return "ActivityFull";
    }
    return "Unknown";
}

// ----------------------
// Construction: validate the seed
// ----------------------

ActivityDirectory::ActivityDirectory(std::vector<Activity> seed)
    : activities(std::move(seed)) {
    for (std::size_t i = 0; i < activities.size(); ++i) {
        const Activity& a = activities[i];
        if (a.name.empty()) {
            throw std::invalid_argument("seed contains an activity without a name");
        }
        if (a.maxParticipants <= 0) {
            throw std::invalid_argument("activity '" + a.name + "': max_participants must be positive");
        }
        if (a.participants.size() > static_cast<std::size_t>(a.maxParticipants)) {
            throw std::invalid_argument("activity '" + a.name + "': roster exceeds max_participants");
        }

        std::unordered_set<std::string> seen;
        for (const auto& p : a.participants) {
            if (!seen.insert(p).second) {
                throw std::invalid_argument("activity '" + a.name + "': duplicate participant " + p);
            }
        }

        if (!indexByName.emplace(a.name, i).second) {
            throw std::invalid_argument("duplicate activity name '" + a.name + "'");
        }
    }
}

// ----------------------
// Lookup (caller holds mtx)
// ----------------------

Activity* ActivityDirectory::findLocked(const std::string& name) {
    auto it = indexByName.find(name);
    if (it == indexByName.end()) return nullptr;
    return &activities[it->second];
}

const Activity* ActivityDirectory::findLocked(const std::string& name) const {
    auto it = indexByName.find(name);
    if (it == indexByName.end()) return nullptr;
    return &activities[it->second];
}

// ----------------------
// Read
// ----------------------

std::vector<Activity> ActivityDirectory::list() const {
    std::lock_guard<std::mutex> lk(mtx);
    return activities;
}

std::optional<Activity> ActivityDirectory::find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx);
    const Activity* a = findLocked(name);
    if (!a) return std::nullopt;
    return *a;
}

std::size_t ActivityDirectory::size() const {
    std::lock_guard<std::mutex> lk(mtx);
    return activities.size();
}

// ----------------------
// Roster
// ----------------------

DirectoryResult ActivityDirectory::signUp(const std::string& activityName,
                                          const std::string& participantId) {
    DirectoryResult result{DirectoryStatus::Ok, activityName, participantId};

    std::lock_guard<std::mutex> lk(mtx);
    Activity* a = findLocked(activityName);
    if (!a) {
        result.status = DirectoryStatus::ActivityNotFound;
        return result;
    }
    if (hasParticipant(*a, participantId)) {
        result.status = DirectoryStatus::AlreadyRegistered;
        return result;
    }
    if (a->participants.size() >= static_cast<std::size_t>(a->maxParticipants)) {
        result.status = DirectoryStatus::ActivityFull;
        return result;
    }

    a->participants.push_back(participantId);
    return result;
}

DirectoryResult ActivityDirectory::unregister(const std::string& activityName,
                                              const std::string& participantId) {
    DirectoryResult result{DirectoryStatus::Ok, activityName, participantId};

    std::lock_guard<std::mutex> lk(mtx);
    Activity* a = findLocked(activityName);
    if (!a) {
        result.status = DirectoryStatus::ActivityNotFound;
        return result;
    }

    auto it = std::find(a->participants.begin(), a->participants.end(), participantId);
    if (it == a->participants.end()) {
        result.status = DirectoryStatus::ParticipantNotFound;
        return result;
    }

    a->participants.erase(it);
    return result;
}
