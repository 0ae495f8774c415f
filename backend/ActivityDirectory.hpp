#ifndef ACTIVITY_DIRECTORY_HPP
#define ACTIVITY_DIRECTORY_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../records/Activity.hpp"

enum class DirectoryStatus {
    Ok,
    ActivityNotFound,
    AlreadyRegistered,
    ParticipantNotFound,
    ActivityFull
};

// Outcome of signUp / unregister. On Ok it carries the activity and the
// participant so the caller can compose its confirmation message.
struct DirectoryResult {
    DirectoryStatus status = DirectoryStatus::Ok;
    std::string     activity;
    std::string     participant;

    bool ok() const { return status == DirectoryStatus::Ok; }
};

const char* toString(DirectoryStatus status);

class ActivityDirectory {
public:
    // Throws std::invalid_argument if the seed breaks a directory invariant:
    // duplicate or empty names, capacity <= 0, duplicate participants in a
    // roster, or a roster larger than its capacity.
    explicit ActivityDirectory(std::vector<Activity> seed);

    ActivityDirectory(const ActivityDirectory&)            = delete;
    ActivityDirectory& operator=(const ActivityDirectory&) = delete;

    // ---------- Read ----------
    // Copy of every activity in seed order.
    std::vector<Activity> list() const;

    std::optional<Activity> find(const std::string& name) const;

    std::size_t size() const;

    // ---------- Roster ----------
    DirectoryResult signUp(const std::string& activityName,
                           const std::string& participantId);

    DirectoryResult unregister(const std::string& activityName,
                               const std::string& participantId);

private:
    // seed order is kept for listing; names map to their slot
    std::vector<Activity>                        activities;
    std::unordered_map<std::string, std::size_t> indexByName;

    mutable std::mutex mtx;

    Activity*       findLocked(const std::string& name);
    const Activity* findLocked(const std::string& name) const;
};

#endif // ACTIVITY_DIRECTORY_HPP
