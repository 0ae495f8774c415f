#ifndef ACTIVITY_HPP
#define ACTIVITY_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct Activity {
    std::string              name;            // key, unique in the directory
    std::string              description;
    std::string              schedule;        // "Fridays, 3:30 PM - 5:00 PM"
    int                      maxParticipants = 0;
    std::vector<std::string> participants;    // email, insertion order
};

// JSON form used by GET /activities and by seed files:
// { "description", "schedule", "max_participants", "participants": [...] }
// The name is the key of the enclosing object, not a field.
nlohmann::ordered_json activityToJson(const Activity& a);

// Throws std::invalid_argument when a field is missing or has the wrong type.
Activity activityFromJson(const std::string& name, const nlohmann::ordered_json& j);

nlohmann::ordered_json activitiesToJson(const std::vector<Activity>& activities);

#endif
