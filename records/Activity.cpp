#include "Activity.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace {
    const json& requireField(const std::string& activity,
                             const json& j,
                             const char* field) {
        auto it = j.find(field);
        if (it == j.end()) {
            throw std::invalid_argument("activity '" + activity + "': missing field '" + field + "'");
        }
        return *it;
    }
}

json activityToJson(const Activity& a) {
    json ja;
    ja["description"]      = a.description;
    ja["schedule"]         = a.schedule;
    ja["max_participants"] = a.maxParticipants;
    ja["participants"]     = json::array();
    for (const auto& p : a.participants) {
        ja["participants"].push_back(p);
    }
    return ja;
}

Activity activityFromJson(const std::string& name, const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("activity '" + name + "': expected an object");
    }

    const json& description  = requireField(name, j, "description");
    const json& schedule     = requireField(name, j, "schedule");
    const json& capacity     = requireField(name, j, "max_participants");
    if (!description.is_string() || !schedule.is_string()) {
        throw std::invalid_argument("activity '" + name + "': description and schedule must be strings");
    }
    if (!capacity.is_number_integer()) {
        throw std::invalid_argument("activity '" + name + "': max_participants must be an integer");
    }
    // non-negative literals parse as unsigned, negative ones as signed 64-bit
    const bool fitsInt = capacity.is_number_unsigned()
        ? capacity.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : capacity.get<std::int64_t>() >= std::numeric_limits<int>::min()
              && capacity.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!fitsInt) {
        throw std::invalid_argument("activity '" + name + "': max_participants out of range");
    }

    Activity a;
    a.name            = name;
    a.description     = description.get<std::string>();
    a.schedule        = schedule.get<std::string>();
    a.maxParticipants = capacity.get<int>();

    // participants is optional in seed files, an absent roster starts empty
    auto it = j.find("participants");
    if (it != j.end()) {
        if (!it->is_array()) {
            throw std::invalid_argument("activity '" + name + "': participants must be an array");
        }
        for (const auto& jp : *it) {
            if (!jp.is_string()) {
                throw std::invalid_argument("activity '" + name + "': participant ids must be strings");
            }
            a.participants.push_back(jp.get<std::string>());
        }
    }
    return a;
}

json activitiesToJson(const std::vector<Activity>& activities) {
    json root = json::object();
    for (const auto& a : activities) {
        root[a.name] = activityToJson(a);
    }
    return root;
}
