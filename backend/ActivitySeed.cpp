#include "ActivitySeed.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::ordered_json;

std::vector<Activity> defaultActivities() {
    return {
        {"Chess Club",
         "Learn strategies and compete in chess tournaments",
         "Fridays, 3:30 PM - 5:00 PM",
         12,
         {"michael@mergington.edu", "daniel@mergington.edu"}},
        {"Programming Class",
         "Learn programming fundamentals and build software projects",
         "Tuesdays and Thursdays, 3:30 PM - 4:30 PM",
         20,
         {"emma@mergington.edu", "sophia@mergington.edu"}},
        {"Gym Class",
         "Physical education and sports activities",
         "Mondays, Wednesdays, Fridays, 2:00 PM - 3:00 PM",
         30,
         {"john@mergington.edu", "olivia@mergington.edu"}},
        {"Basketball Team",
         "Competitive basketball training and inter-school games",
         "Tuesdays and Thursdays, 4:00 PM - 6:00 PM",
         15,
         {"alex@mergington.edu"}},
        {"Soccer Club",
         "Practice soccer skills and play friendly matches",
         "Wednesdays and Saturdays, 3:00 PM - 5:00 PM",
         22,
         {"liam@mergington.edu", "noah@mergington.edu"}},
        {"Art Class",
         "Explore painting, drawing and other visual arts",
         "Mondays, 3:30 PM - 5:00 PM",
         18,
         {"ava@mergington.edu"}},
        {"Drama Club",
         "Rehearse and perform plays and theatrical productions",
         "Thursdays, 3:30 PM - 5:30 PM",
         20,
         {"mia@mergington.edu", "isabella@mergington.edu"}},
        {"Debate Team",
         "Develop public speaking and argumentation skills",
         "Fridays, 4:00 PM - 5:30 PM",
         16,
         {"lucas@mergington.edu"}},
        {"Science Club",
         "Hands-on experiments and science fair projects",
         "Wednesdays, 3:30 PM - 5:00 PM",
         24,
         {"amelia@mergington.edu", "harper@mergington.edu"}},
    };
}

std::vector<Activity> activitiesFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("seed must be a JSON object keyed by activity name");
    }

    std::vector<Activity> out;
    out.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it) {
        out.push_back(activityFromJson(it.key(), it.value()));
    }
    return out;
}

std::vector<Activity> loadActivitiesFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open seed file " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("failed to parse seed file " + path + ": " + e.what());
    }
    return activitiesFromJson(j);
}

std::vector<Activity> loadSeed(const std::string& seedFile) {
    if (seedFile.empty()) {
        return defaultActivities();
    }
    return loadActivitiesFromFile(seedFile);
}
