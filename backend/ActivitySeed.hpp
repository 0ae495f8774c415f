#ifndef ACTIVITY_SEED_HPP
#define ACTIVITY_SEED_HPP

#include <string>
#include <vector>

#include "../records/Activity.hpp"

// Built-in Mergington High School activities with their starting rosters.
std::vector<Activity> defaultActivities();

// Reads a seed file: a JSON object keyed by activity name, file order kept.
// Throws std::runtime_error if the file cannot be opened or parsed, and
// std::invalid_argument if an entry is malformed.
std::vector<Activity> loadActivitiesFromFile(const std::string& path);

// Same format, already parsed.
std::vector<Activity> activitiesFromJson(const nlohmann::ordered_json& j);

// SEED_FILE empty -> built-in table, otherwise the file.
std::vector<Activity> loadSeed(const std::string& seedFile);

#endif // ACTIVITY_SEED_HPP
