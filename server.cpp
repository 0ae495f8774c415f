// server.cpp
// Mergington High School activities server: seed -> directory -> HTTP.

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <httplib.h>

#include "api/ActivityRoutes.hpp"
#include "backend/ActivityDirectory.hpp"
#include "backend/ActivitySeed.hpp"
#include "helpers/Config.hpp"
#include "helpers/Logger.hpp"

int main() {
  util::ServerConfig cfg;
  try {
    cfg = util::configFromEnv();
  } catch (const std::exception& e) {
    util::Logger::init("", util::LogLevel::Info);
    util::Logger::error(std::string("Invalid configuration: ") + e.what());
    return 1;
  }

  // Initialize logger -------------------------------
  util::Logger::init(cfg.logFile, cfg.logLevel);
  util::Logger::info(std::string("Log level ") + util::logLevelName(cfg.logLevel) +
                     (cfg.logFile.empty() ? ", stdout only" : ", file " + cfg.logFile));
  // --------------------------------------------------

  std::unique_ptr<ActivityDirectory> directory;
  try {
    std::vector<Activity> seed = loadSeed(cfg.seedFile);
    directory = std::make_unique<ActivityDirectory>(std::move(seed));
  } catch (const std::exception& e) {
    util::Logger::error(std::string("Failed to load activities: ") + e.what());
    util::Logger::shutdown();
    return 1;
  }
  util::Logger::info("Loaded " + std::to_string(directory->size()) + " activities from " +
                     (cfg.seedFile.empty() ? std::string("built-in table") : cfg.seedFile));

  httplib::Server svr;
  installServerHooks(svr);
  if (!mountStaticFiles(svr, cfg.staticDir)) {
    util::Logger::warn("static directory not found: " + cfg.staticDir + ", /static disabled");
  }
  registerActivityRoutes(svr, *directory);

  util::Logger::info("Server started at http://" + cfg.host + ":" + std::to_string(cfg.port));
  if (!svr.listen(cfg.host, cfg.port)) {
    util::Logger::error("Failed to listen on " + cfg.host + ":" + std::to_string(cfg.port));
    util::Logger::shutdown();
    return 1;
  }

  util::Logger::shutdown();
  return 0;
}
