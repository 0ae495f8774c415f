#pragma once

#include <string>

#include "Logger.hpp"

namespace util {

struct ServerConfig {
    std::string host      = "0.0.0.0";
    int         port      = 8000;
    std::string logFile   = "logs/server.log";
    LogLevel    logLevel  = LogLevel::Info;
    std::string seedFile;                 // empty -> built-in activities
    std::string staticDir = "static";
};

// HOST, PORT, LOG_FILE, LOG_LEVEL, SEED_FILE, STATIC_DIR. Unset variables keep
// the defaults above; LOG_FILE set to "" disables the log file.
// Throws std::invalid_argument on a bad PORT.
ServerConfig configFromEnv();

// 1..65535, throws std::invalid_argument otherwise.
int parsePort(const std::string &value);

} // namespace util
