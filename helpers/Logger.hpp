#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace util {

enum class LogLevel { Debug, Info, Warning, Error };

// "DEBUG" | "INFO" | "WARN" | "ERROR", anything else is Info.
LogLevel parseLogLevel(const std::string &name);
const char *logLevelName(LogLevel level);

class Logger {
public:
    // Empty filePath logs to stdout only.
    static void init(const std::string &filePath, LogLevel level = LogLevel::Info);
    static void shutdown();

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warn(const std::string &msg);
    static void error(const std::string &msg);

private:
    static std::string timeStamp();
    static void log(LogLevel level, const std::string &msg);

    static std::mutex mtx_;
    static std::ofstream out_;
    static LogLevel level_;
};

} // namespace util
