#include "Config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace util {

namespace {
bool readEnv(const char *name, std::string &out) {
    const char *v = std::getenv(name);
    if (!v) return false;
    out = v;
    return true;
}
} // namespace

int parsePort(const std::string &value) {
    std::size_t used = 0;
    long port = 0;
    try {
        port = std::stol(value, &used);
    } catch (const std::exception &) {
        throw std::invalid_argument("PORT is not a number: '" + value + "'");
    }
    if (used != value.size() || port < 1 || port > 65535) {
        throw std::invalid_argument("PORT out of range: '" + value + "'");
    }
    return static_cast<int>(port);
}

ServerConfig configFromEnv() {
    ServerConfig cfg;
    std::string s;

    if (readEnv("HOST", s) && !s.empty()) cfg.host = s;
    if (readEnv("PORT", s)) cfg.port = parsePort(s);
    readEnv("LOG_FILE", cfg.logFile);
    if (readEnv("LOG_LEVEL", s)) cfg.logLevel = parseLogLevel(s);
    readEnv("SEED_FILE", cfg.seedFile);
    if (readEnv("STATIC_DIR", s) && !s.empty()) cfg.staticDir = s;

    return cfg;
}

} // namespace util
