#ifndef ACTIVITY_ROUTES_HPP
#define ACTIVITY_ROUTES_HPP

#include <string>

#include <httplib.h>

#include "../backend/ActivityDirectory.hpp"

// HTTP status for a directory outcome (200 / 400 / 404).
int httpStatusFor(DirectoryStatus status);

// "detail" text sent with a failed outcome.
std::string errorDetailFor(DirectoryStatus status);

// Names and emails from the request are checked before they reach the
// directory, so every stored string serializes.
bool isValidUtf8(const std::string& text);

// CORS, request logging with durations, exception -> 500, httplib loggers.
void installServerHooks(httplib::Server& svr);

// "/", "/health", "/activities" and the roster routes. The directory must
// outlive the server.
void registerActivityRoutes(httplib::Server& svr, ActivityDirectory& directory);

// Serves staticDir under /static. Returns false if the directory is missing.
bool mountStaticFiles(httplib::Server& svr, const std::string& staticDir);

#endif // ACTIVITY_ROUTES_HPP
