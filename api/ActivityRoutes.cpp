#include "ActivityRoutes.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "../helpers/Logger.hpp"

using json = nlohmann::ordered_json;

namespace {

// invalid UTF-8 in a stored string is written as U+FFFD instead of throwing
void sendJson(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void sendError(httplib::Response& res, int status, const std::string& detail) {
  json err;
  err["detail"] = detail;
  sendJson(res, status, err);
}

std::string originOf(const httplib::Request& req) {
  return req.has_header("Origin") ? req.get_header_value("Origin") : "-";
}

// email comes from the query string: /activities/{name}/signup?email=...
bool requireEmail(const httplib::Request& req, httplib::Response& res, std::string& email) {
  if (req.has_param("email")) {
    email = req.get_param_value("email");
  }
  if (email.empty()) {
    sendError(res, 422, "Missing required query parameter: email");
    return false;
  }
  if (!isValidUtf8(email)) {
    sendError(res, 422, "Query parameter email is not valid UTF-8");
    return false;
  }
  return true;
}

bool requireValidName(const std::string& name, httplib::Response& res) {
  if (!isValidUtf8(name)) {
    sendError(res, 422, "Activity name is not valid UTF-8");
    return false;
  }
  return true;
}

void logOutcome(const char* op, const DirectoryResult& r) {
  std::string line = std::string(op) + ": activity=" + r.activity + " email=" + r.participant;
  if (r.ok()) {
    util::Logger::info(line);
  } else {
    util::Logger::warn(line + " rejected: " + toString(r.status));
  }
}

// start time of each in-flight request, for the duration log line
struct RequestTimings {
  std::mutex mtx;
  std::unordered_map<const httplib::Request*, std::chrono::steady_clock::time_point> started;
};

}  // namespace

bool isValidUtf8(const std::string& text) {
  try {
    // the strict serializer rejects malformed sequences with type_error 316
    (void)json(text).dump();
  } catch (const json::type_error&) {
    return false;
  }
  return true;
}

int httpStatusFor(DirectoryStatus status) {
  switch (status) {
    case DirectoryStatus::Ok:
      return 200;
    case DirectoryStatus::ActivityNotFound:
    case DirectoryStatus::ParticipantNotFound:
      return 404;
    case DirectoryStatus::AlreadyRegistered:
    case DirectoryStatus::ActivityFull:
      return 400;
  }
  return 500;
}

std::string errorDetailFor(DirectoryStatus status) {
  switch (status) {
    case DirectoryStatus::Ok:
      return "";
    case DirectoryStatus::ActivityNotFound:
      return "Activity not found";
    case DirectoryStatus::AlreadyRegistered:
      return "Student is already signed up";
    case DirectoryStatus::ParticipantNotFound:
      return "Participant not found";
    case DirectoryStatus::ActivityFull:
      return "Activity is full";
  }
  return "Internal server error";
}

// =======================
//     Server-level hooks
// =======================

void installServerHooks(httplib::Server& svr) {
  // CORS preflight
  svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_header("Access-Control-Max-Age", "3600");
    res.status = 204;
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string what = "unknown";
    try {
      if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      what = e.what();
    } catch (...) {
      // non-std exception: reported as "unknown" below
    }
    util::Logger::error("Unhandled exception handling request: " + req.method + " " + req.path +
                        " Origin:" + originOf(req) + " error: " + what);
    sendError(res, 500, "Internal server error");
  });

  auto timings = std::make_shared<RequestTimings>();

  svr.set_pre_routing_handler(
      [timings](const httplib::Request& req, httplib::Response& /*res*/) -> httplib::Server::HandlerResponse {
        {
          std::lock_guard<std::mutex> lk(timings->mtx);
          timings->started[&req] = std::chrono::steady_clock::now();
        }
        util::Logger::info(req.method + " " + req.path + " Origin:" + originOf(req));
        return httplib::Server::HandlerResponse::Unhandled;
      });

  svr.set_post_routing_handler([timings](const httplib::Request& req, httplib::Response& res) {
    if (res.get_header_value("Access-Control-Allow-Origin").empty()) {
      res.set_header("Access-Control-Allow-Origin", "*");
    }

    std::chrono::steady_clock::time_point start;
    {
      std::lock_guard<std::mutex> lk(timings->mtx);
      auto it = timings->started.find(&req);
      if (it != timings->started.end()) {
        start = it->second;
        timings->started.erase(it);
      }
    }
    if (start.time_since_epoch().count() > 0) {
      auto dur =
          std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
      util::Logger::info(req.method + " " + req.path + " -> " + std::to_string(res.status) + " (" +
                         std::to_string(dur) + " ms)");
    }
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    util::Logger::debug("httplib log: " + req.method + " " + req.path + " status:" + std::to_string(res.status));
  });
  svr.set_error_logger([](const httplib::Error& err, const httplib::Request* req) {
    std::string path = req ? req->path : "-";
    util::Logger::warn("httplib error: " + httplib::to_string(err) + " path:" + path);
  });
}

bool mountStaticFiles(httplib::Server& svr, const std::string& staticDir) {
  if (!svr.set_mount_point("/static", staticDir)) return false;
  util::Logger::info("serving " + staticDir + " at /static");
  return true;
}

// =======================
//        Routes
// =======================

void registerActivityRoutes(httplib::Server& svr, ActivityDirectory& directory) {
  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.set_redirect("/static/index.html", 307);
  });

  svr.Get("/health", [&directory](const httplib::Request&, httplib::Response& res) {
    json j;
    j["status"] = "ok";
    j["message"] = "activities server running";
    j["activities"] = directory.size();
    sendJson(res, 200, j);
  });

  // GET /activities
  // 200 { "<name>": { description, schedule, max_participants, participants[] }, ... }
  svr.Get("/activities", [&directory](const httplib::Request&, httplib::Response& res) {
    sendJson(res, 200, activitiesToJson(directory.list()));
  });

  // GET /activities/{name}
  svr.Get(R"(/activities/([^/]+))", [&directory](const httplib::Request& req, httplib::Response& res) {
    const std::string name = req.matches[1];
    auto activity = directory.find(name);
    if (!activity) {
      sendError(res, 404, errorDetailFor(DirectoryStatus::ActivityNotFound));
      return;
    }
    sendJson(res, 200, activityToJson(*activity));
  });

  // POST /activities/{name}/signup?email=...
  // 200 { "message": "Signed up <email> for <name>" }
  svr.Post(R"(/activities/([^/]+)/signup)", [&directory](const httplib::Request& req, httplib::Response& res) {
    std::string email;
    if (!requireEmail(req, res, email)) return;

    const std::string name = req.matches[1];
    if (!requireValidName(name, res)) return;
    DirectoryResult r = directory.signUp(name, email);
    logOutcome("signup", r);
    if (!r.ok()) {
      sendError(res, httpStatusFor(r.status), errorDetailFor(r.status));
      return;
    }

    json out;
    out["message"] = "Signed up " + r.participant + " for " + r.activity;
    sendJson(res, 200, out);
  });

  // DELETE /activities/{name}/unregister?email=...
  // 200 { "message": "Unregistered <email> from <name>" }
  svr.Delete(R"(/activities/([^/]+)/unregister)", [&directory](const httplib::Request& req, httplib::Response& res) {
    std::string email;
    if (!requireEmail(req, res, email)) return;

    const std::string name = req.matches[1];
    if (!requireValidName(name, res)) return;
    DirectoryResult r = directory.unregister(name, email);
    logOutcome("unregister", r);
    if (!r.ok()) {
      sendError(res, httpStatusFor(r.status), errorDetailFor(r.status));
      return;
    }

    json out;
    out["message"] = "Unregistered " + r.participant + " from " + r.activity;
    sendJson(res, 200, out);
  });
}
