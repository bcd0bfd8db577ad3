#include "server_io.h"

#include <mutex>
#include <thread>
#include <string>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codebox/session.h>
#include "codebox/result.h"

size_t kMaxQueue = 20;

namespace {

using nlohmann::json;

const char kSetupErrorMessage[] = "could not prepare execution environment";

class ResponseWriter {
  std::mutex mtx_;
  std::ostream& out_;
 public:
  explicit ResponseWriter(std::ostream& out) : out_(out) {}
  void Write(const json& resp) {
    // script output is not necessarily valid UTF-8
    std::string line = resp.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard lck(mtx_);
    out_ << line << std::endl;
  }
};

json ErrorResponse(const json& id, const char* type, const std::string& message) {
  return {{"id", id}, {"error_type", type}, {"message", message}};
}

json HandleRequest(const std::string& line, SessionBinder& binder) {
  json req;
  try {
    req = json::parse(line);
  } catch (json::parse_error& e) {
    return ErrorResponse(nullptr, "bad_request", e.what());
  }
  json id = req.is_object() && req.contains("id") ? req["id"] : json();
  try {
    std::string action = req.at("action").get<std::string>();
    std::string session = req.at("session").get<std::string>();
    spdlog::info("Request id={} action={} session={}", id.dump(), action, session);
    if (action == "end") {
      return {{"id", id}, {"session", session}, {"ended", binder.End(session)}};
    }
    if (action != "execute" && action != "install") {
      return ErrorResponse(id, "bad_request", "unknown action " + action);
    }
    CodeRequest code_req;
    if (action == "execute") {
      code_req = CodeRequestFromJson(req);
    } else if (auto it = req.find("dependencies"); it != req.end()) {
      code_req.dependencies = it->get<std::vector<std::string>>();
    }

    json resp;
    try {
      std::unique_ptr<Sandbox> sandbox = binder.Bind(session);
      std::optional<std::string> install_error = sandbox->Install(code_req.dependencies);
      resp = action == "execute" ? ExecutionResultToJson(sandbox->Execute(code_req.code)) : json::object();
      resp["sandbox_id"] = sandbox->Id();
      resp["install_error"] = install_error ? json(*install_error) : json();
    } catch (SandboxError& e) {
      spdlog::error("Session {}: {}", session, e.what());
      resp = ErrorResponse(id, "setup", kSetupErrorMessage);
    }
    resp["id"] = id;
    resp["session"] = session;
    return resp;
  } catch (json::exception& e) {
    return ErrorResponse(id, "bad_request", e.what());
  } catch (std::exception& e) {
    spdlog::error("Request id={} failed: {}", id.dump(), e.what());
    return ErrorResponse(id, "internal", e.what());
  }
}

} // namespace

void ServerWorkLoop(std::istream& in, std::ostream& out, SessionBinder& binder) {
  ResponseWriter writer(out);
  std::mutex mtx;
  std::condition_variable cv;
  size_t in_flight = 0;

  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    {
      std::unique_lock lck(mtx);
      if (kMaxQueue && in_flight >= kMaxQueue) {
        spdlog::debug("Request queue full ({}); waiting", in_flight);
        cv.wait(lck, [&] { return in_flight < kMaxQueue; });
      }
      in_flight++;
    }
    std::thread([&, line = std::move(line)]() {
      writer.Write(HandleRequest(line, binder));
      std::lock_guard lck(mtx);
      in_flight--;
      cv.notify_all();
    }).detach();
  }
  std::unique_lock lck(mtx);
  spdlog::info("Input closed; waiting for {} requests", in_flight);
  cv.wait(lck, [&] { return in_flight == 0; });
}
