#include <map>
#include <sstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codebox/session.h>
#include <codebox/utils.h>

#include "codebox/result.h"
#include "server_io.h"
#include "utils.h"

using nlohmann::json;

namespace {

std::vector<json> Serve(SessionBinder& binder, const std::string& input) {
  std::istringstream in(input);
  std::ostringstream out;
  ServerWorkLoop(in, out, binder);
  std::vector<json> ret;
  std::istringstream resp(out.str());
  for (std::string line; std::getline(resp, line);) ret.push_back(json::parse(line));
  return ret;
}

} // namespace

TEST(ResultJson, Fields) {
  ExecutionResult res;
  res.status = ExecutionStatus::TLE;
  res.time_us = 123;
  res.error = kTimeoutMessage;
  res.images = {"Zm9v"};
  json j = ExecutionResultToJson(res);
  EXPECT_EQ(j["status"], "TLE");
  EXPECT_EQ(j["exit_code"], 0);
  EXPECT_EQ(j["time_us"], 123);
  EXPECT_EQ(j["output"], "");
  EXPECT_EQ(j["error"], kTimeoutMessage);
  EXPECT_EQ(j["images"], json::array({"Zm9v"}));
}

TEST(ResultJson, CodeRequest) {
  CodeRequest req = CodeRequestFromJson(json::parse(R"J({"code": "print(1)", "dependencies": ["numpy"]})J"));
  EXPECT_EQ(req.code, "print(1)");
  EXPECT_EQ(req.dependencies, std::vector<std::string>{"numpy"});
  req = CodeRequestFromJson(json::parse(R"({"code": "", "dependencies": null})"));
  EXPECT_TRUE(req.dependencies.empty());
  EXPECT_THROW(CodeRequestFromJson(json::parse(R"({"dependencies": []})")), json::exception);
  EXPECT_THROW(CodeRequestFromJson(json::parse(R"({"code": 1})")), json::exception);
}

TEST(ServerWorkLoop, BadRequests) {
  SessionBinder binder(kStoreRoot / "server");
  auto resp = Serve(binder,
      "not json\n"
      "\n"
      R"({"id": 2, "action": "execute"})" "\n"
      R"({"id": 3, "action": "fly", "session": "s"})" "\n"
      R"({"id": 4, "action": "end", "session": "nobody"})" "\n");
  ASSERT_EQ(resp.size(), 4u);
  std::map<json, json> by_id;
  for (auto& i : resp) by_id[i["id"]] = i;
  EXPECT_EQ(by_id[json()]["error_type"], "bad_request");
  EXPECT_EQ(by_id[2]["error_type"], "bad_request");
  EXPECT_EQ(by_id[3]["error_type"], "bad_request");
  EXPECT_EQ(by_id[4]["ended"], false);
  EXPECT_EQ(binder.Size(), 0u);
}

TEST(ServerWorkLoop, ExecuteAndEnd) {
  SessionBinder binder(kStoreRoot / "server");
  auto resp = Serve(binder,
      R"J({"id": 1, "action": "execute", "session": "s1", "code": "print('hi')\nimport sys\nsys.exit(2)"})J" "\n");
  ASSERT_EQ(resp.size(), 1u);
  EXPECT_EQ(resp[0]["session"], "s1");
  EXPECT_EQ(resp[0]["status"], "RE");
  EXPECT_EQ(resp[0]["exit_code"], 2);
  EXPECT_EQ(resp[0]["output"], "hi\n");
  EXPECT_TRUE(resp[0]["install_error"].is_null());
  EXPECT_EQ(resp[0]["sandbox_id"], binder.SandboxId("s1").value_or(""));

  resp = Serve(binder,
      R"({"id": 2, "action": "install", "session": "s1", "dependencies": ["!!bad!!"]})" "\n");
  ASSERT_EQ(resp.size(), 1u);
  EXPECT_TRUE(resp[0]["install_error"].is_string());
  EXPECT_FALSE(resp[0].contains("status"));

  fs::path root = kStoreRoot / "server" / binder.SandboxId("s1").value_or("");
  EXPECT_TRUE(fs::exists(root));
  resp = Serve(binder, R"({"id": 3, "action": "end", "session": "s1"})" "\n");
  ASSERT_EQ(resp.size(), 1u);
  EXPECT_EQ(resp[0]["ended"], true);
  EXPECT_FALSE(fs::exists(root));
}

TEST(ServerWorkLoop, SetupError) {
  ScopedSetting<std::string> python(kPythonExecutable, "/nonexistent/python3");
  SessionBinder binder(kStoreRoot / "server");
  auto resp = Serve(binder, R"J({"id": "x", "action": "execute", "session": "s2", "code": "print(1)"})J" "\n");
  ASSERT_EQ(resp.size(), 1u);
  EXPECT_EQ(resp[0]["id"], "x");
  EXPECT_EQ(resp[0]["error_type"], "setup");
  EXPECT_EQ(resp[0]["message"], "could not prepare execution environment");
}

TEST(ServerWorkLoop, QueueLimit) {
  ScopedSetting<size_t> queue(kMaxQueue, 1);
  SessionBinder binder(kStoreRoot / "server");
  // the second request is only read after the first one is answered
  auto resp = Serve(binder,
      R"J({"id": 1, "action": "execute", "session": "q1", "code": "import time\ntime.sleep(1)"})J" "\n"
      R"({"id": 2, "action": "end", "session": "nobody"})" "\n");
  ASSERT_EQ(resp.size(), 2u);
  EXPECT_EQ(resp[0]["id"], 1);
  EXPECT_EQ(resp[0]["status"], "OK");
  EXPECT_EQ(resp[1]["id"], 2);
  EXPECT_TRUE(binder.End("q1"));

  std::string input;
  for (int i = 0; i < 50; i++) {
    input += R"({"id": )" + std::to_string(i) + R"(, "action": "end", "session": "none"})" "\n";
  }
  resp = Serve(binder, input);
  ASSERT_EQ(resp.size(), 50u);
  for (int i = 0; i < 50; i++) EXPECT_EQ(resp[i]["id"], i);
}
