#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <codie/orchestrator.h>

#include "message.h"
#include "server_io.h"
#include "fake_runtime.h"
#include "memory_store.h"

namespace {

using nlohmann::json;
using namespace std::chrono_literals;

constexpr int kRateLimit = 2;
constexpr size_t kMaxSource = 1024;

// The gateway on a loopback port, backed by the fakes
class GatewayTest : public testing::Test {
 protected:
  MemoryStore store;
  FakeRuntime runtime;
  ProfileRegistry profiles{DefaultProfiles(ProfileDefaults{1.0, 128L * 1024 * 1024, 64, 5000})};
  RateLimiter limiter{store, 60000, kRateLimit};
  AdmissionController admission{limiter, 2, 4, kMaxSource};
  SandboxManager sandbox{runtime, SandboxLimits{10000, 500, 1900}};
  Orchestrator orchestrator{profiles, admission, sandbox};
  httplib::Server svr;
  std::thread thread;
  int port = 0;

  void SetUp() override {
    runtime.SetProgram("python:alpine", FakeProgram{"2\n", "", 0});
    SetupServer(svr, orchestrator);
    port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this]{ svr.listen_after_bind(); });
    for (int i = 0; i < 500 && !svr.is_running(); i++) std::this_thread::sleep_for(2ms);
    ASSERT_TRUE(svr.is_running());
  }
  void TearDown() override {
    svr.stop();
    if (thread.joinable()) thread.join();
  }

  httplib::Result Post(const std::string& path, const std::string& body) {
    httplib::Client cli("127.0.0.1", port);
    return cli.Post(path, body, "application/json");
  }
  httplib::Result Get(const std::string& path) {
    httplib::Client cli("127.0.0.1", port);
    return cli.Get(path);
  }
};

} // namespace

TEST_F(GatewayTest, Submit) {
  auto res = Post("/submit", json{{"requestor", "A"}, {"language", "py"}, {"code", "print(1+1)"}}.dump());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "COMPLETED");
  EXPECT_EQ(body["error"], "NONE");
  EXPECT_EQ(body["exit_code"], 0);
  EXPECT_EQ(body["output"], "2\n");
  EXPECT_EQ(runtime.Live(), 0);
}

TEST_F(GatewayTest, SubmitRejections) {
  auto res = Post("/submit", json{{"requestor", "A"}, {"language", "py"},
                                  {"code", std::string(kMaxSource + 1, '#')}}.dump());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 413);
  EXPECT_EQ(json::parse(res->body)["error"], "TOO_LARGE");

  for (int i = 0; i < kRateLimit; i++) {
    res = Post("/submit", json{{"requestor", "B"}, {"language", "py"}, {"code", "1"}}.dump());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
  }
  res = Post("/submit", json{{"requestor", "B"}, {"language", "py"}, {"code", "1"}}.dump());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 429);
  EXPECT_EQ(json::parse(res->body)["error"], "RATE_LIMITED");
  EXPECT_TRUE(res->has_header("Retry-After"));
  EXPECT_GE(std::stoi(res->get_header_value("Retry-After")), 1);
  EXPECT_EQ(runtime.Creates(), kRateLimit);
}

TEST_F(GatewayTest, SubmitMalformed) {
  auto res = Post("/submit", "{not json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  res = Post("/submit", "[1, 2]");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  res = Post("/submit", json{{"requestor", "A"}, {"code", "1"}}.dump());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  res = Post("/submit", json{{"requestor", "A"}, {"language", "py"}, {"code", "1"}, {"timeout_ms", -5}}.dump());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(runtime.Creates(), 0);
}

TEST_F(GatewayTest, Message) {
  auto res = Post("/message", json{{"requestor", "A"}, {"content", "run ```py\nprint(1+1)\n```"}}.dump());
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto body = json::parse(res->body);
  EXPECT_EQ(body["reply"], "```\n2\n```");
  EXPECT_EQ(body["result"]["status"], "COMPLETED");

  res = Post("/message", json{{"requestor", "A"}, {"content", "print(1+1)"}}.dump());
  ASSERT_TRUE(res);
  body = json::parse(res->body);
  EXPECT_EQ(body["reply"], kNoCodeBlockReply);
  EXPECT_TRUE(body["result"].is_null());

  res = Post("/message", json{{"requestor", "A"}, {"content", "```py memory=1G\n1\n```"}}.dump());
  ASSERT_TRUE(res);
  body = json::parse(res->body);
  EXPECT_NE(body["reply"].get<std::string>().find("memory"), std::string::npos);
  EXPECT_TRUE(body["result"].is_null());
  EXPECT_EQ(runtime.Creates(), 1);
}

TEST_F(GatewayTest, MessageTimeoutOption) {
  FakeProgram loop;
  loop.hang = true;
  runtime.SetProgram("python:alpine", loop);
  auto start = std::chrono::steady_clock::now();
  auto res = Post("/message", json{{"requestor", "A"}, {"content", "```py timeout=0.2\nwhile 1: pass\n```"}}.dump());
  ASSERT_TRUE(res);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
  auto body = json::parse(res->body);
  EXPECT_EQ(body["result"]["status"], "TIMED_OUT");
  EXPECT_EQ(body["reply"].get<std::string>().rfind("**TIMED OUT**", 0), 0);

  res = Post("/message", json{{"requestor", "A"}, {"content", "```py timeout=soon\n1\n```"}}.dump());
  ASSERT_TRUE(res);
  EXPECT_TRUE(json::parse(res->body)["result"].is_null());
}

TEST_F(GatewayTest, LanguagesAndStatus) {
  auto res = Get("/languages");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto languages = json::parse(res->body);
  ASSERT_TRUE(languages.is_array());
  EXPECT_EQ(languages.size(), profiles.Size());
  bool found = false;
  for (auto& item : languages) {
    if (item["name"] == "python") {
      found = true;
      EXPECT_EQ(item["image"], "python:alpine");
    }
  }
  EXPECT_TRUE(found);

  res = Get("/status");
  ASSERT_TRUE(res);
  auto status = json::parse(res->body);
  EXPECT_EQ(status["capacity"], 2);
  EXPECT_EQ(status["active"], 0);
  EXPECT_EQ(status["queued"], 0);
  EXPECT_EQ(status["stopped"], false);
}
