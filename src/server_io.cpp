#include "server_io.h"

#include <cmath>
#include <string>
#include <algorithm>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <codie/utils.h>
#include <codie/profiles.h>
#include <codie/orchestrator.h>
#include "message.h"

namespace {

using nlohmann::json;

void SendJson(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  // program output is not necessarily valid UTF-8
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& msg) {
  SendJson(res, json{{"error", msg}}, status);
}

int StatusCode(const ExecutionResult& result) {
  switch (result.error) {
    case ErrorKind::TOO_LARGE: return 413;
    case ErrorKind::RATE_LIMITED: return 429;
    case ErrorKind::OVERLOADED: return 503;
    default: return 200;
  }
}

void SendResult(httplib::Response& res, const ExecutionResult& result, json&& body) {
  if (result.error == ErrorKind::RATE_LIMITED) {
    res.set_header("Retry-After", std::to_string((result.retry_after + 999) / 1000));
  }
  SendJson(res, body, StatusCode(result));
}

// std::nullopt with an error response sent if the body is not a JSON object
std::optional<json> ParseBody(const httplib::Request& req, httplib::Response& res) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    SendError(res, 400, "request body must be a JSON object");
    return std::nullopt;
  }
  return body;
}

void HandleSubmit(Orchestrator& orchestrator, const httplib::Request& req, httplib::Response& res) {
  auto body = ParseBody(req, res);
  if (!body) return;
  ExecutionRequest request;
  try {
    std::optional<int64_t> timeout_cap;
    if (auto it = body->find("timeout_ms"); it != body->end() && !it->is_null()) {
      timeout_cap = it->get<int64_t>();
      if (*timeout_cap <= 0) {
        SendError(res, 400, "timeout_ms must be positive");
        return;
      }
    }
    request = MakeRequest(body->at("requestor").get<std::string>(),
                          body->at("language").get<std::string>(),
                          body->at("code").get<std::string>(), timeout_cap);
  } catch (json::exception& err) {
    SendError(res, 400, err.what());
    return;
  }
  ExecutionResult result = orchestrator.Submit(request);
  SendResult(res, result, ResultToJson(result));
}

void HandleMessage(Orchestrator& orchestrator, const httplib::Request& req, httplib::Response& res) {
  auto body = ParseBody(req, res);
  if (!body) return;
  std::string requestor, content;
  try {
    requestor = body->at("requestor").get<std::string>();
    content = body->at("content").get<std::string>();
  } catch (json::exception& err) {
    SendError(res, 400, err.what());
    return;
  }
  auto Reply = [&res](const std::string& reply) {
    SendJson(res, json{{"reply", reply}, {"result", nullptr}});
  };

  auto block = ParseCodeBlock(content);
  if (!block) return Reply(kNoCodeBlockReply);
  if (block->language.empty()) return Reply(NoLanguageReply(block->code));
  std::string error;
  auto options = ParseOptions(block->options, &error);
  if (!options) return Reply("I couldn't understand the options of your code block: " + error);

  std::optional<int64_t> timeout_cap;
  for (auto& [key, value] : *options) {
    if (key != "timeout") return Reply(fmt::format("I'm sorry, I don't know the option `{}`.", key));
    double sec = 0;
    try {
      size_t idx;
      sec = std::stod(value, &idx);
      if (idx != value.size()) sec = 0;
    } catch (std::logic_error&) {
      sec = 0;
    }
    if (!std::isfinite(sec) || sec <= 0) {
      return Reply(fmt::format("The timeout should be a positive number of seconds, not `{}`.", value));
    }
    timeout_cap = std::max<int64_t>(1, std::llround(std::min(sec, 86400.0) * 1000));
  }
  spdlog::debug("Message parsed: requestor={} language={} options={}",
                requestor, block->language, options->size());

  ExecutionResult result = orchestrator.Submit(MakeRequest(requestor, block->language, block->code, timeout_cap));
  SendResult(res, result, json{
      {"reply", FormatReply(result, block->language)},
      {"result", ResultToJson(result)}});
}

void HandleLanguages(Orchestrator& orchestrator, httplib::Response& res) {
  json ret = json::array();
  for (auto& profile : orchestrator.Profiles().Profiles()) {
    ret.push_back(ProfileToJson(profile));
  }
  SendJson(res, ret);
}

void HandleStatus(Orchestrator& orchestrator, httplib::Response& res) {
  auto& admission = orchestrator.Admission();
  SendJson(res, json{
      {"active", admission.ActiveSlots()},
      {"queued", admission.QueueSize()},
      {"capacity", admission.Capacity()},
      {"stopped", orchestrator.Stopped()}});
}

} // namespace

void SetupServer(httplib::Server& svr, Orchestrator& orchestrator) {
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} from {} status={}", req.method, req.path, req.remote_addr, res.status);
  });
  svr.Post("/submit", [&orchestrator](const httplib::Request& req, httplib::Response& res) {
    HandleSubmit(orchestrator, req, res);
  });
  svr.Post("/message", [&orchestrator](const httplib::Request& req, httplib::Response& res) {
    HandleMessage(orchestrator, req, res);
  });
  svr.Get("/languages", [&orchestrator](const httplib::Request&, httplib::Response& res) {
    HandleLanguages(orchestrator, res);
  });
  svr.Get("/status", [&orchestrator](const httplib::Request&, httplib::Response& res) {
    HandleStatus(orchestrator, res);
  });
}

bool ServeForever(httplib::Server& svr, const std::string& host, int port) {
  spdlog::info("Listening on {}:{}", host, port);
  if (!svr.listen(host, port)) {
    spdlog::error("Failed to listen on {}:{}", host, port);
    return false;
  }
  spdlog::info("Server stopped");
  return true;
}
