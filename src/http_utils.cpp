#include "http_utils.h"

#include <algorithm>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace {

constexpr size_t kLogBodyLimit = 256;

std::string BodySummary(const std::string& body) {
  if (body.empty()) return "(none)";
  if (body.size() > kLogBodyLimit) return fmt::format("({} bytes)", body.size());
  return body;
}

} // namespace

namespace http_utils {

std::string WithQuery(const std::string& path, const httplib::Params& params) {
  std::string ret = path;
  char sep = '?';
  for (auto& [key, value] : params) {
    ret += sep;
    ret += key + '=' + httplib::detail::encode_query_param(value);
    sep = '&';
  }
  return ret;
}

bool IsSuccess(int status, std::initializer_list<int> accepted) {
  if (status >= 200 && status < 300) return true;
  return std::find(accepted.begin(), accepted.end(), status) != accepted.end();
}

std::string Describe(const httplib::Result& res) {
  if (!res) return fmt::format("error={}", httplib::to_string(res.error()));
  auto body = nlohmann::json::parse(res->body, nullptr, false);
  if (body.is_object() && body.contains("message") && body["message"].is_string()) {
    return fmt::format("status={} message={}", res->status, body["message"].get<std::string>());
  }
  return fmt::format("status={} body={}", res->status, BodySummary(res->body));
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res, std::initializer_list<int> accepted) {
  return res && http_utils::IsSuccess(res->status, accepted);
}

httplib::Result EngineGet(httplib::Client& cli, const std::string& path, httplib::ContentReceiver receiver) {
  spdlog::debug("GET {} (streamed)", path);
  // error bodies never reach the receiver; a refused response comes back as Error::Canceled
  httplib::ResponseHandler accept_ok = [](const httplib::Response& res) {
    return http_utils::IsSuccess(res.status);
  };
  return cli.Get(path, accept_ok, std::move(receiver));
}

httplib::Result EnginePost(httplib::Client& cli, const std::string& path,
                           const std::string& body, const char* content_type) {
  spdlog::debug("POST {} body {}", path, BodySummary(body));
  return cli.Post(path, body, content_type);
}

httplib::Result EnginePut(httplib::Client& cli, const std::string& path,
                          const std::string& body, const char* content_type) {
  spdlog::debug("PUT {} body ({} bytes, {})", path, body.size(), content_type);
  return cli.Put(path, body, content_type);
}

httplib::Result EngineDelete(httplib::Client& cli, const std::string& path) {
  spdlog::debug("DELETE {}", path);
  return cli.Delete(path);
}
