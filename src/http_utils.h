#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Docker Engine API requests; every request is logged at debug level

#include <chrono>
#include <string>
#include <thread>
#include <initializer_list>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

// "/path?key=value&..." with the values escaped
std::string WithQuery(const std::string& path, const httplib::Params& params);

// 2xx, or one of the statuses the caller treats as success (e.g. 304 for an already started container)
bool IsSuccess(int status, std::initializer_list<int> accepted = {});

// for logs: transport error, or status with the "message" of the Engine's error body
std::string Describe(const httplib::Result& res);

} // namespace http_utils

bool IsSuccess(const httplib::Result& res, std::initializer_list<int> accepted = {});

// receiver only sees the body of a 2xx response
httplib::Result EngineGet(httplib::Client& cli, const std::string& path, httplib::ContentReceiver receiver);
httplib::Result EnginePost(httplib::Client& cli, const std::string& path,
                           const std::string& body = "", const char* content_type = "application/json");
httplib::Result EnginePut(httplib::Client& cli, const std::string& path,
                          const std::string& body, const char* content_type);
httplib::Result EngineDelete(httplib::Client& cli, const std::string& path);

// Calls func() until it succeeds, sleeping between attempts; returns the last result
template <class Func>
httplib::Result RequestRetry(int retries, const std::string& what, Func&& func) {
  using namespace std::chrono_literals;
  httplib::Result res = func();
  for (int i = 1; i < retries && !IsSuccess(res); i++) {
    spdlog::debug("{} failed, retrying: {}", what, http_utils::Describe(res));
    std::this_thread::sleep_for(1s);
    res = func();
  }
  if (!IsSuccess(res)) spdlog::warn("{} failed after {} attempts", what, retries);
  return res;
}

#endif  // HTTP_UTILS_H_
