#include <codie/utils.h>

#include <unistd.h>
#include <atomic>
#include <chrono>
#include <algorithm>

#include <fmt/core.h>

namespace {

std::atomic_long request_seq = 0;

} // namespace

long GetUniqueRequestSequence() {
  return ++request_seq;
}

int64_t UnixMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

ExecutionRequest MakeRequest(
    const std::string& requestor_id, const std::string& language, const std::string& code,
    std::optional<int64_t> timeout_cap) {
  ExecutionRequest req;
  req.request_id = fmt::format("{}-{}", getpid(), GetUniqueRequestSequence());
  req.requestor_id = requestor_id;
  req.language = language;
  req.code = code;
  req.submission_time = UnixMillis();
  req.timeout_cap = timeout_cap;
  return req;
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c; });
  return str;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindDesc, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindName, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(SessionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SessionStatusName, SessionStatus, ENUM_SESSION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(CasResult, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CasResultName, CasResult, ENUM_CAS_RESULT_)
#undef X

#define X(...) X_RETURN_ARG1(LogStream, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LogStreamName, LogStream, ENUM_LOG_STREAM_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
