#ifndef INCLUDE_CODIE_EXECUTION_H_
#define INCLUDE_CODIE_EXECUTION_H_

#include <string>
#include <cstdint>
#include <optional>

#define ENUM_SESSION_STATUS_ \
  X(PENDING) \
  X(CREATING) \
  X(RUNNING) \
  /* terminal states */ \
  X(COMPLETED) \
  X(TIMED_OUT) \
  X(FAILED) \
  X(CANCELLED)
enum class SessionStatus {
#define X(name) name,
  ENUM_SESSION_STATUS_
#undef X
};

#define ENUM_ERROR_KIND_ \
  X(NONE, "Finished") \
  /* admission-time rejections; no session is created */ \
  X(TOO_LARGE, "Source code too large") \
  X(RATE_LIMITED, "Rate limited") \
  X(OVERLOADED, "Execution queue full") \
  /* session results */ \
  X(UNSUPPORTED_LANGUAGE, "Unsupported language") \
  X(INFRASTRUCTURE_ERROR, "Infrastructure error") \
  X(TIMED_OUT, "Time limit exceeded") \
  X(RUNTIME_FAILURE, "Exited with nonzero status") \
  X(CANCELLED, "Cancelled")
enum class ErrorKind {
#define X(name, desc) name,
  ENUM_ERROR_KIND_
#undef X
};

inline bool IsTerminal(SessionStatus status) {
  return (int)status >= (int)SessionStatus::COMPLETED;
}

class ExecutionRequest {
 public:
  std::string request_id; // unique in a process
  std::string requestor_id;
  std::string language; // alias as typed by the user
  std::string code;
  int64_t submission_time; // UNIX timestamp, milliseconds
  std::optional<int64_t> timeout_cap; // ms; narrows the profile timeout only

  ExecutionRequest() : submission_time(0) {}
};

// Stamps a unique request id and the current time.
ExecutionRequest MakeRequest(
    const std::string& requestor_id, const std::string& language, const std::string& code,
    std::optional<int64_t> timeout_cap = std::nullopt);

class ExecutionResult {
 public:
  std::string request_id;
  ErrorKind error;
  SessionStatus status; // PENDING if rejected before any session existed
  std::optional<int> exit_code;
  std::string output;
  bool truncated;
  size_t discarded_bytes;
  int64_t retry_after; // ms; only for RATE_LIMITED
  int64_t duration; // ms

  ExecutionResult() :
      error(ErrorKind::NONE), status(SessionStatus::PENDING),
      truncated(false), discarded_bytes(0), retry_after(0), duration(0) {}

  bool Rejected() const { return status == SessionStatus::PENDING; }
  bool Success() const { return error == ErrorKind::NONE; }
};

#endif  // INCLUDE_CODIE_EXECUTION_H_
