#ifndef INCLUDE_CODIE_SANDBOX_H_
#define INCLUDE_CODIE_SANDBOX_H_

#include <mutex>
#include <chrono>
#include <string>
#include <optional>
#include <unordered_set>
#include <condition_variable>

#include "runtime.h"
#include "profiles.h"
#include "admission.h"
#include "execution.h"

// Combined stdout & stderr with a hard cap; bytes past the cap are counted, not stored
class OutputBuffer {
  size_t cap_;
  std::string data_;
  size_t discarded_;
 public:
  explicit OutputBuffer(size_t cap) : cap_(cap), discarded_(0) {}

  void Append(const char* data, size_t len);
  const std::string& Data() const { return data_; }
  std::string&& Take() { return std::move(data_); }
  size_t Discarded() const { return discarded_; }
  bool Truncated() const { return discarded_ > 0; }
};

class ExecutionSession {
 public:
  using Clock = std::chrono::steady_clock;

  const ExecutionRequest& request;
  std::optional<ContainerHandle> handle;
  Clock::time_point start_time, deadline;
  SessionStatus status;
  OutputBuffer output;
  std::optional<int> exit_code;

  // shared with the deadline watchdog and CancelAll
  std::mutex mtx;
  std::condition_variable cv;
  bool finished, timed_out, cancelled;

  ExecutionSession(const ExecutionRequest& req, size_t max_output) :
      request(req), start_time(Clock::now()), status(SessionStatus::PENDING), output(max_output),
      finished(false), timed_out(false), cancelled(false) {}
  ExecutionSession(const ExecutionSession&) = delete;

  bool IsCancelled() {
    std::lock_guard lck(mtx);
    return cancelled;
  }
};

struct SandboxLimits {
  int64_t max_timeout; // ms; 0 for no global maximum
  int64_t kill_grace; // ms
  size_t max_output; // bytes
};

class SandboxManager {
  ContainerRuntime& runtime_;
  const SandboxLimits limits_;

  std::mutex mtx_;
  // by identity; request ids are not trusted to be unique
  std::unordered_set<ExecutionSession*> sessions_;
  bool cancelling_;

  bool Register_(ExecutionSession&);
  void Unregister_(ExecutionSession&);
  std::optional<ContainerHandle> Provision_(ExecutionSession&, const ContainerSpec&);
  void Execute_(ExecutionSession&);
  void WatchDeadline_(ExecutionSession&);
 public:
  SandboxManager(ContainerRuntime& runtime, const SandboxLimits& limits) :
      runtime_(runtime), limits_(limits), cancelling_(false) {}
  SandboxManager(const SandboxManager&) = delete;

  // The environment created for the session is always removed before returning.
  // profile == nullptr for an unsupported language.
  ExecutionResult Run(const AdmissionTicket&, const ExecutionRequest&, const RuntimeProfile* profile);

  // Cancel every live session (and every later Run); sessions observe it at their next step
  void CancelAll();
  size_t LiveSessions();

  ContainerSpec BuildSpec(const ExecutionRequest&, const RuntimeProfile&) const;
  // ms
  int64_t EffectiveTimeout(const ExecutionRequest&, const RuntimeProfile&) const;
};

#endif  // INCLUDE_CODIE_SANDBOX_H_
