#include <codie/sandbox.h>

#include <thread>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codie/utils.h>

void OutputBuffer::Append(const char* data, size_t len) {
  size_t room = cap_ > data_.size() ? cap_ - data_.size() : 0;
  size_t take = std::min(room, len);
  data_.append(data, take);
  discarded_ += len - take;
}

namespace {

using namespace std::chrono_literals;

// stands in for "no timeout"; time_point::max() overflows in wait_until
constexpr auto kNoDeadline = 24h * 365;
// between kill attempts the runtime refused
constexpr auto kKillRetryInterval = 100ms;

// Owns a created environment; tears it down exactly once when destroyed,
//  no matter how the session ends.
class EnvironmentGuard {
  ContainerRuntime& runtime_;
  ContainerHandle handle_;
  bool exited_;
 public:
  EnvironmentGuard(ContainerRuntime& runtime, const ContainerHandle& handle) :
      runtime_(runtime), handle_(handle), exited_(false) {}
  EnvironmentGuard(const EnvironmentGuard&) = delete;
  EnvironmentGuard& operator=(const EnvironmentGuard&) = delete;
  ~EnvironmentGuard() {
    if (!exited_ && !runtime_.Kill(handle_)) {
      spdlog::warn("Failed to kill container before removal: container={}", handle_);
    }
    if (runtime_.Remove(handle_)) {
      spdlog::info("Container removed: container={}", handle_);
    } else {
      // the result stands; somebody has to clean this up by hand
      spdlog::error("Container leaked, remove it manually: container={}", handle_);
    }
  }

  void MarkExited() { exited_ = true; }
};

// Stops and joins the deadline watchdog on every path out of the running state
class WatchdogJoiner {
  ExecutionSession& session_;
  std::thread thread_;
 public:
  template <class Func>
  WatchdogJoiner(ExecutionSession& session, Func&& func) :
      session_(session), thread_(std::forward<Func>(func)) {}
  ~WatchdogJoiner() { Stop(); }

  void Stop() {
    if (!thread_.joinable()) return;
    {
      std::lock_guard lck(session_.mtx);
      session_.finished = true;
    }
    session_.cv.notify_all();
    thread_.join();
  }
};

inline int64_t ElapsedMs(const ExecutionSession& session) {
  using namespace std::chrono;
  return duration_cast<milliseconds>(ExecutionSession::Clock::now() - session.start_time).count();
}

} // namespace

bool SandboxManager::Register_(ExecutionSession& session) {
  std::lock_guard lck(mtx_);
  if (cancelling_) return false;
  sessions_.insert(&session);
  return true;
}

void SandboxManager::Unregister_(ExecutionSession& session) {
  std::lock_guard lck(mtx_);
  sessions_.erase(&session);
}

int64_t SandboxManager::EffectiveTimeout(const ExecutionRequest& req, const RuntimeProfile& profile) const {
  int64_t timeout = profile.timeout;
  if (req.timeout_cap && *req.timeout_cap > 0) {
    timeout = timeout > 0 ? std::min(timeout, *req.timeout_cap) : *req.timeout_cap;
  }
  if (limits_.max_timeout > 0) {
    timeout = timeout > 0 ? std::min(timeout, limits_.max_timeout) : limits_.max_timeout;
  }
  return timeout;
}

ContainerSpec SandboxManager::BuildSpec(const ExecutionRequest& req, const RuntimeProfile& profile) const {
  ContainerSpec spec;
  spec.image = profile.image;
  spec.command = profile.Command();
  spec.envs = profile.envs;
  spec.input_path = profile.code_path;
  spec.input = req.code;
  spec.cpus = profile.cpus;
  spec.memory = profile.memory;
  spec.pids = profile.pids;
  return spec;
}

// Creating -> Running. One retry with a fresh environment; a failed attempt is torn down
//  before the next one starts.
std::optional<ContainerHandle> SandboxManager::Provision_(ExecutionSession& session, const ContainerSpec& spec) {
  constexpr int kAttempts = 2;
  const std::string& id = session.request.request_id;
  for (int attempt = 0; attempt < kAttempts; attempt++) {
    if (session.IsCancelled()) return std::nullopt;
    auto handle = runtime_.Create(spec);
    if (!handle) {
      spdlog::warn("Container creation failed: id={} image={} attempt={}", id, spec.image, attempt);
      continue;
    }
    spdlog::info("Container created: id={} container={} image={}", id, *handle, spec.image);
    if (runtime_.Start(*handle)) {
      spdlog::info("Container started: id={} container={} command={}", id, *handle,
                   fmt::format("{}", spec.command));
      return handle;
    }
    spdlog::warn("Container start failed: id={} container={} attempt={}", id, *handle, attempt);
    EnvironmentGuard discard(runtime_, *handle);
  }
  return std::nullopt;
}

void SandboxManager::WatchDeadline_(ExecutionSession& session) {
  std::unique_lock lck(session.mtx);
  bool woken = session.cv.wait_until(lck, session.deadline, [&session]{
    return session.finished || session.cancelled;
  });
  if (session.finished) return;
  if (!woken) session.timed_out = true;
  ContainerHandle handle = *session.handle;
  bool timed_out = session.timed_out;
  lck.unlock();
  const std::string& id = session.request.request_id;
  spdlog::warn("Force-stopping container: id={} container={} reason={}", id,
               handle, timed_out ? "exceeded timeout" : "cancelled");
  // keep trying for the grace period, then remove the container to end its log stream
  auto give_up = ExecutionSession::Clock::now() + std::chrono::milliseconds(limits_.kill_grace);
  while (!runtime_.Kill(handle)) {
    spdlog::warn("Kill request failed: id={} container={}", id, handle);
    lck.lock();
    bool finished = session.cv.wait_until(
        lck, std::min(give_up, ExecutionSession::Clock::now() + kKillRetryInterval),
        [&session]{ return session.finished; });
    lck.unlock();
    if (finished) return;
    if (ExecutionSession::Clock::now() >= give_up) {
      spdlog::error("Container did not take a kill within grace period, removing: id={} container={}",
                    id, handle);
      if (!runtime_.Remove(handle)) {
        spdlog::error("Forced removal failed: id={} container={}", id, handle);
      }
      return;
    }
  }
}

// Running -> terminal
void SandboxManager::Execute_(ExecutionSession& session) {
  const std::string& id = session.request.request_id;
  const ContainerHandle handle = *session.handle;
  bool stream_ok;
  std::optional<int> exit_code;
  {
    WatchdogJoiner watchdog(session, [this, &session]{ WatchDeadline_(session); });
    stream_ok = runtime_.StreamLogs(handle, [&session](LogStream, const char* data, size_t len) {
      session.output.Append(data, len);
    });
    if (stream_ok) {
      // the output ended; the process may still be running until the deadline
      auto remaining = std::max(session.deadline - ExecutionSession::Clock::now(),
                                ExecutionSession::Clock::duration::zero());
      exit_code = runtime_.Wait(handle,
          std::chrono::duration_cast<std::chrono::milliseconds>(remaining) +
          std::chrono::milliseconds(limits_.kill_grace));
    }
    watchdog.Stop();
  }

  bool timed_out, cancelled;
  {
    std::lock_guard lck(session.mtx);
    timed_out = session.timed_out;
    cancelled = session.cancelled;
  }
  if (timed_out || cancelled) {
    if (!exit_code) {
      // make sure the kill has landed before the slot is given back
      exit_code = runtime_.Wait(handle, std::chrono::milliseconds(limits_.kill_grace));
      if (!exit_code) {
        spdlog::warn("Container did not acknowledge kill within grace period: id={} container={}", id, handle);
      }
    }
    session.exit_code = exit_code;
    session.status = timed_out ? SessionStatus::TIMED_OUT : SessionStatus::CANCELLED;
  } else if (!stream_ok || !exit_code) {
    spdlog::warn("Lost track of running container: id={} container={} stream_ok={}", id, handle, stream_ok);
    session.status = SessionStatus::FAILED;
  } else {
    session.exit_code = exit_code;
    session.status = SessionStatus::COMPLETED;
  }
}

ExecutionResult SandboxManager::Run(
    const AdmissionTicket& ticket, const ExecutionRequest& req, const RuntimeProfile* profile) {
  ExecutionSession session(req, limits_.max_output);
  ExecutionResult result;
  result.request_id = req.request_id;
  auto finish = [&](ErrorKind error) {
    result.error = error;
    result.status = session.status;
    result.exit_code = session.exit_code;
    result.truncated = session.output.Truncated();
    result.discarded_bytes = session.output.Discarded();
    result.output = session.output.Take();
    result.duration = ElapsedMs(session);
    spdlog::info("Session finished: id={} requestor={} status={} error={} exit={} output={} discarded={} time={}",
                 req.request_id, req.requestor_id, SessionStatusName(result.status), ErrorKindName(error),
                 result.exit_code ? *result.exit_code : -1, result.output.size(), result.discarded_bytes,
                 result.duration);
    return result;
  };
  if (!ticket.Valid()) {
    spdlog::error("Session started without a concurrency slot: id={}", req.request_id);
    session.status = SessionStatus::FAILED;
    return finish(ErrorKind::INFRASTRUCTURE_ERROR);
  }
  if (!Register_(session)) {
    session.status = SessionStatus::CANCELLED;
    return finish(ErrorKind::CANCELLED);
  }
  struct Unregister {
    SandboxManager* self;
    ExecutionSession& session;
    ~Unregister() { self->Unregister_(session); }
  } unregister{this, session};

  if (!profile) {
    spdlog::info("Unsupported language: id={} language={}", req.request_id, req.language);
    session.status = SessionStatus::FAILED;
    return finish(ErrorKind::UNSUPPORTED_LANGUAGE);
  }

  session.status = SessionStatus::CREATING;
  ContainerSpec spec = BuildSpec(req, *profile);
  auto handle = Provision_(session, spec);
  if (!handle) {
    if (session.IsCancelled()) {
      session.status = SessionStatus::CANCELLED;
      return finish(ErrorKind::CANCELLED);
    }
    session.status = SessionStatus::FAILED;
    return finish(ErrorKind::INFRASTRUCTURE_ERROR);
  }
  ErrorKind error;
  {
    EnvironmentGuard env(runtime_, *handle);
    int64_t timeout = EffectiveTimeout(req, *profile);
    {
      std::lock_guard lck(session.mtx);
      session.handle = handle;
      session.status = SessionStatus::RUNNING;
      session.deadline = timeout > 0 ?
          ExecutionSession::Clock::now() + std::chrono::milliseconds(timeout) :
          ExecutionSession::Clock::now() + kNoDeadline;
    }
    spdlog::debug("Deadline armed: id={} timeout={}", req.request_id, timeout);
    Execute_(session);
    if (session.exit_code) env.MarkExited();
    switch (session.status) {
      case SessionStatus::COMPLETED: {
        error = *session.exit_code == 0 ? ErrorKind::NONE : ErrorKind::RUNTIME_FAILURE;
        break;
      }
      case SessionStatus::TIMED_OUT: error = ErrorKind::TIMED_OUT; break;
      case SessionStatus::CANCELLED: error = ErrorKind::CANCELLED; break;
      default: error = ErrorKind::INFRASTRUCTURE_ERROR; break;
    }
  } // teardown
  return finish(error);
}

void SandboxManager::CancelAll() {
  std::lock_guard lck(mtx_);
  cancelling_ = true;
  for (ExecutionSession* session : sessions_) {
    {
      std::lock_guard session_lck(session->mtx);
      if (session->finished) continue;
      session->cancelled = true;
    }
    session->cv.notify_all();
    spdlog::info("Session cancelled: id={}", session->request.request_id);
  }
}

size_t SandboxManager::LiveSessions() {
  std::lock_guard lck(mtx_);
  return sessions_.size();
}
