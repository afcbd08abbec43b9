#ifndef INCLUDE_CODIE_RUNTIME_H_
#define INCLUDE_CODIE_RUNTIME_H_

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <functional>

#define ENUM_LOG_STREAM_ \
  X(STDOUT) \
  X(STDERR)
enum class LogStream {
#define X(name) name,
  ENUM_LOG_STREAM_
#undef X
};

class ContainerSpec {
 public:
  std::string image;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // the file injected before start
  std::string input_path, input;
  // 0 for unlimited
  double cpus;
  int64_t memory; // bytes
  int64_t pids;

  ContainerSpec() : cpus(0), memory(0), pids(0) {}
};

using ContainerHandle = std::string;

// The container runtime the sandbox manager drives. Calls may block for network I/O;
//  Kill and Remove may be called from another thread while StreamLogs is blocking.
class ContainerRuntime {
 public:
  using LogCallback = std::function<void(LogStream, const char*, size_t)>;

  virtual ~ContainerRuntime() = default;

  // create the environment with the input file in place; std::nullopt on failure
  virtual std::optional<ContainerHandle> Create(const ContainerSpec&) = 0;
  virtual bool Start(const ContainerHandle&) = 0;
  // blocks until the output ends (process exit or kill); false on transport error
  virtual bool StreamLogs(const ContainerHandle&, const LogCallback&) = 0;
  // exit code; std::nullopt on failure or if it does not exit within timeout
  virtual std::optional<int> Wait(const ContainerHandle&, std::chrono::milliseconds timeout) = 0;
  // killing a stopped environment counts as success
  virtual bool Kill(const ContainerHandle&) = 0;
  virtual bool Remove(const ContainerHandle&) = 0;
};

#endif  // INCLUDE_CODIE_RUNTIME_H_
