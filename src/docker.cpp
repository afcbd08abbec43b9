#include "docker.h"

#include <cstring>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <sys/socket.h>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "http_utils.h"

namespace fs = std::filesystem;

namespace {

using namespace std::chrono_literals;

// the unprivileged nobody:nogroup
constexpr int kSandboxUid = 65534;
constexpr int kSandboxGid = 65534;
constexpr size_t kTarBlock = 512;

constexpr auto kRequestTimeout = 30s;
// the log stream ends when the process exits or is killed by the watchdog
constexpr auto kStreamTimeout = 24h;
constexpr auto kPullTimeout = 10min;

std::string ContainerPath(const ContainerHandle& handle, const std::string& action = "") {
  std::string ret = "/containers/" + handle;
  if (action.size()) ret += "/" + action;
  return ret;
}

void WriteOctal(char* field, size_t width, uint64_t value) {
  // width - 1 digits followed by NUL
  std::string str = fmt::format("{:0{}o}", value, width - 1);
  memcpy(field, str.data(), std::min(str.size(), width - 1));
  field[width - 1] = '\0';
}

std::pair<std::string, std::string> SplitImageTag(const std::string& image) {
  size_t colon = image.rfind(':');
  size_t slash = image.rfind('/');
  if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
    return {image, "latest"};
  }
  return {image.substr(0, colon), image.substr(colon + 1)};
}

} // namespace

void LogDemuxer::Feed(const char* data, size_t len) {
  while (len) {
    if (remaining_ == 0) {
      size_t need = std::min(sizeof(header_) - header_len_, len);
      memcpy(header_ + header_len_, data, need);
      header_len_ += need;
      data += need;
      len -= need;
      if (header_len_ < sizeof(header_)) return;
      header_len_ = 0;
      // 0 is stdin, which never appears in logs; treat unknown types as stdout
      stream_ = header_[0] == 2 ? LogStream::STDERR : LogStream::STDOUT;
      remaining_ = (size_t)header_[4] << 24 | (size_t)header_[5] << 16 |
                   (size_t)header_[6] << 8 | (size_t)header_[7];
      continue;
    }
    size_t take = std::min(remaining_, len);
    callback_(stream_, data, take);
    remaining_ -= take;
    data += take;
    len -= take;
  }
}

std::optional<std::string> MakeTarArchive(const std::string& name, const std::string& content,
                                          int uid, int gid) {
  if (name.empty() || name.size() >= 100) return std::nullopt;
  char header[kTarBlock] = {};
  memcpy(header, name.data(), name.size());
  WriteOctal(header + 100, 8, 0644);
  WriteOctal(header + 108, 8, uid);
  WriteOctal(header + 116, 8, gid);
  WriteOctal(header + 124, 12, content.size());
  WriteOctal(header + 136, 12, 0);
  header[156] = '0'; // regular file
  memcpy(header + 257, "ustar", 6);
  memcpy(header + 263, "00", 2);
  // checksum is computed with its own field filled with spaces
  memset(header + 148, ' ', 8);
  unsigned sum = 0;
  for (unsigned char c : header) sum += c;
  WriteOctal(header + 148, 7, sum);
  header[155] = ' ';

  std::string ret(header, kTarBlock);
  ret += content;
  ret.append((kTarBlock - content.size() % kTarBlock) % kTarBlock, '\0');
  // end-of-archive marker
  ret.append(kTarBlock * 2, '\0');
  return ret;
}

std::string CreateContainerBody(const ContainerSpec& spec) {
  using nlohmann::json;
  json host_config{
    {"CapDrop", {"ALL"}},
    {"NetworkMode", "none"},
    {"SecurityOpt", {"no-new-privileges"}},
    {"AutoRemove", false},
  };
  if (spec.cpus > 0) host_config["NanoCpus"] = (int64_t)(spec.cpus * 1e9);
  if (spec.memory > 0) {
    host_config["Memory"] = spec.memory;
    host_config["MemorySwap"] = spec.memory;
  }
  if (spec.pids > 0) host_config["PidsLimit"] = spec.pids;
  json body{
    {"Image", spec.image},
    {"Cmd", spec.command},
    {"Env", spec.envs},
    {"User", fmt::format("{}:{}", kSandboxUid, kSandboxGid)},
    {"WorkingDir", "/tmp"},
    {"NetworkDisabled", true},
    {"StopSignal", "SIGKILL"},
    {"AttachStdin", false},
    {"AttachStdout", true},
    {"AttachStderr", true},
    {"Tty", false},
    {"HostConfig", host_config},
  };
  return body.dump();
}

DockerRuntime::DockerRuntime(const std::string& address) : unix_socket_(true) {
  const std::string kUnixScheme = "unix://";
  if (address.rfind(kUnixScheme, 0) == 0) {
    address_ = address.substr(kUnixScheme.size());
  } else if (address.rfind("http://", 0) == 0) {
    address_ = address;
    unix_socket_ = false;
  } else {
    address_ = address;
  }
}

std::unique_ptr<httplib::Client> DockerRuntime::Connect_(std::chrono::milliseconds read_timeout) const {
  auto cli = std::make_unique<httplib::Client>(address_);
  if (unix_socket_) cli->set_address_family(AF_UNIX);
  long ms = std::max<long>(read_timeout.count(), 1);
  cli->set_connection_timeout(5, 0);
  cli->set_read_timeout(ms / 1000, ms % 1000 * 1000);
  cli->set_write_timeout(kRequestTimeout.count(), 0);
  return cli;
}

bool DockerRuntime::Upload_(const ContainerHandle& handle, const std::string& path, const std::string& content) {
  fs::path file(path);
  auto archive = MakeTarArchive(file.filename(), content, kSandboxUid, kSandboxGid);
  if (!archive) {
    spdlog::warn("Invalid input path: container={} path={}", handle, path);
    return false;
  }
  std::string dir = file.has_parent_path() ? std::string(file.parent_path()) : "/";
  auto cli = Connect_(kRequestTimeout);
  auto res = EnginePut(*cli, http_utils::WithQuery(ContainerPath(handle, "archive"), {{"path", dir}}),
                       *archive, "application/x-tar");
  if (!IsSuccess(res)) {
    spdlog::warn("Input upload failed: container={} {}", handle, http_utils::Describe(res));
    return false;
  }
  return true;
}

std::optional<ContainerHandle> DockerRuntime::Create(const ContainerSpec& spec) {
  auto cli = Connect_(kRequestTimeout);
  auto res = EnginePost(*cli, "/containers/create", CreateContainerBody(spec));
  if (!IsSuccess(res)) {
    spdlog::warn("Container creation failed: image={} {}", spec.image, http_utils::Describe(res));
    return std::nullopt;
  }
  ContainerHandle handle;
  try {
    handle = nlohmann::json::parse(res->body).at("Id").get<std::string>();
  } catch (nlohmann::json::exception& err) {
    spdlog::warn("Unexpected creation response: image={} error={}", spec.image, err.what());
    return std::nullopt;
  }
  if (spec.input_path.size() && !Upload_(handle, spec.input_path, spec.input)) {
    if (!Remove(handle)) {
      spdlog::error("Container leaked, remove it manually: container={}", handle);
    }
    return std::nullopt;
  }
  spdlog::debug("Container created: container={} image={}", handle, spec.image);
  return handle;
}

bool DockerRuntime::Start(const ContainerHandle& handle) {
  auto cli = Connect_(kRequestTimeout);
  auto res = EnginePost(*cli, ContainerPath(handle, "start"));
  // 304: already started
  if (IsSuccess(res, {304})) return true;
  spdlog::warn("Container start failed: container={} {}", handle, http_utils::Describe(res));
  return false;
}

bool DockerRuntime::StreamLogs(const ContainerHandle& handle, const LogCallback& callback) {
  auto cli = Connect_(kStreamTimeout);
  LogDemuxer demux(callback);
  httplib::ContentReceiver receiver = [&demux](const char* data, size_t len) {
    demux.Feed(data, len);
    return true;
  };
  auto res = EngineGet(*cli,
      http_utils::WithQuery(ContainerPath(handle, "logs"), {{"follow", "1"}, {"stdout", "1"}, {"stderr", "1"}}),
      receiver);
  if (!IsSuccess(res)) {
    spdlog::warn("Log stream failed: container={} {}", handle, http_utils::Describe(res));
    return false;
  }
  if (!demux.AtBoundary()) spdlog::debug("Log stream ended mid-frame: container={}", handle);
  return true;
}

std::optional<int> DockerRuntime::Wait(const ContainerHandle& handle, std::chrono::milliseconds timeout) {
  auto cli = Connect_(timeout);
  auto res = EnginePost(*cli, ContainerPath(handle, "wait"));
  if (!IsSuccess(res)) {
    spdlog::debug("Container wait failed: container={} {}", handle, http_utils::Describe(res));
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(res->body).at("StatusCode").get<int>();
  } catch (nlohmann::json::exception& err) {
    spdlog::warn("Unexpected wait response: container={} error={}", handle, err.what());
    return std::nullopt;
  }
}

bool DockerRuntime::Kill(const ContainerHandle& handle) {
  auto cli = Connect_(kRequestTimeout);
  auto res = EnginePost(*cli, ContainerPath(handle, "kill"));
  // 409: not running; 404: already gone
  if (IsSuccess(res, {409, 404})) return true;
  spdlog::warn("Container kill failed: container={} {}", handle, http_utils::Describe(res));
  return false;
}

bool DockerRuntime::Remove(const ContainerHandle& handle) {
  auto cli = Connect_(kRequestTimeout);
  auto res = EngineDelete(*cli, http_utils::WithQuery(ContainerPath(handle), {{"force", "1"}}));
  if (IsSuccess(res, {404})) {
    spdlog::debug("Container removed: container={}", handle);
    return true;
  }
  spdlog::warn("Container removal failed: container={} {}", handle, http_utils::Describe(res));
  return false;
}

bool DockerRuntime::PullImage(const std::string& image) {
  auto [name, tag] = SplitImageTag(image);
  auto cli = Connect_(kPullTimeout);
  const std::string path = http_utils::WithQuery("/images/create", {{"fromImage", name}, {"tag", tag}});
  auto res = RequestRetry(kPullRetries, "Pull of " + image, [&cli, &path]() { return EnginePost(*cli, path); });
  if (!IsSuccess(res)) {
    spdlog::error("Failed to pull image {}: {}", image, http_utils::Describe(res));
    return false;
  }
  // progress is a stream of JSON lines; failures arrive in-band
  std::istringstream lines(res->body);
  for (std::string line; std::getline(lines, line);) {
    if (line.empty()) continue;
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_object() && msg.contains("error")) {
      spdlog::error("Failed to pull image {}: {}", image, msg["error"].dump());
      return false;
    }
  }
  spdlog::info("Image ready: {}", image);
  return true;
}
