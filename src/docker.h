#ifndef DOCKER_H_
#define DOCKER_H_

#include <memory>
#include <string>
#include <optional>

#include <codie/runtime.h>

namespace httplib {
class Client;
} // namespace httplib

// Splits the multiplexed log stream of a non-TTY container.
// Each frame is an 8-byte header (stream type, 3 padding bytes, big-endian payload size)
//  followed by the payload; frames may be split at any byte across chunks.
class LogDemuxer {
  ContainerRuntime::LogCallback callback_;
  unsigned char header_[8];
  size_t header_len_;
  size_t remaining_;
  LogStream stream_;
 public:
  explicit LogDemuxer(const ContainerRuntime::LogCallback& callback) :
      callback_(callback), header_len_(0), remaining_(0), stream_(LogStream::STDOUT) {}

  void Feed(const char* data, size_t len);
  // true if the data fed so far ends on a frame boundary
  bool AtBoundary() const { return header_len_ == 0 && remaining_ == 0; }
};

// One-file ustar archive; std::nullopt if the name does not fit in the header
std::optional<std::string> MakeTarArchive(const std::string& name, const std::string& content,
                                          int uid = 0, int gid = 0);

class DockerRuntime : public ContainerRuntime {
  static constexpr int kPullRetries = 3;

  std::string address_;
  bool unix_socket_;

  std::unique_ptr<httplib::Client> Connect_(std::chrono::milliseconds read_timeout) const;
  bool Upload_(const ContainerHandle&, const std::string& path, const std::string& content);
 public:
  // "/path/to/docker.sock", "unix:///path/to/docker.sock" or "http://host:port"
  explicit DockerRuntime(const std::string& address);

  std::optional<ContainerHandle> Create(const ContainerSpec&) override;
  bool Start(const ContainerHandle&) override;
  bool StreamLogs(const ContainerHandle&, const LogCallback&) override;
  std::optional<int> Wait(const ContainerHandle&, std::chrono::milliseconds timeout) override;
  bool Kill(const ContainerHandle&) override;
  bool Remove(const ContainerHandle&) override;

  bool PullImage(const std::string& image);
};

// The request body of POST /containers/create
std::string CreateContainerBody(const ContainerSpec&);

#endif  // DOCKER_H_
