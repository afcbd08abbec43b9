#include <signal.h>
#include <pthread.h>
#include <unistd.h>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <unordered_set>

#include <httplib.h>
#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>

#include <codie/config.h>
#include <codie/profiles.h>
#include <codie/sandbox.h>
#include <codie/admission.h>
#include <codie/rate_limiter.h>
#include <codie/orchestrator.h>
#include "docker.h"
#include "database.h"
#include "server_io.h"

namespace fs = std::filesystem;

namespace {

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxQueue = ini[""]["max_queue"] | kMaxQueue;
  kRateLimitWindow = (ini[""]["rate_limit_window_sec"] | (kRateLimitWindow / 1000)) * 1000;
  kRateLimitCount = ini[""]["rate_limit_count"] | kRateLimitCount;
  kDefaultTimeout = ini[""]["default_timeout_ms"] | kDefaultTimeout;
  kMaxTimeout = ini[""]["max_timeout_ms"] | kMaxTimeout;
  kKillGrace = ini[""]["kill_grace_ms"] | kKillGrace;
  kMaxOutput = ini[""]["max_output_bytes"] | kMaxOutput;
  kMaxSource = ini[""]["max_source_bytes"] | kMaxSource;
  kCpus = ini[""]["cpus"] | kCpus;
  kMemory = (ini[""]["memory_mb"] | (kMemory / 1024 / 1024)) * 1024 * 1024;
  kPidsLimit = ini[""]["pids_limit"] | kPidsLimit;
  kStorePath = ini[""]["store_path"] | kStorePath;
  kRuntimeAddress = ini[""]["runtime_address"] | kRuntimeAddress;
  kProfilesPath = ini[""]["profiles"] | kProfilesPath;
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kListenPort = ini[""]["listen_port"] | kListenPort;
  kPullImages = ini[""]["pull_images"] | kPullImages;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codie-server");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/codie.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("--listen-port")
    .scan<'d', int>()
    .help("Port of the HTTP gateway");
  parser.add_argument("--pull-images")
    .default_value(false)
    .implicit_value(true)
    .help("Pull the image of every language before serving");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<int>("--listen-port")) {
    kListenPort = val.value();
  }
  if (parser["--pull-images"] == true) kPullImages = true;
}

std::optional<std::vector<RuntimeProfile>> LoadProfiles() {
  ProfileDefaults defaults{kCpus, kMemory, kPidsLimit, kDefaultTimeout};
  if (kProfilesPath.empty()) return DefaultProfiles(defaults);
  std::ifstream fin(kProfilesPath);
  if (!fin) {
    spdlog::error("Failed to open profile file {}", kProfilesPath);
    return std::nullopt;
  }
  try {
    return ProfilesFromJson(nlohmann::json::parse(fin), defaults);
  } catch (nlohmann::json::exception& err) {
    spdlog::error("Malformed profile file {}: {}", kProfilesPath, err.what());
  } catch (std::invalid_argument& err) {
    spdlog::error("Invalid profile file {}: {}", kProfilesPath, err.what());
  }
  return std::nullopt;
}

void PullImages(DockerRuntime& runtime, const ProfileRegistry& registry) {
  std::unordered_set<std::string> images;
  for (auto& profile : registry.Profiles()) images.insert(profile.image);
  spdlog::info("Pre-pulling {} images", images.size());
  std::vector<std::thread> threads;
  for (auto& image : images) {
    threads.emplace_back([&runtime, &image]() { runtime.PullImage(image); });
  }
  for (auto& thr : threads) thr.join();
  spdlog::info("All images done pulling");
}

bool ValidateConfig() {
  if (kMaxParallel <= 0) {
    spdlog::error("parallel must be positive");
    return false;
  }
  if (kRateLimitWindow <= 0 || kRateLimitCount <= 0) {
    spdlog::error("Rate limit window and count must be positive");
    return false;
  }
  if (kDefaultTimeout <= 0) {
    spdlog::error("default_timeout_ms must be positive");
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  ParseArgs(argc, argv);
  if (!ValidateConfig()) return 1;

  ProfileRegistry registry;
  if (auto profiles = LoadProfiles()) {
    try {
      registry = ProfileRegistry(std::move(*profiles));
    } catch (std::invalid_argument& err) {
      spdlog::error("Invalid profiles: {}", err.what());
      return 1;
    }
  } else {
    return 1;
  }
  spdlog::info("Loaded {} language profiles", registry.Size());

  if (fs::path store_dir = fs::path(kStorePath).parent_path(); !store_dir.empty()) {
    std::error_code ec;
    fs::create_directories(store_dir, ec);
    if (ec) spdlog::warn("Failed to create {}: {}", std::string(store_dir), ec.message());
  }
  SqliteStore store(kStorePath);
  // the store is reopened lazily, so an outage here is not fatal; requests fail closed meanwhile
  if (!store.Init()) spdlog::warn("Store {} is currently unavailable", kStorePath);

  DockerRuntime runtime(kRuntimeAddress);
  if (kPullImages) PullImages(runtime, registry);

  RateLimiter limiter(store, kRateLimitWindow, kRateLimitCount);
  AdmissionController admission(limiter, kMaxParallel, kMaxQueue, kMaxSource);
  SandboxManager sandbox(runtime, SandboxLimits{kMaxTimeout, kKillGrace, kMaxOutput});
  Orchestrator orchestrator(registry, admission, sandbox);

  // every queued request holds a server thread while it waits
  httplib::Server svr;
  svr.new_task_queue = [] { return new httplib::ThreadPool(kMaxParallel + kMaxQueue + 4); };
  SetupServer(svr, orchestrator);

  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
  std::thread signal_thread([&]() {
    int sig = 0;
    sigwait(&sigs, &sig);
    spdlog::warn("Received signal {}, shutting down", sig);
    // in-flight requests are answered before the server stops
    orchestrator.Shutdown();
    svr.stop();
  });

  bool served = ServeForever(svr, kListenHost, kListenPort);
  if (!served) kill(getpid(), SIGTERM);
  signal_thread.join();
  return served ? 0 : 1;
}
