#ifndef INCLUDE_CODIE_PROFILES_H_
#define INCLUDE_CODIE_PROFILES_H_

#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

class RuntimeProfile {
 public:
  std::string name;
  std::vector<std::string> aliases; // lowercase; includes name
  std::string image;
  // every "{code}" is replaced by code_path
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string code_path;
  // limits; 0 for unlimited
  double cpus;
  int64_t memory; // bytes
  int64_t pids;
  int64_t timeout; // ms

  RuntimeProfile() : code_path("/tmp/code"), cpus(0), memory(0), pids(0), timeout(0) {}

  std::vector<std::string> Command() const;
};

struct ProfileDefaults {
  double cpus;
  int64_t memory;
  int64_t pids;
  int64_t timeout;
};

class ProfileRegistry {
  std::vector<RuntimeProfile> profiles_;
  std::unordered_map<std::string, size_t> alias_map_;
 public:
  ProfileRegistry() {}
  // throws std::invalid_argument on duplicated aliases
  explicit ProfileRegistry(std::vector<RuntimeProfile>&& profiles);

  // case-insensitive; nullptr if unknown
  const RuntimeProfile* Find(const std::string& language) const;
  const std::vector<RuntimeProfile>& Profiles() const { return profiles_; }
  size_t Size() const { return profiles_.size(); }
};

// The languages codie supports out of the box
std::vector<RuntimeProfile> DefaultProfiles(const ProfileDefaults&);
// throws nlohmann::json::exception or std::invalid_argument on malformed input
std::vector<RuntimeProfile> ProfilesFromJson(const nlohmann::json&, const ProfileDefaults&);
nlohmann::json ProfileToJson(const RuntimeProfile&);

#endif  // INCLUDE_CODIE_PROFILES_H_
