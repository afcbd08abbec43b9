#include <codie/profiles.h>

#include <stdexcept>
#include <algorithm>

#include <nlohmann/json.hpp>
#include <codie/utils.h>

namespace {

const char kCodePlaceholder[] = "{code}";

RuntimeProfile MakeProfile(
    const std::string& name, std::vector<std::string>&& aliases, const std::string& image,
    std::vector<std::string>&& command, const ProfileDefaults& defaults,
    std::vector<std::string>&& envs = {}) {
  RuntimeProfile ret;
  ret.name = name;
  ret.aliases = std::move(aliases);
  ret.image = image;
  ret.command = std::move(command);
  ret.envs = std::move(envs);
  ret.cpus = defaults.cpus;
  ret.memory = defaults.memory;
  ret.pids = defaults.pids;
  ret.timeout = defaults.timeout;
  return ret;
}

} // namespace

std::vector<std::string> RuntimeProfile::Command() const {
  std::vector<std::string> ret;
  for (std::string arg : command) {
    for (size_t pos = 0; (pos = arg.find(kCodePlaceholder, pos)) != std::string::npos;) {
      arg.replace(pos, sizeof(kCodePlaceholder) - 1, code_path);
      pos += code_path.size();
    }
    ret.push_back(std::move(arg));
  }
  return ret;
}

ProfileRegistry::ProfileRegistry(std::vector<RuntimeProfile>&& profiles) : profiles_(std::move(profiles)) {
  for (size_t i = 0; i < profiles_.size(); i++) {
    auto& profile = profiles_[i];
    profile.name = ToLower(profile.name);
    for (auto& alias : profile.aliases) alias = ToLower(alias);
    if (std::find(profile.aliases.begin(), profile.aliases.end(), profile.name) == profile.aliases.end()) {
      profile.aliases.insert(profile.aliases.begin(), profile.name);
    }
    for (auto& alias : profile.aliases) {
      if (auto it = alias_map_.insert({alias, i}); !it.second && it.first->second != i) {
        throw std::invalid_argument("Duplicated language alias " + alias);
      }
    }
  }
}

const RuntimeProfile* ProfileRegistry::Find(const std::string& language) const {
  auto it = alias_map_.find(ToLower(language));
  if (it == alias_map_.end()) return nullptr;
  return &profiles_[it->second];
}

std::vector<RuntimeProfile> DefaultProfiles(const ProfileDefaults& defaults) {
  std::vector<RuntimeProfile> ret;
  ret.push_back(MakeProfile("bash", {"sh", "zsh"}, "bash", {"bash", "{code}"}, defaults));
  ret.push_back(MakeProfile("c", {"h"}, "gcc",
      {"sh", "-c", "gcc -Wall -Wextra -x c {code} -o exe && ./exe"}, defaults));
  ret.push_back(MakeProfile("cpp", {"hpp", "cc", "hh", "c++", "h++", "cxx", "hxx"}, "gcc",
      {"sh", "-c", "g++ -Wall -Wextra -x c++ {code} -o exe && ./exe"}, defaults));
  // free-form source is normally picked by the file extension, which we don't have
  ret.push_back(MakeProfile("fortran", {"f90", "f95"}, "gcc",
      {"sh", "-c", "gfortran -Wall -Wextra -x f95 -ffree-form {code} -o exe && ./exe"}, defaults));
  ret.push_back(MakeProfile("go", {"golang"}, "golang:alpine",
      {"sh", "-c", "ln -s {code} code.go && go run code.go"}, defaults, {"GOCACHE=/tmp/.cache/go"}));
  // the class name comes from `public class Ident`
  ret.push_back(MakeProfile("java", {"jsp"}, "openjdk:alpine",
      {"sh", "-c", "class=$(sed -n 's/public\\s\\+class\\s\\+\\(\\w\\+\\).*/\\1/p' {code}); "
                   "ln -s {code} $class.java && javac $class.java && java $class"}, defaults));
  ret.push_back(MakeProfile("javascript", {"js", "jsx"}, "node:alpine", {"node", "{code}"}, defaults));
  ret.push_back(MakeProfile("perl", {"pl", "pm"}, "perl:slim", {"perl", "{code}"}, defaults));
  // unbuffered, or stdout & stderr interleave in odd orders
  ret.push_back(MakeProfile("python", {"py", "gyp"}, "python:alpine", {"python", "{code}"}, defaults,
      {"PYTHONUNBUFFERED=1"}));
  ret.push_back(MakeProfile("ruby", {"rb", "gemspec", "podspec", "thor", "irb"}, "ruby:alpine",
      {"ruby", "{code}"}, defaults));
  ret.push_back(MakeProfile("rust", {"rs"}, "rust:alpine", {"sh", "-c", "rustc {code} -o exe && ./exe"}, defaults));
  return ret;
}

std::vector<RuntimeProfile> ProfilesFromJson(const nlohmann::json& data, const ProfileDefaults& defaults) {
  const nlohmann::json& list = data.is_object() ? data.at("profiles") : data;
  if (!list.is_array()) throw std::invalid_argument("Profile list must be an array");
  std::vector<RuntimeProfile> ret;
  for (auto& item : list) {
    RuntimeProfile profile;
    profile.name = item.at("name").get<std::string>();
    profile.image = item.at("image").get<std::string>();
    profile.command = item.at("command").get<std::vector<std::string>>();
    if (profile.name.empty() || profile.image.empty() || profile.command.empty()) {
      throw std::invalid_argument("Profile needs a name, an image and a command");
    }
    profile.aliases = item.value("aliases", std::vector<std::string>());
    profile.envs = item.value("envs", std::vector<std::string>());
    profile.code_path = item.value("code_path", profile.code_path);
    profile.cpus = item.value("cpus", defaults.cpus);
    profile.memory = item.contains("memory_mb") ?
        item["memory_mb"].get<int64_t>() * 1024 * 1024 : defaults.memory;
    profile.pids = item.value("pids", defaults.pids);
    profile.timeout = item.value("timeout_ms", defaults.timeout);
    ret.push_back(std::move(profile));
  }
  return ret;
}

nlohmann::json ProfileToJson(const RuntimeProfile& profile) {
  return {
    {"name", profile.name},
    {"aliases", profile.aliases},
    {"image", profile.image},
    {"command", profile.command},
    {"limits", {
      {"cpus", profile.cpus},
      {"memory_mb", profile.memory / (1024 * 1024)},
      {"pids", profile.pids},
      {"timeout_ms", profile.timeout},
    }},
  };
}
