#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codie/profiles.h>

namespace {

const ProfileDefaults kDefaults{1.0, 128L * 1024 * 1024, 64, 10000};

} // namespace

TEST(Profiles, DefaultLanguages) {
  ProfileRegistry registry(DefaultProfiles(kDefaults));
  for (const char* lang : {"bash", "c", "cpp", "fortran", "go", "java", "javascript",
                           "perl", "python", "ruby", "rust"}) {
    auto profile = registry.Find(lang);
    ASSERT_NE(profile, nullptr) << lang;
    EXPECT_EQ(profile->name, lang);
    EXPECT_FALSE(profile->image.empty());
    EXPECT_EQ(profile->timeout, kDefaults.timeout);
  }
  EXPECT_EQ(registry.Size(), 11);
}

TEST(Profiles, AliasLookupIsCaseInsensitive) {
  ProfileRegistry registry(DefaultProfiles(kDefaults));
  auto py = registry.Find("py");
  ASSERT_NE(py, nullptr);
  EXPECT_EQ(py->name, "python");
  EXPECT_EQ(registry.Find("PY"), py);
  EXPECT_EQ(registry.Find("Python"), py);
  ASSERT_NE(registry.Find("c++"), nullptr);
  EXPECT_EQ(registry.Find("c++")->name, "cpp");
  EXPECT_EQ(registry.Find("js")->name, "javascript");
  EXPECT_EQ(registry.Find("cobol"), nullptr);
  EXPECT_EQ(registry.Find(""), nullptr);
}

TEST(Profiles, CommandSubstitutesCodePath) {
  RuntimeProfile profile;
  profile.command = {"sh", "-c", "cat {code} && rustc {code}"};
  profile.code_path = "/tmp/main";
  std::vector<std::string> expected{"sh", "-c", "cat /tmp/main && rustc /tmp/main"};
  EXPECT_EQ(profile.Command(), expected);
}

TEST(Profiles, DuplicatedAlias) {
  std::vector<RuntimeProfile> profiles = DefaultProfiles(kDefaults);
  profiles[0].aliases.push_back("PY");
  EXPECT_THROW(ProfileRegistry(std::move(profiles)), std::invalid_argument);
}

TEST(Profiles, FromJson) {
  auto data = nlohmann::json::parse(R"({"profiles": [
    {"name": "Lua", "aliases": ["luajit"], "image": "nickblah/lua", "command": ["lua", "{code}"],
     "memory_mb": 64, "timeout_ms": 3000},
    {"name": "sh", "image": "alpine", "command": ["sh", "{code}"], "envs": ["HOME=/tmp"]}
  ]})");
  ProfileRegistry registry(ProfilesFromJson(data, kDefaults));
  auto lua = registry.Find("LUAJIT");
  ASSERT_NE(lua, nullptr);
  EXPECT_EQ(lua->name, "lua");
  EXPECT_EQ(lua->memory, 64L * 1024 * 1024);
  EXPECT_EQ(lua->timeout, 3000);
  EXPECT_EQ(lua->pids, kDefaults.pids);
  auto sh = registry.Find("sh");
  ASSERT_NE(sh, nullptr);
  EXPECT_EQ(sh->timeout, kDefaults.timeout);
  EXPECT_EQ(sh->envs, std::vector<std::string>{"HOME=/tmp"});
  EXPECT_EQ(sh->Command(), (std::vector<std::string>{"sh", "/tmp/code"}));

  auto dumped = ProfileToJson(*lua);
  EXPECT_EQ(dumped["limits"]["memory_mb"], 64);
  EXPECT_EQ(dumped["aliases"][0], "lua");
}

TEST(Profiles, FromJsonMalformed) {
  EXPECT_THROW(ProfilesFromJson(nlohmann::json::parse(R"([{"name": "x"}])"), kDefaults),
               nlohmann::json::exception);
  EXPECT_THROW(ProfilesFromJson(nlohmann::json::parse(R"([{"name": "x", "image": "", "command": ["a"]}])"),
                                kDefaults),
               std::invalid_argument);
  EXPECT_THROW(ProfilesFromJson(nlohmann::json::parse(R"({"profiles": 3})"), kDefaults),
               std::invalid_argument);
}
