#include <codie/config.h>

int kMaxParallel = 4;
size_t kMaxQueue = 20;

int64_t kRateLimitWindow = 60 * 1000; // 1 min
int kRateLimitCount = 5;

int64_t kDefaultTimeout = 30 * 1000;
int64_t kMaxTimeout = 60 * 1000;
int64_t kKillGrace = 5 * 1000;

// what fits in one chat message along with the exit status line
size_t kMaxOutput = 1900;
size_t kMaxSource = 64 * 1024;

double kCpus = 1.0;
int64_t kMemory = 128L * 1024 * 1024; // 128M
int64_t kPidsLimit = 64;

std::string kStorePath = "/var/lib/codie/db.sqlite";
std::string kRuntimeAddress = "/var/run/docker.sock";
std::string kProfilesPath = "";
std::string kListenHost = "127.0.0.1";
int kListenPort = 8080;
bool kPullImages = false;
