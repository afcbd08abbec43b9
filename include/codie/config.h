#ifndef INCLUDE_CODIE_CONFIG_H_
#define INCLUDE_CODIE_CONFIG_H_

#include <string>
#include <cstddef>
#include <cstdint>

// Process-wide settings; filled from the configuration file and command line
//  at start-up and never modified afterwards.

// concurrency & queueing
extern int kMaxParallel;
extern size_t kMaxQueue;

// rate limit
extern int64_t kRateLimitWindow; // ms
extern int kRateLimitCount;

// ms
extern int64_t kDefaultTimeout;
extern int64_t kMaxTimeout;
extern int64_t kKillGrace;

// bytes
extern size_t kMaxOutput;
extern size_t kMaxSource;

// default runtime limits; profiles may override
extern double kCpus;
extern int64_t kMemory; // bytes
extern int64_t kPidsLimit;

extern std::string kStorePath;
extern std::string kRuntimeAddress;
extern std::string kProfilesPath; // empty for built-in profiles
extern std::string kListenHost;
extern int kListenPort;
extern bool kPullImages;

#endif  // INCLUDE_CODIE_CONFIG_H_
