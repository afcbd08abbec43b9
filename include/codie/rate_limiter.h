#ifndef INCLUDE_CODIE_RATE_LIMITER_H_
#define INCLUDE_CODIE_RATE_LIMITER_H_

#include <string>
#include <cstdint>
#include <optional>
#include <functional>

#include "store.h"

struct RateLimitRecord {
  int64_t window_start; // UNIX timestamp, milliseconds
  int count;

  std::string Serialize() const;
  // std::nullopt if malformed
  static std::optional<RateLimitRecord> Parse(const std::string&);
};

struct RateLimitDecision {
  bool allowed;
  int64_t retry_after; // ms; 0 if allowed
};

class RateLimiter {
 public:
  using Clock = std::function<int64_t()>; // UNIX ms

 private:
  KeyValueStore& store_;
  int64_t window_; // ms
  int limit_;
  Clock clock_;

  static constexpr int kMaxCasAttempts = 16;

 public:
  RateLimiter(KeyValueStore& store, int64_t window, int limit, Clock clock = {});

  // Atomic per requestor; fails closed if the store is unreachable or keeps conflicting.
  RateLimitDecision CheckAndReserve(const std::string& requestor_id);
  // Give back a reservation made in the current window. Best-effort: failures are only logged.
  void Release(const std::string& requestor_id);
  // std::nullopt if the store is unreachable; records of an elapsed window count as zero
  std::optional<int> CurrentCount(const std::string& requestor_id);

  static std::string Key(const std::string& requestor_id);
};

#endif  // INCLUDE_CODIE_RATE_LIMITER_H_
