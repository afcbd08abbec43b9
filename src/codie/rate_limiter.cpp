#include <codie/rate_limiter.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codie/utils.h>

std::string RateLimitRecord::Serialize() const {
  return nlohmann::json{{"window_start", window_start}, {"count", count}}.dump();
}

std::optional<RateLimitRecord> RateLimitRecord::Parse(const std::string& str) {
  try {
    auto data = nlohmann::json::parse(str);
    RateLimitRecord ret{data.at("window_start").get<int64_t>(), data.at("count").get<int>()};
    if (ret.count < 0) return std::nullopt;
    return ret;
  } catch (nlohmann::json::exception&) {
    return std::nullopt;
  }
}

RateLimiter::RateLimiter(KeyValueStore& store, int64_t window, int limit, Clock clock) :
    store_(store), window_(window), limit_(limit), clock_(clock ? std::move(clock) : Clock(UnixMillis)) {}

std::string RateLimiter::Key(const std::string& requestor_id) {
  return "ratelimit:" + requestor_id;
}

namespace {

// The record as it applies at `now`; a new window if absent, malformed or elapsed
RateLimitRecord CurrentRecord(const std::optional<std::string>& value, int64_t now, int64_t window,
                              const std::string& key) {
  if (!value) return {now, 0};
  auto rec = RateLimitRecord::Parse(*value);
  if (!rec) {
    spdlog::warn("Malformed rate limit record: key={} value={}", key, *value);
    return {now, 0};
  }
  // a window start in the future (clock skew between instances) still counts as current
  if (now - rec->window_start >= window) return {now, 0};
  return *rec;
}

} // namespace

RateLimitDecision RateLimiter::CheckAndReserve(const std::string& requestor_id) {
  const std::string key = Key(requestor_id);
  for (int attempt = 0; attempt < kMaxCasAttempts; attempt++) {
    int64_t now = clock_();
    std::optional<std::string> value;
    if (!store_.Get(key, value)) {
      spdlog::warn("Rate limit store unavailable, rejecting: requestor={}", requestor_id);
      return {false, window_};
    }
    RateLimitRecord rec = CurrentRecord(value, now, window_, key);
    if (rec.count >= limit_) {
      return {false, std::max<int64_t>(1, rec.window_start + window_ - now)};
    }
    rec.count++;
    CasResult res = store_.CompareAndSwap(key, value, rec.Serialize());
    switch (res) {
      case CasResult::SWAPPED: {
        spdlog::debug("Rate limit reserved: requestor={} count={}/{}", requestor_id, rec.count, limit_);
        return {true, 0};
      }
      case CasResult::CONFLICT: break;
      case CasResult::UNAVAILABLE: {
        spdlog::warn("Rate limit store unavailable, rejecting: requestor={}", requestor_id);
        return {false, window_};
      }
    }
    spdlog::debug("Rate limit update conflict: requestor={} attempt={}", requestor_id, attempt);
  }
  spdlog::warn("Rate limit update kept conflicting, rejecting: requestor={}", requestor_id);
  return {false, window_};
}

void RateLimiter::Release(const std::string& requestor_id) {
  const std::string key = Key(requestor_id);
  for (int attempt = 0; attempt < kMaxCasAttempts; attempt++) {
    std::optional<std::string> value;
    if (!store_.Get(key, value)) break;
    if (!value) return;
    RateLimitRecord rec = CurrentRecord(value, clock_(), window_, key);
    // a new window has nothing to give back
    if (rec.count == 0) return;
    rec.count--;
    CasResult res = store_.CompareAndSwap(key, value, rec.Serialize());
    if (res == CasResult::SWAPPED) {
      spdlog::debug("Rate limit refunded: requestor={} count={}/{}", requestor_id, rec.count, limit_);
      return;
    }
    if (res == CasResult::UNAVAILABLE) break;
  }
  spdlog::warn("Failed to refund rate limit reservation: requestor={}", requestor_id);
}

std::optional<int> RateLimiter::CurrentCount(const std::string& requestor_id) {
  const std::string key = Key(requestor_id);
  std::optional<std::string> value;
  if (!store_.Get(key, value)) return std::nullopt;
  return CurrentRecord(value, clock_(), window_, key).count;
}
