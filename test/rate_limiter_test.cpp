#include <atomic>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <codie/rate_limiter.h>

#include "memory_store.h"

namespace {

constexpr int64_t kWindow = 60000;
constexpr int64_t kStart = 1700000000000;

class RateLimiterTest : public testing::Test {
 protected:
  MemoryStore store;
  std::atomic<int64_t> now{kStart};
  RateLimiter limiter{store, kWindow, 5, [this]{ return now.load(); }};
};

} // namespace

TEST_F(RateLimiterTest, AllowsUpToLimit) {
  for (int i = 0; i < 5; i++) {
    auto decision = limiter.CheckAndReserve("alice");
    EXPECT_TRUE(decision.allowed) << i;
    EXPECT_EQ(decision.retry_after, 0);
  }
  EXPECT_EQ(limiter.CurrentCount("alice"), 5);
  now += 15000;
  auto decision = limiter.CheckAndReserve("alice");
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.retry_after, kWindow - 15000);
  // a rejected request does not count
  EXPECT_EQ(limiter.CurrentCount("alice"), 5);
  // other requestors are independent
  EXPECT_TRUE(limiter.CheckAndReserve("bob").allowed);
}

TEST_F(RateLimiterTest, WindowResets) {
  for (int i = 0; i < 5; i++) ASSERT_TRUE(limiter.CheckAndReserve("alice").allowed);
  now += kWindow - 1;
  EXPECT_FALSE(limiter.CheckAndReserve("alice").allowed);
  EXPECT_EQ(limiter.CheckAndReserve("alice").retry_after, 1);
  now += 1;
  EXPECT_EQ(limiter.CurrentCount("alice"), 0);
  EXPECT_TRUE(limiter.CheckAndReserve("alice").allowed);
  EXPECT_EQ(limiter.CurrentCount("alice"), 1);
}

TEST_F(RateLimiterTest, FailsClosed) {
  store.unavailable = true;
  auto decision = limiter.CheckAndReserve("alice");
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.retry_after, kWindow);
  EXPECT_EQ(limiter.CurrentCount("alice"), std::nullopt);
  store.unavailable = false;
  EXPECT_TRUE(limiter.CheckAndReserve("alice").allowed);
}

TEST_F(RateLimiterTest, RetriesOnConflict) {
  store.forced_conflicts = 3;
  EXPECT_TRUE(limiter.CheckAndReserve("alice").allowed);
  EXPECT_EQ(store.cas_calls.load(), 4);
  EXPECT_EQ(limiter.CurrentCount("alice"), 1);
}

TEST_F(RateLimiterTest, PersistentConflictRejects) {
  store.forced_conflicts = 1000;
  EXPECT_FALSE(limiter.CheckAndReserve("alice").allowed);
  store.forced_conflicts = 0;
  EXPECT_EQ(limiter.CurrentCount("alice"), 0);
}

TEST_F(RateLimiterTest, MalformedRecordStartsNewWindow) {
  ASSERT_TRUE(store.Put(RateLimiter::Key("alice"), "garbage"));
  EXPECT_TRUE(limiter.CheckAndReserve("alice").allowed);
  EXPECT_EQ(limiter.CurrentCount("alice"), 1);
}

TEST_F(RateLimiterTest, Release) {
  for (int i = 0; i < 5; i++) ASSERT_TRUE(limiter.CheckAndReserve("alice").allowed);
  limiter.Release("alice");
  EXPECT_EQ(limiter.CurrentCount("alice"), 4);
  EXPECT_TRUE(limiter.CheckAndReserve("alice").allowed);
  // nothing to give back in a fresh window
  now += kWindow;
  limiter.Release("alice");
  EXPECT_EQ(limiter.CurrentCount("alice"), 0);
  limiter.Release("nobody");
  EXPECT_EQ(limiter.CurrentCount("nobody"), 0);
}

TEST_F(RateLimiterTest, ConcurrentReservationsNeverExceedLimit) {
  constexpr int kThreads = 16;
  std::atomic_int allowed = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&]{
      if (limiter.CheckAndReserve("alice").allowed) allowed++;
    });
  }
  for (auto& thr : threads) thr.join();
  EXPECT_LE(allowed.load(), 5);
  EXPECT_EQ(limiter.CurrentCount("alice"), allowed.load());
}

TEST(RateLimitRecord, Parse) {
  RateLimitRecord rec{kStart, 3};
  auto parsed = RateLimitRecord::Parse(rec.Serialize());
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->window_start, kStart);
  EXPECT_EQ(parsed->count, 3);
  EXPECT_FALSE(RateLimitRecord::Parse("{}"));
  EXPECT_FALSE(RateLimitRecord::Parse(R"({"window_start": 1, "count": -1})"));
  EXPECT_FALSE(RateLimitRecord::Parse("not json"));
}
