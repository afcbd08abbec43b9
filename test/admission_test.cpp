#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <codie/utils.h>
#include <codie/admission.h>

#include "memory_store.h"

namespace {

using namespace std::chrono_literals;

class AdmissionTest : public testing::Test {
 protected:
  MemoryStore store;
  RateLimiter limiter{store, 60000, 100};
  AdmissionController admission{limiter, 2, 2, 1024};

  // polls until the admission queue reaches size
  bool WaitQueued(size_t size) {
    for (int i = 0; i < 500; i++) {
      if (admission.QueueSize() == size) return true;
      std::this_thread::sleep_for(2ms);
    }
    return false;
  }
};

} // namespace

TEST_F(AdmissionTest, TooLarge) {
  auto res = admission.Admit(MakeRequest("alice", "py", std::string(1025, 'x')));
  EXPECT_FALSE(res.ticket);
  EXPECT_EQ(res.reason, ErrorKind::TOO_LARGE);
  // rejected before the rate limiter
  EXPECT_EQ(limiter.CurrentCount("alice"), 0);
  EXPECT_TRUE(admission.Admit(MakeRequest("alice", "py", std::string(1024, 'x'))).ticket);
}

TEST_F(AdmissionTest, RateLimited) {
  RateLimiter strict(store, 60000, 1);
  AdmissionController controller(strict, 2, 2, 1024);
  auto first = controller.Admit(MakeRequest("alice", "py", "1"));
  ASSERT_TRUE(first.ticket);
  auto second = controller.Admit(MakeRequest("alice", "py", "1"));
  EXPECT_FALSE(second.ticket);
  EXPECT_EQ(second.reason, ErrorKind::RATE_LIMITED);
  EXPECT_GT(second.retry_after, 0);
  EXPECT_EQ(controller.ActiveSlots(), 1);
}

TEST_F(AdmissionTest, TicketReleasesOnce) {
  auto res = admission.Admit(MakeRequest("alice", "py", "1"));
  ASSERT_TRUE(res.ticket);
  EXPECT_EQ(res.reason, ErrorKind::NONE);
  EXPECT_EQ(admission.ActiveSlots(), 1);
  AdmissionTicket moved = std::move(*res.ticket);
  EXPECT_FALSE(res.ticket->Valid());
  EXPECT_TRUE(moved.Valid());
  moved.Release();
  moved.Release();
  res.ticket.reset();
  EXPECT_EQ(admission.ActiveSlots(), 0);
}

TEST_F(AdmissionTest, QueueIsFifoAndBounded) {
  auto t1 = admission.Admit(MakeRequest("a", "py", "1"));
  auto t2 = admission.Admit(MakeRequest("b", "py", "1"));
  ASSERT_TRUE(t1.ticket && t2.ticket);
  EXPECT_EQ(admission.ActiveSlots(), 2);

  std::vector<std::string> order;
  std::mutex order_mtx;
  auto Enqueue = [&](const std::string& name) {
    return std::thread([&, name]{
      auto res = admission.Admit(MakeRequest(name, "py", "1"));
      ASSERT_TRUE(res.ticket);
      {
        std::lock_guard lck(order_mtx);
        order.push_back(name);
      }
      res.ticket->Release();
    });
  };
  std::thread q1 = Enqueue("c");
  ASSERT_TRUE(WaitQueued(1));
  std::thread q2 = Enqueue("d");
  ASSERT_TRUE(WaitQueued(2));

  // queue full: rejected, and the reservation is given back
  auto rejected = admission.Admit(MakeRequest("e", "py", "1"));
  EXPECT_FALSE(rejected.ticket);
  EXPECT_EQ(rejected.reason, ErrorKind::OVERLOADED);
  EXPECT_EQ(limiter.CurrentCount("e"), 0);
  EXPECT_EQ(admission.QueueSize(), 2);

  t1.ticket->Release();
  q1.join();
  t2.ticket->Release();
  q2.join();
  ASSERT_EQ(order.size(), 2);
  EXPECT_EQ(order[0], "c");
  EXPECT_EQ(order[1], "d");
  EXPECT_EQ(admission.ActiveSlots(), 0);
  EXPECT_EQ(admission.QueueSize(), 0);
}

TEST_F(AdmissionTest, ZeroQueueRejectsWhenBusy) {
  AdmissionController controller(limiter, 1, 0, 1024);
  auto first = controller.Admit(MakeRequest("a", "py", "1"));
  ASSERT_TRUE(first.ticket);
  auto second = controller.Admit(MakeRequest("b", "py", "1"));
  EXPECT_EQ(second.reason, ErrorKind::OVERLOADED);
}

TEST_F(AdmissionTest, ShutdownCancelsQueued) {
  auto t1 = admission.Admit(MakeRequest("a", "py", "1"));
  auto t2 = admission.Admit(MakeRequest("b", "py", "1"));
  ASSERT_TRUE(t1.ticket && t2.ticket);
  AdmissionResult queued;
  std::thread thr([&]{ queued = admission.Admit(MakeRequest("c", "py", "1")); });
  ASSERT_TRUE(WaitQueued(1));
  admission.Shutdown();
  thr.join();
  EXPECT_FALSE(queued.ticket);
  EXPECT_EQ(queued.reason, ErrorKind::CANCELLED);
  EXPECT_EQ(limiter.CurrentCount("c"), 0);
  EXPECT_EQ(admission.Admit(MakeRequest("d", "py", "1")).reason, ErrorKind::CANCELLED);

  // running tickets are unaffected until released
  EXPECT_EQ(admission.ActiveSlots(), 2);
  std::atomic_bool idle = false;
  std::thread waiter([&]{
    admission.WaitIdle();
    idle = true;
  });
  t1.ticket->Release();
  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(idle);
  t2.ticket->Release();
  waiter.join();
  EXPECT_TRUE(idle);
}

TEST_F(AdmissionTest, NeverExceedsCapacity) {
  AdmissionController controller(limiter, 3, 100, 1024);
  std::atomic_int running = 0, peak = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < 20; i++) {
    threads.emplace_back([&, i]{
      auto res = controller.Admit(MakeRequest(std::to_string(i % 4), "py", "1"));
      ASSERT_TRUE(res.ticket);
      int now = ++running;
      for (int cur = peak; now > cur && !peak.compare_exchange_weak(cur, now);) {}
      std::this_thread::sleep_for(5ms);
      running--;
    });
  }
  for (auto& thr : threads) thr.join();
  EXPECT_LE(peak.load(), 3);
  EXPECT_EQ(controller.ActiveSlots(), 0);
}
