#ifndef INCLUDE_CODIE_ADMISSION_H_
#define INCLUDE_CODIE_ADMISSION_H_

#include <deque>
#include <mutex>
#include <string>
#include <cstdint>
#include <optional>
#include <condition_variable>

#include "execution.h"
#include "rate_limiter.h"

class AdmissionController;

// Holds one concurrency slot; the slot is returned exactly once, on Release() or destruction.
class AdmissionTicket {
  AdmissionController* controller_;
  std::string request_id_;
 public:
  AdmissionTicket() : controller_(nullptr) {}
  AdmissionTicket(AdmissionController* controller, const std::string& request_id) :
      controller_(controller), request_id_(request_id) {}
  AdmissionTicket(const AdmissionTicket&) = delete;
  AdmissionTicket& operator=(const AdmissionTicket&) = delete;
  AdmissionTicket(AdmissionTicket&& x) noexcept;
  AdmissionTicket& operator=(AdmissionTicket&& x) noexcept;
  ~AdmissionTicket() { Release(); }

  bool Valid() const { return controller_ != nullptr; }
  const std::string& RequestId() const { return request_id_; }
  void Release();
};

struct AdmissionResult {
  std::optional<AdmissionTicket> ticket;
  ErrorKind reason; // NONE if admitted
  int64_t retry_after; // ms; for RATE_LIMITED
};

class AdmissionController {
  struct Waiter {
    std::string request_id;
    bool granted, cancelled;
  };

  RateLimiter& limiter_;
  const int capacity_;
  const size_t queue_capacity_;
  const size_t max_source_;

  std::mutex mtx_;
  std::condition_variable idle_cv_;
  int free_slots_;
  bool shutdown_;
  std::deque<Waiter*> queue_;
  std::condition_variable queue_cv_;

  void ReleaseSlot_(const std::string& request_id);
  friend class AdmissionTicket;
 public:
  AdmissionController(RateLimiter& limiter, int capacity, size_t queue_capacity, size_t max_source);
  AdmissionController(const AdmissionController&) = delete;

  // Blocks while the request waits in the queue.
  // Rejections: TOO_LARGE, RATE_LIMITED, OVERLOADED, or CANCELLED after Shutdown().
  AdmissionResult Admit(const ExecutionRequest&);

  // Give back the rate limit reservation of an admitted request that did not run to completion.
  void Refund(const std::string& requestor_id);

  // Reject new requests and cancel queued ones; running tickets are unaffected.
  void Shutdown();
  // Wait until every ticket is released
  void WaitIdle();

  int Capacity() const { return capacity_; }
  int ActiveSlots();
  size_t QueueSize();
};

#endif  // INCLUDE_CODIE_ADMISSION_H_
