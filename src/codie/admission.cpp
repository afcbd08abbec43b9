#include <codie/admission.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <codie/utils.h>

AdmissionTicket::AdmissionTicket(AdmissionTicket&& x) noexcept :
    controller_(x.controller_), request_id_(std::move(x.request_id_)) {
  x.controller_ = nullptr;
}

AdmissionTicket& AdmissionTicket::operator=(AdmissionTicket&& x) noexcept {
  if (this != &x) {
    Release();
    controller_ = x.controller_;
    request_id_ = std::move(x.request_id_);
    x.controller_ = nullptr;
  }
  return *this;
}

void AdmissionTicket::Release() {
  if (!controller_) return;
  controller_->ReleaseSlot_(request_id_);
  controller_ = nullptr;
}

AdmissionController::AdmissionController(
    RateLimiter& limiter, int capacity, size_t queue_capacity, size_t max_source) :
    limiter_(limiter),
    capacity_(std::max(1, capacity)),
    queue_capacity_(queue_capacity),
    max_source_(max_source),
    free_slots_(capacity_),
    shutdown_(false) {}

AdmissionResult AdmissionController::Admit(const ExecutionRequest& req) {
  // cheapest checks first; nothing below touches the runtime
  if (req.code.size() > max_source_) {
    spdlog::info("Request rejected: id={} requestor={} reason=TOO_LARGE size={}",
                 req.request_id, req.requestor_id, req.code.size());
    return {std::nullopt, ErrorKind::TOO_LARGE, 0};
  }
  {
    std::lock_guard lck(mtx_);
    if (shutdown_) return {std::nullopt, ErrorKind::CANCELLED, 0};
  }
  RateLimitDecision decision = limiter_.CheckAndReserve(req.requestor_id);
  if (!decision.allowed) {
    spdlog::info("Request rejected: id={} requestor={} reason=RATE_LIMITED retry_after={}",
                 req.request_id, req.requestor_id, decision.retry_after);
    return {std::nullopt, ErrorKind::RATE_LIMITED, decision.retry_after};
  }

  std::unique_lock lck(mtx_);
  if (shutdown_) {
    lck.unlock();
    Refund(req.requestor_id);
    return {std::nullopt, ErrorKind::CANCELLED, 0};
  }
  if (free_slots_ > 0 && queue_.empty()) {
    free_slots_--;
    spdlog::info("Request admitted: id={} requestor={} active={}",
                 req.request_id, req.requestor_id, capacity_ - free_slots_);
    return {AdmissionTicket(this, req.request_id), ErrorKind::NONE, 0};
  }
  if (queue_.size() >= queue_capacity_) {
    size_t queued = queue_.size();
    lck.unlock();
    spdlog::info("Request rejected: id={} requestor={} reason=OVERLOADED queued={}",
                 req.request_id, req.requestor_id, queued);
    Refund(req.requestor_id);
    return {std::nullopt, ErrorKind::OVERLOADED, 0};
  }
  Waiter waiter{req.request_id, false, false};
  queue_.push_back(&waiter);
  spdlog::info("Request queued: id={} requestor={} position={}",
               req.request_id, req.requestor_id, queue_.size());
  queue_cv_.wait(lck, [&waiter]{ return waiter.granted || waiter.cancelled; });
  if (waiter.granted) {
    // the releasing ticket handed its slot over; free_slots_ is unchanged
    spdlog::info("Request dequeued: id={} requestor={}", req.request_id, req.requestor_id);
    return {AdmissionTicket(this, req.request_id), ErrorKind::NONE, 0};
  }
  lck.unlock();
  spdlog::info("Request rejected: id={} requestor={} reason=CANCELLED", req.request_id, req.requestor_id);
  Refund(req.requestor_id);
  return {std::nullopt, ErrorKind::CANCELLED, 0};
}

void AdmissionController::ReleaseSlot_(const std::string& request_id) {
  {
    std::lock_guard lck(mtx_);
    if (!queue_.empty()) {
      Waiter* next = queue_.front();
      queue_.pop_front();
      next->granted = true;
      spdlog::debug("Slot handed over: from={} to={}", request_id, next->request_id);
    } else {
      free_slots_++;
      spdlog::debug("Slot released: id={} active={}", request_id, capacity_ - free_slots_);
    }
  }
  queue_cv_.notify_all();
  idle_cv_.notify_all();
}

void AdmissionController::Refund(const std::string& requestor_id) {
  limiter_.Release(requestor_id);
}

void AdmissionController::Shutdown() {
  {
    std::lock_guard lck(mtx_);
    shutdown_ = true;
    for (Waiter* waiter : queue_) waiter->cancelled = true;
    queue_.clear();
  }
  queue_cv_.notify_all();
}

void AdmissionController::WaitIdle() {
  std::unique_lock lck(mtx_);
  idle_cv_.wait(lck, [this]{ return free_slots_ == capacity_ && queue_.empty(); });
}

int AdmissionController::ActiveSlots() {
  std::lock_guard lck(mtx_);
  return capacity_ - free_slots_;
}

size_t AdmissionController::QueueSize() {
  std::lock_guard lck(mtx_);
  return queue_.size();
}
