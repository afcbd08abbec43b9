#include <codie/orchestrator.h>

#include <spdlog/spdlog.h>
#include <codie/utils.h>

ExecutionResult Orchestrator::Submit(const ExecutionRequest& req) {
  spdlog::debug("Request received: id={} requestor={} language={} size={}",
                req.request_id, req.requestor_id, req.language, req.code.size());
  AdmissionResult admission = admission_.Admit(req);
  if (!admission.ticket) {
    ExecutionResult result;
    result.request_id = req.request_id;
    result.error = admission.reason;
    result.retry_after = admission.retry_after;
    return result;
  }
  // the slot goes back when the ticket leaves this scope, after the environment is gone
  AdmissionTicket ticket = std::move(*admission.ticket);
  ExecutionResult result = sandbox_.Run(ticket, req, profiles_.Find(req.language));
  if (result.status == SessionStatus::CANCELLED) {
    // an aborted run does not count against the requestor
    admission_.Refund(req.requestor_id);
  }
  return result;
}

void Orchestrator::Shutdown() {
  if (stopped_.exchange(true)) return;
  spdlog::info("Shutting down: active={} queued={}", admission_.ActiveSlots(), admission_.QueueSize());
  admission_.Shutdown();
  sandbox_.CancelAll();
  admission_.WaitIdle();
  spdlog::info("All sessions torn down");
}
