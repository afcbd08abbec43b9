#ifndef INCLUDE_CODIE_ORCHESTRATOR_H_
#define INCLUDE_CODIE_ORCHESTRATOR_H_

#include <atomic>

#include "sandbox.h"
#include "profiles.h"
#include "admission.h"
#include "execution.h"

class Orchestrator {
  const ProfileRegistry& profiles_;
  AdmissionController& admission_;
  SandboxManager& sandbox_;
  std::atomic_bool stopped_;
 public:
  Orchestrator(const ProfileRegistry& profiles, AdmissionController& admission, SandboxManager& sandbox) :
      profiles_(profiles), admission_(admission), sandbox_(sandbox), stopped_(false) {}

  // Called from any thread; blocks until the request is rejected or its session is torn down
  ExecutionResult Submit(const ExecutionRequest&);

  // Stop admitting, cancel queued and running requests, and wait for every environment to be
  //  torn down. Idempotent.
  void Shutdown();
  bool Stopped() const { return stopped_; }

  const ProfileRegistry& Profiles() const { return profiles_; }
  AdmissionController& Admission() { return admission_; }
};

#endif  // INCLUDE_CODIE_ORCHESTRATOR_H_
