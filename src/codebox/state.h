#ifndef CODEBOX_STATE_H_
#define CODEBOX_STATE_H_

#include <atomic>

#include <codebox/sandbox.h>

// Marks a sandbox EXECUTING for the lifetime of the guard, READY afterwards
class ExecutingGuard {
  std::atomic<SandboxState>& state_;
 public:
  explicit ExecutingGuard(std::atomic<SandboxState>& state) : state_(state) {
    state_ = SandboxState::EXECUTING;
  }
  ~ExecutingGuard() { state_ = SandboxState::READY; }
  ExecutingGuard(const ExecutingGuard&) = delete;
  ExecutingGuard& operator=(const ExecutingGuard&) = delete;
};

#endif  // CODEBOX_STATE_H_
