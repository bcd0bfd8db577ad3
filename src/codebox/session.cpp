#include <codebox/session.h>

#include <spdlog/spdlog.h>
#include <codebox/utils.h>

bool SessionBinder::IsBound(const std::string& session, const std::string& id) {
  std::lock_guard lck(mtx_);
  auto it = sandbox_ids_.find(session);
  return it != sandbox_ids_.end() && it->second == id;
}

std::unique_ptr<Sandbox> SessionBinder::Bind(const std::string& session) {
  while (true) {
    std::string id;
    bool is_new = false;
    {
      std::lock_guard lck(mtx_);
      auto it = sandbox_ids_.find(session);
      if (it == sandbox_ids_.end()) {
        // reserve the id first; a concurrent Bind of the same session then
        // resumes it and waits on the sandbox lock while it is being built
        it = sandbox_ids_.emplace(session, GenerateSandboxId()).first;
        is_new = true;
      }
      id = it->second;
    }
    std::unique_ptr<Sandbox> ret;
    try {
      ret = std::make_unique<Sandbox>(id, store_root_);
    } catch (SandboxError&) {
      std::lock_guard lck(mtx_);
      if (auto it = sandbox_ids_.find(session); it != sandbox_ids_.end() && it->second == id) {
        sandbox_ids_.erase(it);
      }
      throw;
    }
    if (IsBound(session, id)) {
      if (is_new) spdlog::info("Session {} bound to sandbox {}", session, id);
      return ret;
    }
    // the session ended while the sandbox was being opened; End() may
    // already have removed it, so whatever was rebuilt goes too
    spdlog::info("Session {} ended while binding sandbox {}; retrying", session, id);
    ret->Cleanup();
  }
}

bool SessionBinder::End(const std::string& session) {
  std::string id;
  {
    std::lock_guard lck(mtx_);
    auto it = sandbox_ids_.find(session);
    if (it == sandbox_ids_.end()) return false;
    id = std::move(it->second);
    sandbox_ids_.erase(it);
  }
  try {
    // resume without rebuilding a missing environment
    Sandbox(id, store_root_, false).Cleanup();
  } catch (SandboxError& e) {
    spdlog::warn("Failed to clean up sandbox {} of session {}: {}", id, session, e.what());
  }
  spdlog::info("Session {} ended, sandbox {} removed", session, id);
  return true;
}

std::optional<std::string> SessionBinder::SandboxId(const std::string& session) {
  std::lock_guard lck(mtx_);
  auto it = sandbox_ids_.find(session);
  if (it == sandbox_ids_.end()) return std::nullopt;
  return it->second;
}

size_t SessionBinder::Size() {
  std::lock_guard lck(mtx_);
  return sandbox_ids_.size();
}
