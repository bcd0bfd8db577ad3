#ifndef INCLUDE_CODEBOX_SESSION_H_
#define INCLUDE_CODEBOX_SESSION_H_

#include <mutex>
#include <memory>
#include <optional>
#include <unordered_map>

#include "sandbox.h"

// Maps a session key to exactly one sandbox id
class SessionBinder {
  std::mutex mtx_;
  fs::path store_root_;
  std::unordered_map<std::string, std::string> sandbox_ids_; // session -> sandbox id

  bool IsBound(const std::string& session, const std::string& id);
 public:
  explicit SessionBinder(const fs::path& store_root = kStoreRoot) : store_root_(store_root) {}

  // Resume the sandbox of the session, or create one and remember it.
  // Throws SandboxError if a sandbox cannot be prepared; nothing is remembered then.
  std::unique_ptr<Sandbox> Bind(const std::string& session);
  // Clean up the sandbox of the session and forget it; false if none was bound
  bool End(const std::string& session);

  std::optional<std::string> SandboxId(const std::string& session);
  size_t Size();
};

#endif  // INCLUDE_CODEBOX_SESSION_H_
