#include "paths.h"

fs::path kStoreRoot = "/tmp/codebox_sandbox";

const char kEnvRelative[] = "venv";
const char kScriptName[] = "script.py";

fs::path SandboxRootPath(const fs::path& store_root, const std::string& id) {
  return store_root / id;
}
fs::path SandboxEnvPath(const fs::path& root) {
  return root / kEnvRelative;
}
fs::path SandboxScriptPath(const fs::path& root) {
  return root / kScriptName;
}

fs::path EnvBinPath(const fs::path& env) {
  return env / "bin";
}
fs::path EnvInterpreter(const fs::path& env) {
  return EnvBinPath(env) / "python";
}
fs::path EnvInstaller(const fs::path& env) {
  return EnvBinPath(env) / "pip";
}

std::shared_ptr<std::mutex> SandboxLock::operator[](const std::string& id) {
  std::lock_guard lck(global_lock_);
  for (auto it = mutex_map_.begin(); it != mutex_map_.end();) {
    if (it->second.expired()) {
      it = mutex_map_.erase(it);
    } else {
      ++it;
    }
  }
  auto& entry = mutex_map_[id];
  std::shared_ptr<std::mutex> ret = entry.lock();
  if (!ret) {
    ret = std::make_shared<std::mutex>();
    entry = ret;
  }
  return ret;
}
SandboxLock sandbox_lock;
