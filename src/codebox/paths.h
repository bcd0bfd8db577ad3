#ifndef CODEBOX_PATHS_H_
#define CODEBOX_PATHS_H_

#include <codebox/paths.h>

#include <mutex>
#include <memory>
#include <unordered_map>

extern const char kEnvRelative[];
extern const char kScriptName[];

// inside an environment
fs::path EnvBinPath(const fs::path& env);
fs::path EnvInterpreter(const fs::path& env);
fs::path EnvInstaller(const fs::path& env);

// One mutex per sandbox id, alive as long as anyone holds it
class SandboxLock {
  std::mutex global_lock_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> mutex_map_;
 public:
  std::shared_ptr<std::mutex> operator[](const std::string& id);
};
extern SandboxLock sandbox_lock;

#endif  // CODEBOX_PATHS_H_
